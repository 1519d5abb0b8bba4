// Copyright 2022-2026 Nikita Fediuchin. All rights reserved.
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#include "vitrine/system/log.hpp"
#include "mpio/os.hpp"
#include "mpmt/thread.hpp"

#include <chrono>
#include <ctime>

using namespace vitrine;

static string getCurrentDate()
{
	auto currentTime = chrono::system_clock::to_time_t(chrono::system_clock::now());
	auto timeString = string(std::ctime(&currentTime));
	if (!timeString.empty())
		timeString.resize(timeString.size() - 1);
	return timeString;
}

//**********************************************************************************************************************
LogSystem::LogSystem(const fs::path& directoryPath, LogLevel level, double rotationTime, bool setSingleton) : 
	Singleton(setSingleton)
{
	mpmt::Thread::setName("MAIN");

	try
	{
		this->logger = logy::Logger(directoryPath, level, (bool)VITRINE_DEBUG, rotationTime);
	}
	catch (const exception& e)
	{
		auto tmpPath = fs::temp_directory_path() / directoryPath.filename();
		this->logger = logy::Logger(tmpPath, level, (bool)VITRINE_DEBUG, rotationTime);
		warn("Failed to open log directory, using temporary one. (error: " + string(e.what()) + ")");
	}

	info("Started logging system. (UTC+0)");
	info("Current date: " + getCurrentDate());
	info(VITRINE_NAME_STRING " [v" VITRINE_VERSION_STRING "]");

	#if VITRINE_DEBUG
	info("Build: Debug");
	#else
	info("Build: Release");
	#endif

	info("Target OS: " VITRINE_OS_NAME);
	info("CPU: " + string(mpio::OS::getCpuName()));
	info("Logical core count: " + to_string(mpio::OS::getLogicalCpuCount()));
	info("Physical core count: " + to_string(mpio::OS::getPhysicalCpuCount()));
	info("OIT max fragments per pixel: " + to_string(VITRINE_OIT_MAX_FRAGMENTS));
}
LogSystem::~LogSystem()
{
	logger.log(INFO_LOG_LEVEL, "Stopped logging system.");
	unsetSingleton();
}

void LogSystem::log(LogLevel level, string_view message) noexcept
{
	logger.log(level, "%.*s", (int)message.length(), message.data());
}
