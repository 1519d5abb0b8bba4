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

/***********************************************************************************************************************
 * @file
 * @brief Common message logging functions.
 */

#pragma once
#include "vitrine/defines.hpp"
#include "ecsm.hpp"
#include "logy/logger.hpp"

namespace vitrine
{

using namespace ecsm;

#ifndef VITRINE_LOG_LEVEL
#if VITRINE_DEBUG
#define VITRINE_LOG_LEVEL ALL_LOG_LEVEL
#else
#define VITRINE_LOG_LEVEL INFO_LOG_LEVEL
#endif
#endif

#if VITRINE_LOG_LEVEL >= TRACE_LOG_LEVEL
#define VITRINE_LOG_TRACE(message) LogSystem::tryTrace(message)
#else
#define VITRINE_LOG_TRACE(message) (void)0
#endif

#if VITRINE_LOG_LEVEL >= DEBUG_LOG_LEVEL
#define VITRINE_LOG_DEBUG(message) LogSystem::tryDebug(message)
#else
#define VITRINE_LOG_DEBUG(message) (void)0
#endif

#if VITRINE_LOG_LEVEL >= INFO_LOG_LEVEL
/**
 * @brief Writes information message to the log if system exist. (MT-Safe)
 * @param[in] message target logging message
 */
#define VITRINE_LOG_INFO(message) LogSystem::tryInfo(message)
#else
#define VITRINE_LOG_INFO(message) (void)0
#endif

#if VITRINE_LOG_LEVEL >= WARN_LOG_LEVEL
/**
 * @brief Writes warning message to the log if system exist. (MT-Safe)
 * @param[in] message target logging message
 */
#define VITRINE_LOG_WARN(message) LogSystem::tryWarn(message)
#else
#define VITRINE_LOG_WARN(message) (void)0
#endif

#if VITRINE_LOG_LEVEL >= ERROR_LOG_LEVEL
/**
 * @brief Writes error message to the log if system exist. (MT-Safe)
 * @param[in] message target logging message
 */
#define VITRINE_LOG_ERROR(message) LogSystem::tryError(message)
#else
#define VITRINE_LOG_ERROR(message) (void)0
#endif

#if VITRINE_LOG_LEVEL >= FATAL_LOG_LEVEL
#define VITRINE_LOG_FATAL(message) LogSystem::tryFatal(message)
#else
#define VITRINE_LOG_FATAL(message) (void)0
#endif

/***********************************************************************************************************************
 * @brief Message logging system.
 * 
 * @details
 * Writes compositor events (device capability, node pool allocations, dropped fragments) to a rotating log file 
 * and, in debug builds, to the stdout. Library code logs through the VITRINE_LOG_* macros, which do nothing when 
 * no log system was created, so the compositor can also be used on its own.
 */
class LogSystem final : public System, public Singleton<LogSystem>
{
	logy::Logger logger;

	/**
	 * @brief Creates a new logging system instance.
	 * 
	 * @param[in] directoryPath log file directory path
	 * @param level message logging level (log if <= level)
	 * @param rotationTime delay between log file rotation (0.0 = disabled)
	 * @param setSingleton set system singleton instance
	 */
	LogSystem(const fs::path& directoryPath = VITRINE_NAME_STRING, LogLevel level = ALL_LOG_LEVEL, 
		double rotationTime = 0.0, bool setSingleton = true);
	/**
	 * @brief Destroys logging system instance.
	 */
	~LogSystem() final;
	
	friend class ecsm::Manager;
public:
	/**
	 * @brief Writes message to the log. (MT-Safe)
	 * 
	 * @param level logging level
	 * @param message target logging message
	 */
	void log(LogLevel level, string_view message) noexcept;

	void trace(string_view message) noexcept { log(TRACE_LOG_LEVEL, message); }
	void debug(string_view message) noexcept { log(DEBUG_LOG_LEVEL, message); }
	void info(string_view message) noexcept { log(INFO_LOG_LEVEL, message); }
	void warn(string_view message) noexcept { log(WARN_LOG_LEVEL, message); }
	void error(string_view message) noexcept { log(ERROR_LOG_LEVEL, message); }
	void fatal(string_view message) noexcept { log(FATAL_LOG_LEVEL, message); }

	/**
	 * @brief Returns current logger logging level. (MT-Safe)
	 * @details All messages above the current logging level are skipped.
	 */
	LogLevel getLevel() const noexcept { return logger.getLevel(); }
	/**
	 * @brief Sets current logger logging level. (MT-Safe)
	 * @details All messages above the current logging level are skipped.
	 */
	void setLevel(LogLevel level) noexcept { logger.setLevel(level); }
	/**
	 * @brief Returns internal Logy logger instance. (MT-Safe)
	 */
	const logy::Logger& getInternal() const noexcept { return logger; }

	/*******************************************************************************************************************
	 * @brief Writes message to the log if system exist. (MT-Safe)
	 * 
	 * @param level logging level
	 * @param message target logging message
	 */
	static void tryLog(LogLevel level, string_view message) noexcept
	{
		auto logSystem = LogSystem::Instance::tryGet();
		if (logSystem)
			logSystem->log(level, message);
	}

	static void tryTrace(string_view message) noexcept { tryLog(TRACE_LOG_LEVEL, message); }
	static void tryDebug(string_view message) noexcept { tryLog(DEBUG_LOG_LEVEL, message); }
	static void tryInfo(string_view message) noexcept { tryLog(INFO_LOG_LEVEL, message); }
	static void tryWarn(string_view message) noexcept { tryLog(WARN_LOG_LEVEL, message); }
	static void tryError(string_view message) noexcept { tryLog(ERROR_LOG_LEVEL, message); }
	static void tryFatal(string_view message) noexcept { tryLog(FATAL_LOG_LEVEL, message); }
};

} // namespace vitrine
