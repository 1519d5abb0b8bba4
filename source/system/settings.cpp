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

#include "vitrine/system/settings.hpp"
#include "vitrine/system/log.hpp"

#include "conf/reader.hpp"
#include "conf/writer.hpp"

using namespace vitrine;

//**********************************************************************************************************************
SettingsSystem::SettingsSystem(const fs::path& filePath, bool setSingleton) : 
	Singleton(setSingleton), filePath(filePath)
{
	ECSM_SUBSCRIBE_TO_EVENT("PreInit", SettingsSystem::preInit);
	ECSM_SUBSCRIBE_TO_EVENT("PostDeinit", SettingsSystem::postDeinit);
}
SettingsSystem::~SettingsSystem()
{
	if (Manager::Instance::get()->isRunning)
	{
		ECSM_UNSUBSCRIBE_FROM_EVENT("PreInit", SettingsSystem::preInit);
		ECSM_UNSUBSCRIBE_FROM_EVENT("PostDeinit", SettingsSystem::postDeinit);
	}

	delete (conf::Reader*)confReader;
	unsetSingleton();
}

//**********************************************************************************************************************
void SettingsSystem::preInit()
{
	try
	{
		confReader = new conf::Reader(filePath);
		VITRINE_LOG_INFO("Loaded settings file. (path: " + filePath.generic_string() + ")");
	}
	catch (const exception& e)
	{
		VITRINE_LOG_WARN("Failed to load settings file, using defaults. (error: " + string(e.what()) + ")");
	}
}
void SettingsSystem::postDeinit()
{
	try
	{
		conf::Writer confWriter(filePath);
		confWriter.writeComment(VITRINE_NAME_STRING " Settings (v" VITRINE_VERSION_STRING ")");
		confWriter.writeNewLine();

		for (const auto& pair : items)
		{
			const auto& item = pair.second;
			switch (item.type)
			{
			case Type::Int: confWriter.write(pair.first, item.intValue); break;
			case Type::Float: confWriter.write(pair.first, item.floatValue); break;
			case Type::Bool: confWriter.write(pair.first, item.boolValue); break;
			default: VITRINE_ASSERT_MSG(false, "Unknown setting type");
			}
		}

		VITRINE_LOG_INFO("Stored settings file.");
	}
	catch (const exception& e)
	{
		VITRINE_LOG_ERROR("Failed to store settings file. (error: " + string(e.what()) + ")");
	}
}

//**********************************************************************************************************************
void SettingsSystem::getInt(const string& name, int64& value)
{
	VITRINE_ASSERT(!name.empty());
	auto searchResult = items.find(name);
	if (searchResult == items.end())
	{
		if (confReader)
			((conf::Reader*)confReader)->get(name, value);
		items.emplace(name, Item(value));
		return;
	}
	VITRINE_ASSERT(searchResult->second.type == Type::Int);
	value = searchResult->second.intValue;
}
void SettingsSystem::getFloat(const string& name, double& value)
{
	VITRINE_ASSERT(!name.empty());
	auto searchResult = items.find(name);
	if (searchResult == items.end())
	{
		if (confReader)
			((conf::Reader*)confReader)->get(name, value);
		items.emplace(name, Item(value));
		return;
	}
	VITRINE_ASSERT(searchResult->second.type == Type::Float);
	value = searchResult->second.floatValue;
}
void SettingsSystem::getBool(const string& name, bool& value)
{
	VITRINE_ASSERT(!name.empty());
	auto searchResult = items.find(name);
	if (searchResult == items.end())
	{
		if (confReader)
			((conf::Reader*)confReader)->get(name, value);
		items.emplace(name, Item(value));
		return;
	}
	VITRINE_ASSERT(searchResult->second.type == Type::Bool);
	value = searchResult->second.boolValue;
}

//**********************************************************************************************************************
void SettingsSystem::setInt(const string& name, int64 value)
{
	VITRINE_ASSERT(!name.empty());
	auto searchResult = items.find(name);
	if (searchResult == items.end())
	{
		items.emplace(name, Item(value));
		return;
	}
	VITRINE_ASSERT(searchResult->second.type == Type::Int);
	searchResult.value().intValue = value;
}
void SettingsSystem::setFloat(const string& name, double value)
{
	VITRINE_ASSERT(!name.empty());
	auto searchResult = items.find(name);
	if (searchResult == items.end())
	{
		items.emplace(name, Item(value));
		return;
	}
	VITRINE_ASSERT(searchResult->second.type == Type::Float);
	searchResult.value().floatValue = value;
}
void SettingsSystem::setBool(const string& name, bool value)
{
	VITRINE_ASSERT(!name.empty());
	auto searchResult = items.find(name);
	if (searchResult == items.end())
	{
		items.emplace(name, Item(value));
		return;
	}
	VITRINE_ASSERT(searchResult->second.type == Type::Bool);
	searchResult.value().boolValue = value;
}
