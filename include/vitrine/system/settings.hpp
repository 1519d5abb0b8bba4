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
 * @brief Settings storage functions.
 */

#pragma once
#include "vitrine/defines.hpp"
#include "ecsm.hpp"
#include "tsl/robin_map.hpp"

namespace vitrine
{

using namespace ecsm;

/**
 * @brief Application settings holder.
 * 
 * @details
 * Loads key/value settings file on PreInit and stores it back on PostDeinit. A getter returns the loaded value 
 * or registers the passed default, so every setting read once during the run also ends up in the stored file.
 */
class SettingsSystem final : public System, public Singleton<SettingsSystem>
{
	enum class Type : uint8
	{
		Int, Float, Bool, Count
	};

	struct Item final
	{
		union
		{
			int64 intValue;
			double floatValue;
			bool boolValue;
		};
		Type type = {};

		Item(int64 value) noexcept : intValue(value), type(Type::Int) { }
		Item(double value) noexcept : floatValue(value), type(Type::Float) { }
		Item(bool value) noexcept : boolValue(value), type(Type::Bool) { }
	};

	fs::path filePath;
	void* confReader = nullptr;
	tsl::robin_map<string, Item> items;

	/**
	 * @brief Creates a new settings system instance.
	 * 
	 * @param[in] filePath settings file path
	 * @param setSingleton set system singleton instance
	 */
	SettingsSystem(const fs::path& filePath = "settings.txt", bool setSingleton = true);
	/**
	 * @brief Destroys settings system instance.
	 */
	~SettingsSystem() final;

	void preInit();
	void postDeinit();
	
	friend class ecsm::Manager;
public:
	/**
	 * @brief Returns settings file path.
	 */
	const fs::path& getFilePath() const noexcept { return filePath; }

	/**
	 * @brief Returns settings integer value. (int64)
	 * @param[in] name target setting name
	 * @param[in,out] value default value, replaced with the stored one if exists
	 */
	void getInt(const string& name, int64& value);
	/**
	 * @brief Returns settings floating value. (double)
	 * @param[in] name target setting name
	 * @param[in,out] value default value, replaced with the stored one if exists
	 */
	void getFloat(const string& name, double& value);
	/**
	 * @brief Returns settings boolean value.
	 * @param[in] name target setting name
	 * @param[in,out] value default value, replaced with the stored one if exists
	 */
	void getBool(const string& name, bool& value);

	void getInt(const string& name, uint32& value)
	{
		auto intValue = (int64)value;
		getInt(name, intValue);
		value = (uint32)intValue;
	}
	void getFloat(const string& name, float& value)
	{
		auto floatValue = (double)value;
		getFloat(name, floatValue);
		value = (float)floatValue;
	}

	/**
	 * @brief Sets settings integer value. (int64)
	 * @param[in] name target setting name
	 * @param value setting value
	 */
	void setInt(const string& name, int64 value);
	/**
	 * @brief Sets settings floating value. (double)
	 * @param[in] name target setting name
	 * @param value setting value
	 */
	void setFloat(const string& name, double value);
	/**
	 * @brief Sets settings boolean value.
	 * @param[in] name target setting name
	 * @param value setting value
	 */
	void setBool(const string& name, bool value);
};

} // namespace vitrine
