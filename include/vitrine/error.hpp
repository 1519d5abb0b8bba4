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
 * @brief Common library error (exception) functions.
 */

#pragma once
#include <string>
#include <stdexcept>

namespace vitrine
{

/**
 * @brief Vitrine library error (exception) class.
 * 
 * @details
 * Thrown only for errors the caller can act on: invalid configuration, unknown names while parsing or an attempt 
 * to enable a feature the device does not support. Lossy per-frame conditions (full node pool, per-pixel fragment 
 * cap, unknown packed blend enumerants) are never reported with an exception.
 */
class VitrineError : public std::runtime_error
{
public:
	/**
	 * @brief Creates a new Vitrine error (exception) instance.
	 * @param[in] message target error message
	 */
	explicit VitrineError(const std::string& message) : std::runtime_error(message.c_str()) { }
};

} // namespace vitrine
