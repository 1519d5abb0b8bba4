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
 * @brief Application entry point functions.
 */

#pragma once
#include "vitrine/defines.hpp"
#include <iostream>

/**
 * @brief Application main function signature.
 */
#define VITRINE_MAIN int main(int argc, char *argv[])

#if VITRINE_DEBUG
/**
 * @brief Declares application main function which calls the entry point.
 * @details Exceptions are not caught in debug builds, so the debugger stops where they are thrown.
 * @param entryPoint target entry point function
 */
#define VITRINE_DECLARE_MAIN(entryPoint) \
VITRINE_MAIN                             \
{                                        \
	entryPoint();                        \
	return EXIT_SUCCESS;                 \
}
#else
/**
 * @brief Declares application main function which calls the entry point.
 * @param entryPoint target entry point function
 */
#define VITRINE_DECLARE_MAIN(entryPoint)       \
VITRINE_MAIN                                   \
{                                              \
	try                                        \
	{                                          \
		entryPoint();                          \
	}                                          \
	catch (const std::exception& e)            \
	{                                          \
		std::cerr << e.what() << std::endl;    \
		return EXIT_FAILURE;                   \
	}                                          \
	return EXIT_SUCCESS;                       \
}
#endif
