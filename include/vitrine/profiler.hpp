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
 * @brief CPU profiling zone functions. (Tracy)
 */

#pragma once

#if VITRINE_TRACY_PROFILER
#include "tracy/Tracy.hpp"

/**
 * @brief Marks current scope as a named CPU profiler zone.
 * @param name target zone name string literal
 */
#define VITRINE_CPU_ZONE_SCOPED(name) ZoneScopedN(name)
#else
/**
 * @brief Marks current scope as a named CPU profiler zone.
 * @param name target zone name string literal
 */
#define VITRINE_CPU_ZONE_SCOPED(name) (void)0
#endif
