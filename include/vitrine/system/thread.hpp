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
 * @brief Common multithreading functions.
 */

#pragma once
#include "vitrine/thread-pool.hpp"
#include "ecsm.hpp"

namespace vitrine
{

using namespace ecsm;

/**
 * @brief Frame worker thread pool holder.
 * 
 * @details
 * The foreground pool runs per-frame parallel jobs: translucent draw submissions of the write pass and pixel rows 
 * of the composite pass. Its @ref ThreadPool::wait() is the flush point between the two passes.
 */
class ThreadSystem final : public System, public Singleton<ThreadSystem>
{
	ThreadPool foregroundPool;

	/**
	 * @brief Creates a new thread system instance.
	 * 
	 * @param threadCount foreground pool thread count (UINT32_MAX = logical CPU count)
	 * @param setSingleton set system singleton instance
	 */
	ThreadSystem(uint32 threadCount = UINT32_MAX, bool setSingleton = true);
	/**
	 * @brief Destroys thread system instance.
	 */
	~ThreadSystem() final;

	void preInit();
	void preDeinit();

	friend class ecsm::Manager;
public:
	/**
	 * @brief Returns foreground thread pool instance.
	 * @details Use it to parallel jobs during the current frame.
	 */
	ThreadPool& getForegroundPool() noexcept { return foregroundPool; }
};

} // namespace vitrine
