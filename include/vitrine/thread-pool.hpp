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
 * @brief Frame worker thread pool functions.
 */

#pragma once
#include "vitrine/defines.hpp"

#include <deque>
#include <mutex>
#include <thread>
#include <vector>
#include <functional>
#include <condition_variable>

namespace vitrine
{

/***********************************************************************************************************************
 * @brief Frame job executor.
 * 
 * @details
 * Pre-creates a fixed number of worker threads and feeds them from a single FIFO job queue. Render passes use it to 
 * split per-pixel or per-draw work across the CPU cores and then block on @ref wait() as the pass barrier. 
 * Everything a task did before @ref wait() returns is visible to the waiting thread.
 */
class ThreadPool final
{
public:
	/*******************************************************************************************************************
	 * @brief Unit of work executed by one of the pool threads.
	 */
	class Task final
	{
	public:
		using Function = std::function<void(const Task& task)>;
	private:
		Function function = {};
		uint32 taskIndex = 0;
		uint32 itemOffset = 0;
		uint32 itemCount = 0;

		Task(const Function& function) : function(function) { }
		friend class ThreadPool;
	public:
		/**
		 * @brief Creates a new empty task.
		 */
		Task() = default;

		/**
		 * @brief Returns task index inside the submitted batch.
		 */
		uint32 getTaskIndex() const noexcept { return taskIndex; }
		/**
		 * @brief Returns first item index of this task range. (@ref addItems)
		 */
		uint32 getItemOffset() const noexcept { return itemOffset; }
		/**
		 * @brief Returns end (exclusive) item index of this task range. (@ref addItems)
		 */
		uint32 getItemCount() const noexcept { return itemCount; }
	};
private:
	string name;
	std::mutex mutex = {};
	condition_variable workCond = {};
	condition_variable idleCond = {};
	vector<thread> threads;
	deque<Task> taskQueue;
	uint32 workingCount = 0;
	bool isRunning = false;

	void threadFunction(uint32 index);
public:
	/*******************************************************************************************************************
	 * @brief Creates a new frame thread pool.
	 * 
	 * @param[in] name pool thread name prefix
	 * @param threadCount target pool thread count (UINT32_MAX = hardware concurrency)
	 */
	ThreadPool(const string& name = "", uint32 threadCount = UINT32_MAX);
	/**
	 * @brief Stops and joins all pool threads. (Blocking)
	 * @warning Pending queue tasks are dropped!
	 */
	~ThreadPool();

	ThreadPool(ThreadPool&&) = delete;
	ThreadPool(const ThreadPool&) = delete;
	ThreadPool& operator=(const ThreadPool&) = delete;

	/**
	 * @brief Returns pool thread name prefix. (MT-Safe)
	 */
	const string& getName() const noexcept { return name; }
	/**
	 * @brief Returns thread count in the pool. (MT-Safe)
	 */
	uint32 getThreadCount() const noexcept { return (uint32)threads.size(); }

	/**
	 * @brief Adds the same task function count times to the queue. (MT-Safe)
	 * @details Each instance receives its own @ref Task::getTaskIndex().
	 * @warning Tasks run concurrently, synchronize shared data yourself!
	 * 
	 * @param[in] function target task function
	 * @param count task instance count
	 */
	void addTasks(const Task::Function& function, uint32 count);
	/**
	 * @brief Splits an item range across the pool threads. (MT-Safe)
	 * 
	 * @details
	 * Creates at most one task per pool thread, each covering a contiguous 
	 * [getItemOffset(), getItemCount()) slice of the [0, count) item range.
	 * 
	 * @param[in] function target task function
	 * @param count total item count
	 */
	void addItems(const Task::Function& function, uint32 count);

	/**
	 * @brief Waits until the queue is empty and no task is running. (Blocking)
	 */
	void wait();
	/**
	 * @brief Stops task execution and joins all pool threads.
	 */
	void stop();
};

} // namespace vitrine
