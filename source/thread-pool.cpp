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

#include "vitrine/thread-pool.hpp"
#include "vitrine/profiler.hpp"

#include "mpmt/thread.hpp"
#include <cmath>

using namespace vitrine;

//**********************************************************************************************************************
void ThreadPool::threadFunction(uint32 index)
{
	auto threadName = name + "#" + to_string(index);
	mpmt::Thread::setName(threadName.c_str());
	mpmt::Thread::setForegroundPriority();

	while (true)
	{
		unique_lock locker(mutex);
		workCond.wait(locker, [this]()
		{
			return !taskQueue.empty() || !isRunning;
		});

		if (!isRunning)
			return;

		auto task = std::move(taskQueue.front());
		taskQueue.pop_front();
		workingCount++;
		locker.unlock();

		task.function(task);

		locker.lock();
		workingCount--;
		if (taskQueue.empty() && workingCount == 0)
			idleCond.notify_all();
	}
}

//**********************************************************************************************************************
ThreadPool::ThreadPool(const string& name, uint32 threadCount) : name(name), isRunning(true)
{
	if (threadCount == UINT32_MAX)
		threadCount = std::max(thread::hardware_concurrency(), 1u);
	VITRINE_ASSERT(threadCount > 0);

	threads.resize(threadCount);
	for (uint32 i = 0; i < threadCount; i++)
		threads[i] = thread(&ThreadPool::threadFunction, this, i);
}
ThreadPool::~ThreadPool()
{
	stop();
}

//**********************************************************************************************************************
void ThreadPool::addTasks(const Task::Function& function, uint32 count)
{
	VITRINE_ASSERT(function);
	VITRINE_ASSERT(count != 0);
	VITRINE_ASSERT(isRunning);

	auto task = Task(function);
	mutex.lock();
	for (uint32 i = 0; i < count; i++)
	{
		task.taskIndex = i;
		taskQueue.push_back(task);
	}
	mutex.unlock();

	if (count > 1)
		workCond.notify_all();
	else
		workCond.notify_one();
}
void ThreadPool::addItems(const Task::Function& function, uint32 count)
{
	VITRINE_ASSERT(function);
	VITRINE_ASSERT(count != 0);
	VITRINE_ASSERT(isRunning);

	auto task = Task(function);
	auto taskCount = std::min(count, (uint32)threads.size());
	auto countPerTask = (uint32)std::ceil((float)count / (float)taskCount);

	mutex.lock();
	for (uint32 i = 0; i < taskCount; i++)
	{
		task.itemOffset = countPerTask * i;
		task.itemCount = std::min(count, task.itemOffset + countPerTask);
		if (task.itemOffset >= task.itemCount)
			break;

		task.taskIndex = i;
		taskQueue.push_back(task);
	}
	mutex.unlock();

	if (taskCount > 1)
		workCond.notify_all();
	else
		workCond.notify_one();
}

//**********************************************************************************************************************
void ThreadPool::wait()
{
	VITRINE_CPU_ZONE_SCOPED("Thread Pool Wait");
	VITRINE_ASSERT(isRunning);

	unique_lock locker(mutex);
	idleCond.wait(locker, [this]()
	{
		return taskQueue.empty() && workingCount == 0;
	});
}
void ThreadPool::stop()
{
	mutex.lock();
	auto shouldJoin = isRunning;
	isRunning = false;
	taskQueue.clear();
	mutex.unlock();

	if (shouldJoin)
	{
		workCond.notify_all();
		for (auto& thread : threads)
			thread.join();
	}
}
