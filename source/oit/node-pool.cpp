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

#include "vitrine/oit/node-pool.hpp"
#include "vitrine/system/log.hpp"
#include "vitrine/profiler.hpp"

using namespace vitrine;
using namespace vitrine::oit;

//**********************************************************************************************************************
void NodePool::resize(uint2 frameSize)
{
	if (frameSize.x == 0 || frameSize.y == 0)
	{
		throw VitrineError("Invalid OIT node pool frame size. (" +
			to_string(frameSize.x) + "x" + to_string(frameSize.y) + ")");
	}

	auto pixelCount = (uint64)frameSize.x * frameSize.y;
	auto capacity = pixelCount * maxFragments;
	if (capacity >= nullNode)
	{
		throw VitrineError("OIT node pool capacity overflows node index. (" +
			to_string(frameSize.x) + "x" + to_string(frameSize.y) + ")");
	}

	nodes = vector<FragmentNode>((psize)capacity);
	heads = vector<std::atomic<uint32>>((psize)pixelCount);
	counts = vector<std::atomic<uint32>>((psize)pixelCount);
	this->frameSize = frameSize;
	reset();

	VITRINE_LOG_INFO("Allocated OIT node pool. (" + to_string(frameSize.x) + "x" + to_string(frameSize.y) +
		", capacity: " + to_string(capacity) + ", size: " + to_string(capacity * sizeof(FragmentNode)) + "B)");
}
void NodePool::reset() noexcept
{
	VITRINE_CPU_ZONE_SCOPED("OIT Node Pool Reset");

	for (auto& head : heads)
		head.store(nullNode, std::memory_order_relaxed);
	for (auto& count : counts)
		count.store(0, std::memory_order_relaxed);
	cursor.store(0, std::memory_order_relaxed);
	droppedCount.store(0, std::memory_order_release);
}

//**********************************************************************************************************************
uint32 NodePool::allocate() noexcept
{
	auto capacity = (uint32)nodes.size();
	auto index = cursor.load(std::memory_order_relaxed);
	
	do
	{
		if (index >= capacity)
		{
			droppedCount.fetch_add(1, std::memory_order_relaxed);
			return nullNode;
		}
	}
	while (!cursor.compare_exchange_weak(index, index + 1, std::memory_order_relaxed));

	return index;
}
