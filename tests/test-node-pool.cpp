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

#include "vitrine/oit/accumulator.hpp"
#include "vitrine/thread-pool.hpp"

#include <cmath>

using namespace vitrine;
using namespace vitrine::oit;

static const auto alphaBlend = BlendMode();

static uint32 getChainLength(const NodePool& nodePool, uint32 pixelIndex)
{
	uint32 length = 0;
	auto nodeIndex = nodePool.getHead(pixelIndex);
	while (nodeIndex != nullNode)
	{
		if (length > nodePool.getCapacity())
			throw runtime_error("Fragment list is cyclic.");
		nodeIndex = nodePool.getNode(nodeIndex).next;
		length++;
	}
	return length;
}

static void testControlWord()
{
	auto control = FragmentControl::pack(0xABCD, 3, 5, 6);
	if (FragmentControl::getDrawSequence(control) != 0xABCD || FragmentControl::getOperation(control) != 3 ||
		FragmentControl::getSrcFactor(control) != 5 || FragmentControl::getDstFactor(control) != 6)
	{
		throw runtime_error("Bad fragment control word fields.");
	}

	control = FragmentControl::pack(0, 0x1F, 0xFF, 0);
	if (FragmentControl::getOperation(control) != 0xF || FragmentControl::getSrcFactor(control) != 0xF ||
		FragmentControl::getDstFactor(control) != 0 || (control >> 28) != 0)
	{
		throw runtime_error("Fragment control enumerants are not truncated to 4 bits.");
	}
}

static void testColorPacking()
{
	auto color = unpackFragmentColor(packFragmentColor(float4(1.0f, 0.0f, 0.0f, 1.0f)));
	if (color.x != 1.0f || color.y != 0.0f || color.z != 0.0f || color.w != 1.0f)
		throw runtime_error("Bad packed fragment color.");

	color = unpackFragmentColor(packFragmentColor(float4(2.0f, -1.0f, 0.5f, 0.25f)));
	if (color.x != 1.0f || color.y != 0.0f || std::abs(color.z - 0.5f) > 1.0f / 255.0f ||
		std::abs(color.w - 0.25f) > 1.0f / 255.0f)
	{
		throw runtime_error("Fragment color is not saturated.");
	}
}

static void testDrawSequence()
{
	DrawSequence drawSequence;
	if (drawSequence.get() != 0 || drawSequence.next() != 1 || drawSequence.next() != 2 || drawSequence.get() != 2)
		throw runtime_error("Bad draw sequence numbers.");

	drawSequence.reset();
	uint16 sequence = 0;
	for (uint32 i = 0; i < 65535; i++)
		sequence = drawSequence.next();
	if (sequence != 65535 || drawSequence.next() != 0 || drawSequence.next() != 1)
		throw runtime_error("Draw sequence does not wrap after 16 bits.");
}

//**********************************************************************************************************************
static void testResize()
{
	NodePool nodePool(uint2(4, 3));
	if (nodePool.getPixelCount() != 12 || nodePool.getCapacity() != 12 * maxFragments ||
		nodePool.getAllocatedCount() != 0 || nodePool.getDroppedCount() != 0)
	{
		throw runtime_error("Bad node pool size.");
	}
	for (uint32 i = 0; i < nodePool.getPixelCount(); i++)
	{
		if (nodePool.getHead(i) != nullNode || nodePool.getCount(i) != 0)
			throw runtime_error("Node pool heads are not cleared.");
	}
	if (nodePool.getPixelIndex(uint2(3, 2)) != 11 || nodePool.getPixelIndex(uint2(1, 1)) != 5)
		throw runtime_error("Bad row-major pixel index.");

	auto isThrown = false;
	try { nodePool.resize(uint2(0, 8)); }
	catch (const VitrineError&) { isThrown = true; }
	if (!isThrown)
		throw runtime_error("Zero frame size is accepted.");
}

static void testChaining()
{
	NodePool nodePool(uint2(2, 2));
	FragmentAccumulator accumulator(nodePool);
	auto pixelIndex = nodePool.getPixelIndex(uint2(1, 0));

	for (uint32 i = 0; i < 3; i++)
	{
		if (!accumulator.append(uint2(1, 0), 0.1f * (i + 1), float4(1.0f), (uint16)(i + 1), alphaBlend))
			throw runtime_error("Failed to append fragment.");
	}

	auto nodeIndex = nodePool.getHead(pixelIndex);
	for (int32 i = 2; i >= 0; i--)
	{
		if (nodeIndex == nullNode)
			throw runtime_error("Fragment list is too short.");
		const auto& node = nodePool.getNode(nodeIndex);
		if (node.getDrawSequence() != i + 1 || node.getBlendMode() != alphaBlend)
			throw runtime_error("Fragment list is not most recent first.");
		nodeIndex = node.next;
	}
	if (nodeIndex != nullNode)
		throw runtime_error("Fragment list is not terminated.");

	if (nodePool.getCount(pixelIndex) != 3 || nodePool.getAllocatedCount() != 3)
		throw runtime_error("Bad appended fragment count.");
	if (nodePool.getHead(0) != nullNode || nodePool.getCount(0) != 0)
		throw runtime_error("Fragment leaked into another pixel.");

	nodePool.reset();
	if (nodePool.getHead(pixelIndex) != nullNode || nodePool.getCount(pixelIndex) != 0 ||
		nodePool.getAllocatedCount() != 0)
	{
		throw runtime_error("Node pool is not reset.");
	}
}

static void testExhaustion()
{
	NodePool nodePool(uint2(2, 1));
	FragmentAccumulator accumulator(nodePool);
	auto capacity = nodePool.getCapacity();

	for (uint32 i = 0; i < capacity; i++)
	{
		if (!accumulator.append(i % 2, (float)i, float4(0.5f), 1, 1, 5, 6))
			throw runtime_error("Fragment dropped before the pool is exhausted.");
	}

	auto headBefore = nodePool.getHead(0);
	for (uint32 i = 0; i < 5; i++)
	{
		if (accumulator.append(0, 0.0f, float4(1.0f), 2, 1, 5, 6))
			throw runtime_error("Fragment appended to the exhausted pool.");
	}

	if (nodePool.getAllocatedCount() != capacity || nodePool.getDroppedCount() != 5)
		throw runtime_error("Bad exhausted pool counters.");
	if (nodePool.getHead(0) != headBefore || getChainLength(nodePool, 0) != capacity / 2 ||
		getChainLength(nodePool, 1) != capacity / 2)
	{
		throw runtime_error("Exhausted pool corrupted fragment lists.");
	}
}

//**********************************************************************************************************************
static void checkConcurrentLists(const NodePool& nodePool, uint32 pixelCount, uint32 fragmentCount)
{
	vector<uint8> isVisited(fragmentCount);
	uint32 totalLength = 0;

	for (uint32 pixelIndex = 0; pixelIndex < pixelCount; pixelIndex++)
	{
		auto nodeIndex = nodePool.getHead(pixelIndex);
		uint32 length = 0;
		while (nodeIndex != nullNode)
		{
			const auto& node = nodePool.getNode(nodeIndex);
			auto id = (uint32)node.depth;
			if (id >= fragmentCount || id % pixelCount != pixelIndex)
				throw runtime_error("Fragment is chained to a wrong pixel.");
			if (isVisited[id])
				throw runtime_error("Fragment is duplicated.");
			isVisited[id] = 1;
			nodeIndex = node.next;
			length++;
		}

		if (length != nodePool.getCount(pixelIndex))
			throw runtime_error("Pixel list length differs from pixel count.");
		totalLength += length;
	}

	if (totalLength != nodePool.getAllocatedCount())
		throw runtime_error("Fragment is lost.");
}

static void testConcurrentAppend()
{
	constexpr uint32 taskCount = 8, pixelCount = 4;
	NodePool nodePool(uint2(8, 8));
	FragmentAccumulator accumulator(nodePool);
	ThreadPool threadPool("TEST", 4);

	// Exactly fills the pool with fragments of only 4 pixels.
	auto perTaskCount = nodePool.getCapacity() / taskCount;
	threadPool.addTasks([&](const ThreadPool::Task& task)
	{
		for (uint32 i = 0; i < perTaskCount; i++)
		{
			auto id = task.getTaskIndex() * perTaskCount + i;
			accumulator.append(id % pixelCount, (float)id, float4(1.0f), (uint16)id, 1, 5, 6);
		}
	},
	taskCount);
	threadPool.wait();

	if (nodePool.getAllocatedCount() != nodePool.getCapacity() || nodePool.getDroppedCount() != 0)
		throw runtime_error("Bad concurrent append count.");
	checkConcurrentLists(nodePool, pixelCount, perTaskCount * taskCount);

	// Overflows the pool from all threads at once.
	nodePool.reset();
	perTaskCount = nodePool.getCapacity() / taskCount + 100;
	threadPool.addTasks([&](const ThreadPool::Task& task)
	{
		for (uint32 i = 0; i < perTaskCount; i++)
		{
			auto id = task.getTaskIndex() * perTaskCount + i;
			accumulator.append(id % pixelCount, (float)id, float4(1.0f), (uint16)id, 1, 5, 6);
		}
	},
	taskCount);
	threadPool.wait();

	if (nodePool.getAllocatedCount() != nodePool.getCapacity() || nodePool.getDroppedCount() != taskCount * 100)
		throw runtime_error("Bad concurrent overflow count.");
	checkConcurrentLists(nodePool, pixelCount, perTaskCount * taskCount);
}

int main()
{
	testControlWord();
	testColorPacking();
	testDrawSequence();
	testResize();
	testChaining();
	testExhaustion();
	testConcurrentAppend();
}
