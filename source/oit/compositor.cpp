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

#include "vitrine/oit/compositor.hpp"
#include "vitrine/system/log.hpp"
#include "vitrine/profiler.hpp"

using namespace vitrine;
using namespace vitrine::oit;

static constexpr string_view frameStateNames[] =
{
	"Idle", "WritePass", "CompositePass", "Present"
};
static constexpr string_view featureLevelNames[] =
{
	"9_1", "9_2", "9_3", "10_0", "10_1", "11_0", "11_1", "12_0", "12_1", "12_2"
};

static_assert(std::size(frameStateNames) == (psize)FrameState::Count);
static_assert(std::size(featureLevelNames) == (psize)FeatureLevel::Count);

string_view oit::toString(FrameState frameState) noexcept
{
	if (frameState >= FrameState::Count)
		return "Unknown";
	return frameStateNames[(psize)frameState];
}
string_view oit::toString(FeatureLevel featureLevel) noexcept
{
	if (featureLevel >= FeatureLevel::Count)
		return "Unknown";
	return featureLevelNames[(psize)featureLevel];
}

static void checkBufferSize(uint2 bufferSize, uint2 frameSize, const char* bufferName)
{
	if (bufferSize.x != frameSize.x || bufferSize.y != frameSize.y)
	{
		throw VitrineError(string(bufferName) + " size does not match OIT frame size. (" + 
			to_string(bufferSize.x) + "x" + to_string(bufferSize.y) + " != " + 
			to_string(frameSize.x) + "x" + to_string(frameSize.y) + ")");
	}
}

static void atomicMax(std::atomic<uint32>& target, uint32 value) noexcept
{
	auto current = target.load(std::memory_order_relaxed);
	while (current < value && !target.compare_exchange_weak(current, value, std::memory_order_relaxed)) { }
}

//**********************************************************************************************************************
Compositor::Compositor(uint2 frameSize, FeatureLevel featureLevel, DepthConvention depthConvention) : 
	nodePool(frameSize), accumulator(nodePool), sorter(depthConvention), 
	compositeBuffer(frameSize, float4::zero), featureLevel(featureLevel)
{
	capable = isOitSupported(featureLevel);
	enabled = capable;

	if (capable)
	{
		VITRINE_LOG_INFO("OIT is supported. (featureLevel: " + string(toString(featureLevel)) + 
			", maxFragments: " + to_string(maxFragments) + ")");
	}
	else
	{
		VITRINE_LOG_INFO("OIT is not supported, using fallback translucency. (featureLevel: " + 
			string(toString(featureLevel)) + ")");
	}
}

void Compositor::setEnabled(bool isEnabled)
{
	if (enabled == isEnabled)
		return;
	if (isEnabled && !capable)
		throw VitrineError("Device is not OIT-capable.");

	enabled = isEnabled;
	VITRINE_LOG_INFO(isEnabled ? "Enabled OIT." : "Disabled OIT.");
}

void Compositor::resize(uint2 frameSize)
{
	if (state != FrameState::Idle)
		throw VitrineError("OIT compositor can be resized only while idle.");
	auto currentSize = nodePool.getFrameSize();
	if (frameSize.x == currentSize.x && frameSize.y == currentSize.y)
		return;

	nodePool.resize(frameSize);
	compositeBuffer.resize(frameSize, float4::zero);
	stats = {};
}

void Compositor::setDepthConvention(DepthConvention depthConvention)
{
	if (state != FrameState::Idle)
		throw VitrineError("OIT depth convention can be changed only while idle.");
	VITRINE_ASSERT(depthConvention < DepthConvention::Count);
	sorter = FragmentSorter(depthConvention);
}

//**********************************************************************************************************************
bool Compositor::beginWritePass()
{
	VITRINE_ASSERT_MSG(state == FrameState::Idle, "Previous OIT frame is not ended");

	if (!isActive())
		return false;

	VITRINE_CPU_ZONE_SCOPED("OIT Begin Write Pass");

	nodePool.reset();
	drawSequence.reset();
	stats = {};
	state = FrameState::WritePass;
	return true;
}

bool Compositor::beginCompositePass()
{
	if (state != FrameState::WritePass)
		return false;

	stats.appendedCount = nodePool.getAllocatedCount();
	stats.droppedCount = nodePool.getDroppedCount();
	state = FrameState::CompositePass;

	if (stats.droppedCount > 0)
	{
		VITRINE_LOG_WARN("OIT node pool is exhausted, dropped fragments. (dropped: " + 
			to_string(stats.droppedCount) + ", capacity: " + to_string(nodePool.getCapacity()) + ")");
	}
	return true;
}

//**********************************************************************************************************************
void Compositor::composite(const ColorBuffer& opaqueColor, const DepthBuffer& opaqueDepth, ThreadPool* threadPool)
{
	VITRINE_CPU_ZONE_SCOPED("OIT Composite");
	VITRINE_ASSERT_MSG(state == FrameState::CompositePass, "OIT composite pass is not started");

	auto frameSize = nodePool.getFrameSize();
	checkBufferSize(opaqueColor.getSize(), frameSize, "Opaque color buffer");
	checkBufferSize(opaqueDepth.getSize(), frameSize, "Opaque depth buffer");

	std::atomic<uint32> coveredPixelCount { 0 }, maxPixelFragmentCount { 0 };
	auto compositeRows = [&](uint32 rowOffset, uint32 rowEnd)
	{
		SortedFragments scratch;
		uint32 covered = 0, maxCount = 0;

		for (uint32 y = rowOffset; y < rowEnd; y++)
		{
			auto pixelIndex = y * frameSize.x;
			for (uint32 x = 0; x < frameSize.x; x++, pixelIndex++)
			{
				compositeBuffer[pixelIndex] = sorter.composite(nodePool, pixelIndex, 
					opaqueColor[pixelIndex], opaqueDepth[pixelIndex], scratch);
				if (scratch.count > 0)
					covered++;
				maxCount = std::max(maxCount, nodePool.getCount(pixelIndex));
			}
		}

		coveredPixelCount.fetch_add(covered, std::memory_order_relaxed);
		atomicMax(maxPixelFragmentCount, maxCount);
	};

	if (threadPool)
	{
		threadPool->addItems([&](const ThreadPool::Task& task)
		{
			VITRINE_CPU_ZONE_SCOPED("OIT Composite Rows");
			compositeRows(task.getItemOffset(), task.getItemCount());
		},
		frameSize.y);
		threadPool->wait();
	}
	else
	{
		compositeRows(0, frameSize.y);
	}

	stats.coveredPixelCount = coveredPixelCount.load(std::memory_order_relaxed);
	stats.maxPixelFragmentCount = maxPixelFragmentCount.load(std::memory_order_relaxed);
}

void Compositor::present(ColorBuffer& backbuffer)
{
	VITRINE_CPU_ZONE_SCOPED("OIT Present");
	VITRINE_ASSERT_MSG(state == FrameState::CompositePass, "OIT composite pass is not started");
	checkBufferSize(backbuffer.getSize(), nodePool.getFrameSize(), "Backbuffer");

	state = FrameState::Present;
	std::copy(compositeBuffer.getData(), compositeBuffer.getData() + 
		compositeBuffer.getTexelCount(), backbuffer.getData());
}
void Compositor::endFrame()
{
	VITRINE_ASSERT_MSG(state == FrameState::Present, "OIT frame is not presented");
	state = FrameState::Idle;
}
