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
 * @brief Per-pixel fragment linked list storage functions.
 */

#pragma once
#include "vitrine/oit/fragment.hpp"

#include <vector>

namespace vitrine::oit
{

/***********************************************************************************************************************
 * @brief Shared fragment node arena with per-pixel list heads.
 * 
 * @details
 * Nodes are handed out by one monotonic cursor shared by the whole frame and are never freed individually. Each 
 * pixel head holds the index of the most recently appended node, which links to the previous one, forming a stack 
 * per pixel. The per-pixel count index is diagnostic only. All three are cleared together by @ref reset() at the 
 * start of a write pass, mutated only during the write pass and read only during the composite pass.
 */
class NodePool final
{
	vector<FragmentNode> nodes;
	vector<std::atomic<uint32>> heads;
	vector<std::atomic<uint32>> counts;
	std::atomic<uint32> cursor { 0 };
	std::atomic<uint32> droppedCount { 0 };
	uint2 frameSize = uint2::zero;

	friend class FragmentAccumulator;
public:
	/**
	 * @brief Creates a new empty node pool.
	 */
	NodePool() = default;
	/**
	 * @brief Creates a new node pool for the specified frame size.
	 * @param frameSize target frame size in pixels
	 * @throw VitrineError on invalid frame size.
	 */
	explicit NodePool(uint2 frameSize) { resize(frameSize); }

	NodePool(NodePool&&) = delete;
	NodePool(const NodePool&) = delete;
	NodePool& operator=(const NodePool&) = delete;

	/**
	 * @brief Reallocates node pool, head and count index for a new frame size.
	 * @details Capacity is frameSize.x * frameSize.y * maxFragments. The pool is left in the reset state.
	 * 
	 * @param frameSize target frame size in pixels
	 * @throw VitrineError on zero frame size or if capacity overflows 32-bit node index.
	 */
	void resize(uint2 frameSize);
	/**
	 * @brief Rewinds allocation cursor and clears all pixel heads and counts.
	 * @warning Must not overlap with any append or read of the previous frame.
	 */
	void reset() noexcept;

	/**
	 * @brief Reserves the next free node. (MT-Safe)
	 * @details The cursor never moves past the capacity, failed attempts are only counted.
	 * @return Reserved node index, or nullNode if the pool is exhausted.
	 */
	uint32 allocate() noexcept;

	/**
	 * @brief Returns frame size in pixels.
	 */
	uint2 getFrameSize() const noexcept { return frameSize; }
	/**
	 * @brief Returns frame pixel count. (Head index size)
	 */
	uint32 getPixelCount() const noexcept { return (uint32)heads.size(); }
	/**
	 * @brief Returns total node capacity.
	 */
	uint32 getCapacity() const noexcept { return (uint32)nodes.size(); }
	/**
	 * @brief Returns allocated node count since the last reset. (Allocation cursor)
	 */
	uint32 getAllocatedCount() const noexcept { return cursor.load(std::memory_order_acquire); }
	/**
	 * @brief Returns node allocation attempts refused since the last reset.
	 */
	uint32 getDroppedCount() const noexcept { return droppedCount.load(std::memory_order_acquire); }

	/**
	 * @brief Returns index of the most recently appended node of the pixel. (nullNode if empty)
	 * @param pixelIndex target row-major pixel index
	 */
	uint32 getHead(uint32 pixelIndex) const noexcept
	{
		VITRINE_ASSERT(pixelIndex < heads.size());
		return heads[pixelIndex].load(std::memory_order_acquire);
	}
	/**
	 * @brief Returns fragment count appended to the pixel since the last reset.
	 * @param pixelIndex target row-major pixel index
	 */
	uint32 getCount(uint32 pixelIndex) const noexcept
	{
		VITRINE_ASSERT(pixelIndex < counts.size());
		return counts[pixelIndex].load(std::memory_order_relaxed);
	}
	/**
	 * @brief Returns fragment node at the specified pool index.
	 * @param index target node index
	 */
	const FragmentNode& getNode(uint32 index) const noexcept
	{
		VITRINE_ASSERT(index < nodes.size());
		return nodes[index];
	}
	/**
	 * @brief Returns row-major pixel index of the pixel coordinate.
	 * @param pixel target pixel coordinate
	 */
	uint32 getPixelIndex(uint2 pixel) const noexcept
	{
		VITRINE_ASSERT(pixel.x < frameSize.x && pixel.y < frameSize.y);
		return pixel.y * frameSize.x + pixel.x;
	}
};

} // namespace vitrine::oit
