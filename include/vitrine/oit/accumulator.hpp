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
 * @brief Translucent fragment write pass functions.
 */

#pragma once
#include "vitrine/oit/node-pool.hpp"

namespace vitrine::oit
{

/***********************************************************************************************************************
 * @brief Appends translucent fragments to the per-pixel linked lists.
 * 
 * @details
 * This is the whole write pass ingress surface. Any number of threads may append to the same pixel at once: each 
 * append reserves its own node and swaps it in as the new pixel head with a compare-and-swap, so every appended 
 * node stays reachable from the head and no node is shared between pixels. The relative order of concurrent 
 * appends is unspecified, the composite pass sorts fragments on its own.
 */
class FragmentAccumulator final
{
	NodePool* nodePool = nullptr;
public:
	/**
	 * @brief Creates a new fragment accumulator writing to the node pool.
	 * @param[in,out] nodePool target node pool
	 */
	explicit FragmentAccumulator(NodePool& nodePool) noexcept : nodePool(&nodePool) { }

	/**
	 * @brief Appends a fragment to the pixel list. (MT-Safe)
	 * 
	 * @details
	 * Silently drops the fragment if the node pool is exhausted, existing lists are never affected. Blend enumerants 
	 * are stored as is (truncated to 4 bits), values outside the closed sets resolve to the diagnostic color later.
	 * 
	 * @param pixelIndex target row-major pixel index
	 * @param depth fragment depth in the active depth convention
	 * @param color fragment normalized source color
	 * @param drawSequence draw submission sequence number
	 * @param operation packed blending operation
	 * @param srcFactor packed source blending factor
	 * @param dstFactor packed destination blending factor
	 * 
	 * @return True if fragment was stored, otherwise false.
	 */
	bool append(uint32 pixelIndex, float depth, float4 color, uint16 drawSequence, 
		uint8 operation, uint8 srcFactor, uint8 dstFactor) noexcept;

	/**
	 * @brief Appends a fragment to the pixel list. (MT-Safe)
	 * @details See the @ref append(uint32, float, float4, uint16, uint8, uint8, uint8).
	 * 
	 * @param pixel target pixel coordinate
	 * @param depth fragment depth in the active depth convention
	 * @param color fragment normalized source color
	 * @param drawSequence draw submission sequence number
	 * @param[in] blendMode fragment blending state
	 * 
	 * @return True if fragment was stored, otherwise false.
	 */
	bool append(uint2 pixel, float depth, float4 color, uint16 drawSequence, const BlendMode& blendMode) noexcept
	{
		return append(nodePool->getPixelIndex(pixel), depth, color, drawSequence, 
			(uint8)blendMode.operation, (uint8)blendMode.srcFactor, (uint8)blendMode.dstFactor);
	}

	/**
	 * @brief Returns destination node pool.
	 */
	NodePool& getNodePool() noexcept { return *nodePool; }
};

} // namespace vitrine::oit
