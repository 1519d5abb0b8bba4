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
 * @brief Per-pixel fragment sorting and resolve functions.
 */

#pragma once
#include "vitrine/oit/node-pool.hpp"
#include "vitrine/image.hpp"

#include <array>

namespace vitrine::oit
{

/**
 * @brief Bounded back-to-front ordered fragment sequence of one pixel.
 */
struct SortedFragments final
{
	array<FragmentNode, maxFragments> fragments; /**< Ordered fragments, [0] is blended first. (Farthest) */
	uint32 count = 0;                            /**< Inserted (visible) fragment count. */
	uint32 visitedCount = 0;                     /**< Chain nodes walked, including discarded ones. */
};

/***********************************************************************************************************************
 * @brief Composite pass per-pixel fragment sorter.
 * 
 * @details
 * Walks a pixel list head first (most recently appended first) and insertion sorts the fragments that are not 
 * hidden by the opaque surface into back-to-front order. Fragments at equal depth are ordered by ascending draw 
 * sequence, which reproduces what sequential alpha blending of those draws would have produced.
 * 
 * At most maxFragments chain nodes are visited, counting discarded ones. Under heavy overdraw this leaves out 
 * the oldest appended fragments of the pixel, not the least visible ones.
 */
class FragmentSorter final
{
	DepthConvention depthConvention = DepthConvention::Standard;
public:
	/**
	 * @brief Creates a new fragment sorter.
	 * @param depthConvention active depth buffer convention
	 */
	explicit FragmentSorter(DepthConvention depthConvention = DepthConvention::Standard) noexcept : 
		depthConvention(depthConvention) { }

	/**
	 * @brief Returns active depth buffer convention.
	 */
	DepthConvention getDepthConvention() const noexcept { return depthConvention; }

	/**
	 * @brief Returns true if fragment a has to be blended before fragment b.
	 * @details Farther fragment goes first, on a depth tie lower draw sequence goes first.
	 * 
	 * @param[in] a first fragment node
	 * @param[in] b second fragment node
	 */
	bool isBlendedBefore(const FragmentNode& a, const FragmentNode& b) const noexcept
	{
		if (a.depth != b.depth)
			return isFarther(a.depth, b.depth, depthConvention);
		return a.getDrawSequence() < b.getDrawSequence();
	}

	/**
	 * @brief Collects pixel fragments in back-to-front order.
	 * 
	 * @param[in] nodePool source node pool (read-only composite pass state)
	 * @param pixelIndex target row-major pixel index
	 * @param opaqueDepth nearest opaque surface depth of the pixel
	 * @param[out] result ordered pixel fragments
	 */
	void sort(const NodePool& nodePool, uint32 pixelIndex, float opaqueDepth, SortedFragments& result) const noexcept;

	/**
	 * @brief Blends ordered fragments over the opaque color.
	 * @details Returns the opaque color unchanged if there are no fragments.
	 * 
	 * @param[in] fragments back-to-front ordered pixel fragments
	 * @param opaqueColor opaque surface color of the pixel
	 */
	static float4 resolve(const SortedFragments& fragments, float4 opaqueColor) noexcept;

	/**
	 * @brief Sorts and resolves one pixel.
	 * 
	 * @param[in] nodePool source node pool (read-only composite pass state)
	 * @param pixelIndex target row-major pixel index
	 * @param opaqueColor opaque surface color of the pixel
	 * @param opaqueDepth nearest opaque surface depth of the pixel
	 * @param[out] scratch fragment sort storage
	 */
	float4 composite(const NodePool& nodePool, uint32 pixelIndex, 
		float4 opaqueColor, float opaqueDepth, SortedFragments& scratch) const noexcept
	{
		sort(nodePool, pixelIndex, opaqueDepth, scratch);
		return resolve(scratch, opaqueColor);
	}
};

} // namespace vitrine::oit
