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

#include "vitrine/oit/sorter.hpp"

using namespace vitrine;
using namespace vitrine::oit;

//**********************************************************************************************************************
void FragmentSorter::sort(const NodePool& nodePool, uint32 pixelIndex, 
	float opaqueDepth, SortedFragments& result) const noexcept
{
	auto& fragments = result.fragments;
	uint32 count = 0, visitedCount = 0;
	auto nodeIndex = nodePool.getHead(pixelIndex);

	while (nodeIndex != nullNode && visitedCount < maxFragments)
	{
		const auto& node = nodePool.getNode(nodeIndex);
		nodeIndex = node.next;
		visitedCount++;

		if (isFarther(node.depth, opaqueDepth, depthConvention))
			continue;

		auto i = count;
		while (i > 0 && isBlendedBefore(node, fragments[i - 1]))
		{
			fragments[i] = fragments[i - 1];
			i--;
		}

		fragments[i] = node;
		count++;
	}

	result.count = count;
	result.visitedCount = visitedCount;
}

float4 FragmentSorter::resolve(const SortedFragments& fragments, float4 opaqueColor) noexcept
{
	auto color = opaqueColor;
	for (uint32 i = 0; i < fragments.count; i++)
	{
		const auto& fragment = fragments.fragments[i];
		color = blend(fragment.getBlendMode(), fragment.getColor(), color);
	}
	return color;
}
