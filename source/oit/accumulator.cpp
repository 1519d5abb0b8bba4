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

using namespace vitrine;
using namespace vitrine::oit;

bool FragmentAccumulator::append(uint32 pixelIndex, float depth, float4 color, 
	uint16 drawSequence, uint8 operation, uint8 srcFactor, uint8 dstFactor) noexcept
{
	VITRINE_ASSERT(pixelIndex < nodePool->heads.size());

	auto nodeIndex = nodePool->allocate();
	if (nodeIndex == nullNode)
		return false;

	auto& node = nodePool->nodes[nodeIndex];
	node.depth = depth;
	node.color = packFragmentColor(color);
	node.control = FragmentControl::pack(drawSequence, operation, srcFactor, dstFactor);

	// Node is fully written before it becomes visible as the new head.
	auto& head = nodePool->heads[pixelIndex];
	auto previousHead = head.load(std::memory_order_relaxed);
	do
	{
		node.next = previousHead;
	}
	while (!head.compare_exchange_weak(previousHead, nodeIndex, 
		std::memory_order_release, std::memory_order_relaxed));

	nodePool->counts[pixelIndex].fetch_add(1, std::memory_order_relaxed);
	return true;
}
