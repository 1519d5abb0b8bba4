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
 * @brief Translucent fragment node data and packing functions.
 */

#pragma once
#include "vitrine/oit/blend.hpp"
#include "math/color.hpp"

#include <atomic>

namespace vitrine::oit
{

constexpr uint32 nullNode = UINT32_MAX;                      /**< Fragment list terminator and empty head value. */
constexpr uint32 maxFragments = VITRINE_OIT_MAX_FRAGMENTS;  /**< Per-pixel fragment traversal cap. */

static_assert(maxFragments > 0, "OIT max fragment count must be greater than zero");

/***********************************************************************************************************************
 * @brief Fragment node control word layout.
 * 
 * @details
 * [0..15]  draw sequence number
 * [16..19] blending operation
 * [20..23] source blending factor
 * [24..27] destination blending factor
 * [28..31] unused
 */
struct FragmentControl final
{
	static constexpr uint32 sequenceMask = 0xFFFFu;
	static constexpr uint32 enumMask = 0xFu;
	static constexpr uint32 operationShift = 16;
	static constexpr uint32 srcFactorShift = 20;
	static constexpr uint32 dstFactorShift = 24;

	/**
	 * @brief Packs draw sequence and raw blend enumerants into a control word.
	 * @details Enumerant values are truncated to 4 bits.
	 */
	static constexpr uint32 pack(uint16 drawSequence, uint8 operation, uint8 srcFactor, uint8 dstFactor) noexcept
	{
		return (uint32)drawSequence | ((uint32)(operation & enumMask) << operationShift) |
			((uint32)(srcFactor & enumMask) << srcFactorShift) | ((uint32)(dstFactor & enumMask) << dstFactorShift);
	}
	static constexpr uint16 getDrawSequence(uint32 control) noexcept { return (uint16)(control & sequenceMask); }
	static constexpr uint8 getOperation(uint32 control) noexcept { return (control >> operationShift) & enumMask; }
	static constexpr uint8 getSrcFactor(uint32 control) noexcept { return (control >> srcFactorShift) & enumMask; }
	static constexpr uint8 getDstFactor(uint32 control) noexcept { return (control >> dstFactorShift) & enumMask; }
};

/***********************************************************************************************************************
 * @brief Packs normalized color into RGBA8. (Values are saturated)
 * @param color target normalized color
 */
static uint32 packFragmentColor(float4 color) noexcept
{
	return (uint32)(Color)min(max(color, float4(0.0f)), float4(1.0f));
}
/**
 * @brief Unpacks RGBA8 color into normalized color.
 * @param color packed fragment color
 */
static float4 unpackFragmentColor(uint32 color) noexcept
{
	return (float4)Color(color);
}

/***********************************************************************************************************************
 * @brief Translucent fragment record stored in the shared node pool.
 * @details Layout matches the GPU structured buffer element. (16 bytes)
 */
struct FragmentNode final
{
	float depth = 0.0f;    /**< Fragment depth in the active depth convention. */
	uint32 color = 0;      /**< Packed RGBA8 source color. */
	uint32 control = 0;    /**< Packed draw sequence and blend state. (@ref FragmentControl) */
	uint32 next = nullNode; /**< Previously appended node of the same pixel or nullNode. */

	uint16 getDrawSequence() const noexcept { return FragmentControl::getDrawSequence(control); }
	float4 getColor() const noexcept { return unpackFragmentColor(color); }

	BlendOperation getOperation() const noexcept { return (BlendOperation)FragmentControl::getOperation(control); }
	BlendFactor getSrcFactor() const noexcept { return (BlendFactor)FragmentControl::getSrcFactor(control); }
	BlendFactor getDstFactor() const noexcept { return (BlendFactor)FragmentControl::getDstFactor(control); }
	BlendMode getBlendMode() const noexcept { return BlendMode(getOperation(), getSrcFactor(), getDstFactor()); }
};

static_assert(sizeof(FragmentNode) == 16, "Fragment node must match GPU buffer stride");

/***********************************************************************************************************************
 * @brief Per-frame draw submission counter.
 * 
 * @details
 * Incremented once per distinct translucent draw. The value is the tie-break key when fragments of different draws 
 * land on the same depth, so the first draw of a frame gets 1 and the counter wraps after 65535. (MT-Safe)
 */
class DrawSequence final
{
	std::atomic<uint16> value { 0 };
public:
	/**
	 * @brief Returns sequence number of the next draw submission.
	 */
	uint16 next() noexcept { return (uint16)(value.fetch_add(1, std::memory_order_relaxed) + 1); }
	/**
	 * @brief Returns last returned sequence number. (0 if none)
	 */
	uint16 get() const noexcept { return value.load(std::memory_order_relaxed); }
	/**
	 * @brief Restarts the counter for a new frame.
	 */
	void reset() noexcept { value.store(0, std::memory_order_relaxed); }
};

} // namespace vitrine::oit
