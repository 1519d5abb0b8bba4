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
 * @brief Order independent transparency frame compositor. (OIT)
 */

#pragma once
#include "vitrine/oit/accumulator.hpp"
#include "vitrine/oit/sorter.hpp"
#include "vitrine/thread-pool.hpp"

namespace vitrine::oit
{

/**
 * @brief OIT compositor frame state.
 */
enum class FrameState : uint8
{
	Idle,          /**< No frame in flight, buffers are stale. */
	WritePass,     /**< Translucent fragments are being appended. */
	CompositePass, /**< Fragment lists are read-only, pixels are being resolved. */
	Present,       /**< Composited frame is copied over the backbuffer. */
	Count          /**< Frame state count. */
};

/**
 * @brief Graphics device hardware feature tier.
 * @details Linked-list buffers with atomic counters bound to the fragment stage appear at Level11_1.
 */
enum class FeatureLevel : uint8
{
	Level9_1, Level9_2, Level9_3, Level10_0, Level10_1, Level11_0, Level11_1, Level12_0, Level12_1, Level12_2, Count
};

/**
 * @brief Returns true if the device feature tier supports per-pixel fragment lists.
 * @param featureLevel target device feature tier
 */
static constexpr bool isOitSupported(FeatureLevel featureLevel) noexcept
{
	return featureLevel >= FeatureLevel::Level11_1 && featureLevel < FeatureLevel::Count;
}

/**
 * @brief Returns frame state name string.
 * @param frameState target frame state
 */
string_view toString(FrameState frameState) noexcept;
/**
 * @brief Returns device feature tier name string. (e.g. "11_1")
 * @param featureLevel target device feature tier
 */
string_view toString(FeatureLevel featureLevel) noexcept;

/**
 * @brief Per-frame OIT statistics.
 */
struct FrameStats final
{
	uint32 appendedCount = 0;         /**< Fragments stored in the node pool. */
	uint32 droppedCount = 0;          /**< Fragments refused because the node pool was exhausted. */
	uint32 coveredPixelCount = 0;     /**< Pixels with at least one visible fragment. */
	uint32 maxPixelFragmentCount = 0; /**< Largest per-pixel appended fragment count. (Depth complexity) */
};

/***********************************************************************************************************************
 * @brief Order independent transparency frame compositor. (OIT)
 * 
 * @details
 * Drives one frame through Idle -> WritePass -> CompositePass -> Present -> Idle. The node pool is cleared once 
 * when the write pass begins, filled by concurrent @ref append() calls, then every pixel list is sorted and blended 
 * over the opaque color during the composite pass. Nothing is retained across frames.
 * 
 * Devices below @ref FeatureLevel::Level11_1 can not hold per-pixel fragment lists. Such compositor is not capable, 
 * refuses to begin the write pass, and the caller has to draw translucent geometry with a sorted fallback path.
 */
class Compositor final
{
	NodePool nodePool;
	FragmentAccumulator accumulator;
	FragmentSorter sorter;
	DrawSequence drawSequence;
	ColorBuffer compositeBuffer;
	FrameStats stats = {};
	FeatureLevel featureLevel = {};
	FrameState state = FrameState::Idle;
	bool capable = false;
	bool enabled = false;
public:
	/**
	 * @brief Creates a new OIT compositor.
	 * @details OIT is enabled if the device is capable.
	 * 
	 * @param frameSize target frame size in pixels
	 * @param featureLevel graphics device feature tier
	 * @param depthConvention active depth buffer convention
	 * 
	 * @throw VitrineError on invalid frame size.
	 */
	Compositor(uint2 frameSize, FeatureLevel featureLevel, 
		DepthConvention depthConvention = DepthConvention::Standard);

	Compositor(Compositor&&) = delete;
	Compositor(const Compositor&) = delete;
	Compositor& operator=(const Compositor&) = delete;

	/*******************************************************************************************************************
	 * @brief Returns true if the device supports OIT. (Fixed at creation)
	 */
	bool isCapable() const noexcept { return capable; }
	/**
	 * @brief Returns graphics device feature tier.
	 */
	FeatureLevel getFeatureLevel() const noexcept { return featureLevel; }
	/**
	 * @brief Returns true if OIT is enabled.
	 */
	bool isEnabled() const noexcept { return enabled; }
	/**
	 * @brief Returns true if the next frame will use OIT. (Capable and enabled)
	 */
	bool isActive() const noexcept { return capable && enabled; }
	/**
	 * @brief Enables or disables OIT.
	 * @details Takes effect at the next write pass begin.
	 * 
	 * @param isEnabled enable OIT
	 * @throw VitrineError if enabling on a device which is not OIT-capable.
	 */
	void setEnabled(bool isEnabled);

	/**
	 * @brief Returns current frame state.
	 */
	FrameState getState() const noexcept { return state; }
	/**
	 * @brief Returns frame size in pixels.
	 */
	uint2 getFrameSize() const noexcept { return nodePool.getFrameSize(); }
	/**
	 * @brief Reallocates frame buffers for a new frame size.
	 * 
	 * @param frameSize target frame size in pixels
	 * @throw VitrineError if not Idle or on invalid frame size.
	 */
	void resize(uint2 frameSize);

	/**
	 * @brief Returns active depth buffer convention.
	 */
	DepthConvention getDepthConvention() const noexcept { return sorter.getDepthConvention(); }
	/**
	 * @brief Sets active depth buffer convention.
	 * 
	 * @param depthConvention target depth buffer convention
	 * @throw VitrineError if not Idle.
	 */
	void setDepthConvention(DepthConvention depthConvention);

	/*******************************************************************************************************************
	 * @brief Begins translucent fragment write pass. (Idle -> WritePass)
	 * @details Clears node pool, head and count index and draw sequence.
	 * @return False if OIT is not active, caller should use fallback path.
	 */
	bool beginWritePass();

	/**
	 * @brief Returns sequence number for the next translucent draw submission. (MT-Safe)
	 */
	uint16 nextDrawSequence() noexcept { return drawSequence.next(); }

	/**
	 * @brief Appends translucent fragment to the pixel list. (MT-Safe, WritePass only)
	 * @details See the @ref FragmentAccumulator::append().
	 * 
	 * @param pixel target pixel coordinate
	 * @param depth fragment depth in the active depth convention
	 * @param color fragment source color
	 * @param drawSequence draw submission sequence number
	 * @param[in] blendMode fragment blend state
	 */
	bool append(uint2 pixel, float depth, float4 color, uint16 drawSequence, const BlendMode& blendMode) noexcept
	{
		VITRINE_ASSERT_MSG(state == FrameState::WritePass, "Fragments can be appended only in write pass");
		return accumulator.append(pixel, depth, color, drawSequence, blendMode);
	}
	/**
	 * @brief Appends translucent fragment with packed blend enumerants. (MT-Safe, WritePass only)
	 * @details See the @ref FragmentAccumulator::append().
	 */
	bool append(uint32 pixelIndex, float depth, float4 color, uint16 drawSequence, 
		uint8 blendOperation, uint8 srcFactor, uint8 dstFactor) noexcept
	{
		VITRINE_ASSERT_MSG(state == FrameState::WritePass, "Fragments can be appended only in write pass");
		return accumulator.append(pixelIndex, depth, color, drawSequence, blendOperation, srcFactor, dstFactor);
	}

	/*******************************************************************************************************************
	 * @brief Ends write pass and begins composite pass. (WritePass -> CompositePass)
	 * @warning All translucent draws must be flushed before calling it!
	 * @return False if write pass is not started, state is left unchanged.
	 */
	bool beginCompositePass();
	/**
	 * @brief Sorts and blends every pixel fragment list over the opaque surface. (CompositePass only)
	 * 
	 * @param[in] opaqueColor resolved opaque color buffer
	 * @param[in] opaqueDepth resolved opaque depth buffer
	 * @param[in] threadPool pool used to resolve pixel rows in parallel, or null
	 * 
	 * @throw VitrineError if buffer sizes do not match the frame size.
	 */
	void composite(const ColorBuffer& opaqueColor, const DepthBuffer& opaqueDepth, ThreadPool* threadPool = nullptr);
	/**
	 * @brief Returns composited frame color buffer.
	 */
	const ColorBuffer& getCompositeBuffer() const noexcept { return compositeBuffer; }

	/**
	 * @brief Copies composited frame over the backbuffer. (CompositePass -> Present)
	 * @param[out] backbuffer target presentation color buffer
	 * @throw VitrineError if backbuffer size does not match the frame size.
	 */
	void present(ColorBuffer& backbuffer);
	/**
	 * @brief Ends current frame. (Present -> Idle)
	 */
	void endFrame();

	/**
	 * @brief Returns last frame statistics.
	 */
	const FrameStats& getStats() const noexcept { return stats; }
	/**
	 * @brief Returns fragment node pool.
	 */
	const NodePool& getNodePool() const noexcept { return nodePool; }
};

} // namespace vitrine::oit
