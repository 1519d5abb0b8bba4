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
 * @brief Order independent transparency rendering functions. (OIT)
 */

#pragma once
#include "vitrine/oit/compositor.hpp"
#include "ecsm.hpp"

namespace vitrine
{

using namespace ecsm;

/**
 * @brief Order independent transparency rendering system. (OIT)
 *
 * @details
 * Owns the frame surfaces and the OIT compositor, and drives them once per "Render" event:
 * 
 * OpaqueRender: subscribers write opaque color and resolve the depth buffer.
 * TranslucentRender: subscribers submit translucent draws with @ref appendFragment(), possibly from the foreground 
 *   thread pool. The pool is waited before the composite pass starts.
 * FallbackTranslucentRender: runs instead of the TranslucentRender when OIT is not active, subscribers blend 
 *   sorted translucent geometry straight into the opaque color buffer.
 * 
 * The "Present" event copies the finished frame to the backbuffer.
 */
class OitRenderSystem final : public System, public Singleton<OitRenderSystem>
{
	oit::Compositor compositor;
	ColorBuffer colorBuffer;
	DepthBuffer depthBuffer;
	ColorBuffer backbuffer;
	uint64 frameIndex = 0;

	/**
	 * @brief Creates a new order independent transparency rendering system instance.
	 * 
	 * @param frameSize target frame size in pixels
	 * @param featureLevel graphics device feature tier
	 * @param setSingleton set system singleton instance
	 */
	OitRenderSystem(uint2 frameSize, oit::FeatureLevel featureLevel, bool setSingleton = true);
	/**
	 * @brief Destroys order independent transparency rendering system instance.
	 */
	~OitRenderSystem() final;

	void init();
	void deinit();
	void render();
	void present();

	friend class ecsm::Manager;
public:
	float4 clearColor = float4(0.0f, 0.0f, 0.0f, 1.0f); /**< Opaque color buffer clear value. */

	/**
	 * @brief Returns OIT frame compositor.
	 */
	oit::Compositor& getCompositor() noexcept { return compositor; }
	/**
	 * @brief Returns true if the current frame uses OIT instead of the fallback path.
	 */
	bool isOitActive() const noexcept { return compositor.isActive(); }

	/**
	 * @brief Returns opaque color buffer. (Written by OpaqueRender subscribers)
	 */
	ColorBuffer& getColorBuffer() noexcept { return colorBuffer; }
	/**
	 * @brief Returns opaque depth buffer. (Written by OpaqueRender subscribers)
	 */
	DepthBuffer& getDepthBuffer() noexcept { return depthBuffer; }
	/**
	 * @brief Returns last presented frame color buffer.
	 */
	const ColorBuffer& getBackbuffer() const noexcept { return backbuffer; }
	/**
	 * @brief Returns presented frame count.
	 */
	uint64 getFrameIndex() const noexcept { return frameIndex; }

	/**
	 * @brief Returns sequence number for the next translucent draw submission. (MT-Safe)
	 */
	uint16 nextDrawSequence() noexcept { return compositor.nextDrawSequence(); }
	/**
	 * @brief Appends translucent fragment to the pixel list. (MT-Safe, TranslucentRender only)
	 * 
	 * @param pixel target pixel coordinate
	 * @param depth fragment depth in the active depth convention
	 * @param color fragment source color
	 * @param drawSequence draw submission sequence number
	 * @param[in] blendMode fragment blend state
	 */
	bool appendFragment(uint2 pixel, float depth, float4 color, 
		uint16 drawSequence, const oit::BlendMode& blendMode) noexcept
	{
		return compositor.append(pixel, depth, color, drawSequence, blendMode);
	}

	/**
	 * @brief Recreates frame surfaces and OIT buffers for a new frame size.
	 * @param frameSize target frame size in pixels
	 * @throw VitrineError if a frame is in flight or on invalid frame size.
	 */
	void resize(uint2 frameSize);
};

} // namespace vitrine
