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
#include <cmath>

using namespace vitrine;
using namespace vitrine::oit;

static const auto alphaBlend = BlendMode();

static bool isNear(float4 a, float4 b, float tolerance = 0.0001f)
{
	return std::abs(a.x - b.x) <= tolerance && std::abs(a.y - b.y) <= tolerance &&
		std::abs(a.z - b.z) <= tolerance && std::abs(a.w - b.w) <= tolerance;
}
static float4 toStored(float4 color)
{
	return unpackFragmentColor(packFragmentColor(color));
}

template<typename F>
static bool isThrowing(F&& function)
{
	try { function(); }
	catch (const VitrineError&) { return true; }
	return false;
}

//**********************************************************************************************************************
static void testCapability()
{
	if (isOitSupported(FeatureLevel::Level11_0) || !isOitSupported(FeatureLevel::Level11_1) ||
		!isOitSupported(FeatureLevel::Level12_2) || isOitSupported(FeatureLevel::Count))
	{
		throw runtime_error("Bad OIT feature level support.");
	}

	Compositor legacy(uint2(2, 2), FeatureLevel::Level10_1);
	if (legacy.getFeatureLevel() != FeatureLevel::Level10_1)
		throw runtime_error("Bad compositor feature level.");
	if (legacy.isCapable() || legacy.isEnabled() || legacy.isActive())
		throw runtime_error("Legacy device is reported as OIT-capable.");
	if (legacy.beginWritePass() || legacy.getState() != FrameState::Idle)
		throw runtime_error("Legacy device entered the write pass.");
	if (legacy.beginCompositePass() || legacy.getState() != FrameState::Idle)
		throw runtime_error("Legacy device entered the composite pass.");
	if (!isThrowing([&]() { legacy.setEnabled(true); }))
		throw runtime_error("OIT enabled on a legacy device.");
	legacy.setEnabled(false);

	Compositor modern(uint2(2, 2), FeatureLevel::Level11_1);
	if (!modern.isCapable() || !modern.isEnabled() || !modern.isActive())
		throw runtime_error("Capable device has OIT disabled.");

	modern.setEnabled(false);
	if (modern.isActive() || modern.beginWritePass() || modern.getState() != FrameState::Idle)
		throw runtime_error("Disabled compositor entered the write pass.");
	modern.setEnabled(true);
	if (!modern.beginWritePass() || modern.getState() != FrameState::WritePass)
		throw runtime_error("Enabled compositor did not enter the write pass.");
}

static void testFrameStates()
{
	auto frameSize = uint2(4, 4);
	Compositor compositor(frameSize, FeatureLevel::Level12_0);
	ColorBuffer opaqueColor(frameSize, float4(0.0f, 0.0f, 0.0f, 1.0f));
	DepthBuffer opaqueDepth(frameSize, 1.0f);
	ColorBuffer backbuffer(frameSize);

	if (compositor.getState() != FrameState::Idle || toString(compositor.getState()) != "Idle")
		throw runtime_error("Compositor is not idle after creation.");

	if (!compositor.beginWritePass() || compositor.getState() != FrameState::WritePass)
		throw runtime_error("Bad write pass state.");
	if (!isThrowing([&]() { compositor.resize(uint2(8, 8)); }))
		throw runtime_error("Compositor resized during the write pass.");
	if (!isThrowing([&]() { compositor.setDepthConvention(DepthConvention::Reversed); }))
		throw runtime_error("Depth convention changed during the write pass.");

	if (!compositor.beginCompositePass() || compositor.getState() != FrameState::CompositePass)
		throw runtime_error("Bad composite pass state.");
	compositor.composite(opaqueColor, opaqueDepth);

	compositor.present(backbuffer);
	if (compositor.getState() != FrameState::Present)
		throw runtime_error("Bad present state.");
	compositor.endFrame();
	if (compositor.getState() != FrameState::Idle)
		throw runtime_error("Compositor is not idle after the frame.");

	compositor.resize(uint2(8, 2));
	auto newSize = compositor.getFrameSize();
	if (newSize.x != 8 || newSize.y != 2 || compositor.getCompositeBuffer().getTexelCount() != 16 ||
		compositor.getNodePool().getCapacity() != 16 * maxFragments)
	{
		throw runtime_error("Compositor is not resized.");
	}
	if (!isThrowing([&]() { compositor.resize(uint2(0, 0)); }))
		throw runtime_error("Zero frame size is accepted.");
}

//**********************************************************************************************************************
static void testComposite()
{
	auto frameSize = uint2(4, 4);
	Compositor compositor(frameSize, FeatureLevel::Level11_1);
	ColorBuffer opaqueColor(frameSize, float4(0.0f, 0.0f, 0.0f, 1.0f));
	DepthBuffer opaqueDepth(frameSize, 1.0f);
	opaqueColor.set(uint2(1, 1), float4(0.0f, 1.0f, 0.0f, 1.0f));
	opaqueDepth.set(uint2(1, 1), 0.3f);

	auto red = float4(1.0f, 0.0f, 0.0f, 0.5f), blue = float4(0.0f, 0.0f, 1.0f, 0.5f);
	auto appendFrame = [&]()
	{
		if (!compositor.beginWritePass())
			throw runtime_error("Failed to begin write pass.");
		auto first = compositor.nextDrawSequence(), second = compositor.nextDrawSequence();
		if (first != 1 || second != 2)
			throw runtime_error("Draw sequence is not reset.");
		compositor.append(uint2(1, 1), 0.5f, red, first, alphaBlend);
		compositor.append(uint2(1, 1), 0.2f, blue, second, alphaBlend);
		compositor.append(uint2(2, 3), 0.4f, blue, first, alphaBlend);
		compositor.append(uint2(2, 3), 0.6f, red, second, alphaBlend);
		compositor.beginCompositePass();
	};

	appendFrame();
	compositor.composite(opaqueColor, opaqueDepth);
	auto serialResult = compositor.getCompositeBuffer();

	ColorBuffer backbuffer(frameSize);
	compositor.present(backbuffer);
	compositor.endFrame();

	auto expected = blend(alphaBlend, toStored(blue), float4(0.0f, 1.0f, 0.0f, 1.0f));
	if (!isNear(backbuffer.get(uint2(1, 1)), expected))
		throw runtime_error("Bad composited pixel with hidden fragment.");
	expected = blend(alphaBlend, toStored(blue), blend(alphaBlend, toStored(red), float4(0.0f, 0.0f, 0.0f, 1.0f)));
	if (!isNear(backbuffer.get(uint2(2, 3)), expected))
		throw runtime_error("Bad composited pixel order.");
	if (!isNear(backbuffer.get(uint2(0, 0)), float4(0.0f, 0.0f, 0.0f, 1.0f), 0.0f))
		throw runtime_error("Empty pixel is not opaque color.");

	const auto& stats = compositor.getStats();
	if (stats.appendedCount != 4 || stats.droppedCount != 0 || 
		stats.coveredPixelCount != 2 || stats.maxPixelFragmentCount != 2)
	{
		throw runtime_error("Bad frame statistics.");
	}

	ThreadPool threadPool("TEST", 3);
	appendFrame();
	compositor.composite(opaqueColor, opaqueDepth, &threadPool);
	for (uint32 i = 0; i < serialResult.getTexelCount(); i++)
	{
		if (!isNear(compositor.getCompositeBuffer()[i], serialResult[i], 0.0f))
			throw runtime_error("Parallel composite differs from serial one.");
	}
	if (compositor.getStats().coveredPixelCount != 2 || compositor.getStats().maxPixelFragmentCount != 2)
		throw runtime_error("Bad parallel frame statistics.");
	compositor.present(backbuffer);
	compositor.endFrame();

	// Nothing is retained across frames.
	compositor.beginWritePass();
	compositor.beginCompositePass();
	compositor.composite(opaqueColor, opaqueDepth, &threadPool);
	if (!isNear(compositor.getCompositeBuffer().get(uint2(2, 3)), float4(0.0f, 0.0f, 0.0f, 1.0f), 0.0f) ||
		compositor.getStats().appendedCount != 0 || compositor.getStats().coveredPixelCount != 0)
	{
		throw runtime_error("Previous frame fragments are retained.");
	}

	ColorBuffer wrongBuffer(uint2(2, 2));
	if (!isThrowing([&]() { compositor.composite(wrongBuffer, opaqueDepth); }))
		throw runtime_error("Mismatched opaque buffer is accepted.");
	if (!isThrowing([&]() { compositor.present(wrongBuffer); }))
		throw runtime_error("Mismatched backbuffer is accepted.");
	compositor.present(backbuffer);
	compositor.endFrame();
}

static void testExhaustedFrame()
{
	Compositor compositor(uint2(1, 1), FeatureLevel::Level11_1);
	auto opaqueBlack = float4(0.0f, 0.0f, 0.0f, 1.0f);
	ColorBuffer opaqueColor(uint2(1, 1), opaqueBlack);
	DepthBuffer opaqueDepth(uint2(1, 1), 1.0f);

	// Appended fragments get nearer one by one, so back-to-front order matches append order.
	auto expected = opaqueBlack;
	compositor.beginWritePass();
	for (uint32 i = 0; i < maxFragments; i++)
	{
		auto color = float4((float)i / maxFragments, 0.2f, 0.5f, 0.25f);
		if (!compositor.append(0, 0.9f - i * 0.01f, color, compositor.nextDrawSequence(), 
			(uint8)BlendOperation::Add, (uint8)BlendFactor::SrcAlpha, (uint8)BlendFactor::OneMinusSrcAlpha))
		{
			throw runtime_error("Failed to append fragment before pool exhaustion.");
		}
		expected = blend(alphaBlend, toStored(color), expected);
	}

	// Nearer opaque green covers everything if it ever reaches the composite.
	for (uint32 i = 0; i < 8; i++)
	{
		if (compositor.append(0, 0.1f, float4(0.0f, 1.0f, 0.0f, 1.0f), compositor.nextDrawSequence(), 
			(uint8)BlendOperation::Add, (uint8)BlendFactor::One, (uint8)BlendFactor::Zero))
		{
			throw runtime_error("Fragment appended to the exhausted pool.");
		}
	}
	compositor.beginCompositePass();
	compositor.composite(opaqueColor, opaqueDepth);

	const auto& stats = compositor.getStats();
	if (stats.appendedCount != maxFragments || stats.droppedCount != 8 || 
		stats.coveredPixelCount != 1 || stats.maxPixelFragmentCount != maxFragments)
	{
		throw runtime_error("Bad exhausted frame statistics.");
	}
	if (!isNear(compositor.getCompositeBuffer()[0], expected, 0.001f))
		throw runtime_error("Bad exhausted frame composite color.");
}

static void testReversedDepth()
{
	auto frameSize = uint2(2, 1);
	Compositor compositor(frameSize, FeatureLevel::Level12_1, DepthConvention::Reversed);
	if (compositor.getDepthConvention() != DepthConvention::Reversed)
		throw runtime_error("Bad compositor depth convention.");

	ColorBuffer opaqueColor(frameSize, float4(1.0f, 1.0f, 1.0f, 1.0f));
	DepthBuffer opaqueDepth(frameSize, getClearDepth(DepthConvention::Reversed));
	opaqueDepth.set(uint2(1, 0), 0.5f);

	compositor.beginWritePass();
	auto sequence = compositor.nextDrawSequence();
	auto black = float4(0.0f, 0.0f, 0.0f, 1.0f);
	compositor.append(uint2(0, 0), 0.25f, black, sequence, alphaBlend);
	compositor.append(uint2(1, 0), 0.25f, black, sequence, alphaBlend);
	compositor.beginCompositePass();
	compositor.composite(opaqueColor, opaqueDepth);

	const auto& result = compositor.getCompositeBuffer();
	if (!isNear(result.get(uint2(0, 0)), black) || !isNear(result.get(uint2(1, 0)), float4(1.0f)))
		throw runtime_error("Bad reversed depth visibility.");
}

int main()
{
	testCapability();
	testFrameStates();
	testComposite();
	testExhaustedFrame();
	testReversedDepth();
}
