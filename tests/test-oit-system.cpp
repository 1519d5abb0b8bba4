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

#include "vitrine/system/render/oit.hpp"
#include "vitrine/system/settings.hpp"
#include "vitrine/system/thread.hpp"
#include "vitrine/system/log.hpp"

#include <cmath>
#include <memory>

using namespace vitrine;
using namespace vitrine::oit;

static const auto opaqueBlue = float4(0.0f, 0.0f, 0.5f, 1.0f);
static const auto translucentRed = float4(1.0f, 0.0f, 0.0f, 0.5f);
static const auto translucentGreen = float4(0.0f, 1.0f, 0.0f, 0.5f);

static bool isNear(float4 a, float4 b, float tolerance = 0.0001f)
{
	return std::abs(a.x - b.x) <= tolerance && std::abs(a.y - b.y) <= tolerance &&
		std::abs(a.z - b.z) <= tolerance && std::abs(a.w - b.w) <= tolerance;
}
static float4 toStored(float4 color)
{
	return unpackFragmentColor(packFragmentColor(color));
}

/**
 * @brief Draws a blue opaque background and two full screen translucent layers at the same depth.
 * @details Pixel (0, 0) has a near opaque surface which hides both layers.
 */
class TestSceneSystem final : public System
{
public:
	uint32 opaqueCount = 0;
	uint32 translucentCount = 0;
	uint32 fallbackCount = 0;

	TestSceneSystem()
	{
		ECSM_SUBSCRIBE_TO_EVENT("OpaqueRender", TestSceneSystem::opaqueRender);
		ECSM_SUBSCRIBE_TO_EVENT("TranslucentRender", TestSceneSystem::translucentRender);
		ECSM_SUBSCRIBE_TO_EVENT("FallbackTranslucentRender", TestSceneSystem::fallbackTranslucentRender);
	}
	~TestSceneSystem() final
	{
		if (Manager::Instance::get()->isRunning)
		{
			ECSM_UNSUBSCRIBE_FROM_EVENT("OpaqueRender", TestSceneSystem::opaqueRender);
			ECSM_UNSUBSCRIBE_FROM_EVENT("TranslucentRender", TestSceneSystem::translucentRender);
			ECSM_UNSUBSCRIBE_FROM_EVENT("FallbackTranslucentRender", TestSceneSystem::fallbackTranslucentRender);
		}
	}

	void opaqueRender()
	{
		auto oitSystem = OitRenderSystem::Instance::get();
		oitSystem->getColorBuffer().fill(opaqueBlue);
		oitSystem->getDepthBuffer().set(uint2(0, 0), 0.1f);
		opaqueCount++;
	}

	// Draws are submitted newest first from pool workers, the composite pass restores their order.
	void translucentRender()
	{
		auto oitSystem = OitRenderSystem::Instance::get();
		auto& threadPool = ThreadSystem::Instance::get()->getForegroundPool();
		auto redSequence = oitSystem->nextDrawSequence();
		auto greenSequence = oitSystem->nextDrawSequence();
		auto frameSize = oitSystem->getCompositor().getFrameSize();

		threadPool.addItems([=](const ThreadPool::Task& task)
		{
			for (uint32 y = task.getItemOffset(); y < task.getItemCount(); y++)
			{
				for (uint32 x = 0; x < frameSize.x; x++)
				{
					oitSystem->appendFragment(uint2(x, y), 0.6f, translucentGreen, greenSequence, BlendMode());
					oitSystem->appendFragment(uint2(x, y), 0.6f, translucentRed, redSequence, BlendMode());
				}
			}
		},
		frameSize.y);
		translucentCount++;
	}

	void fallbackTranslucentRender()
	{
		auto& colorBuffer = OitRenderSystem::Instance::get()->getColorBuffer();
		auto texelCount = colorBuffer.getTexelCount();
		for (uint32 i = 1; i < texelCount; i++)
		{
			colorBuffer[i] = blend(BlendMode(), translucentRed, colorBuffer[i]);
			colorBuffer[i] = blend(BlendMode(), translucentGreen, colorBuffer[i]);
		}
		fallbackCount++;
	}
};

//**********************************************************************************************************************
static void testOitFrames()
{
	auto manager = make_shared<Manager>();
	manager->createSystem<LogSystem>(fs::temp_directory_path() / "vitrine-test-oit", INFO_LOG_LEVEL);
	manager->createSystem<ThreadSystem>((uint32)3);
	manager->createSystem<OitRenderSystem>(uint2(5, 7), FeatureLevel::Level11_1);
	manager->createSystem<TestSceneSystem>();
	manager->initialize();

	auto oitSystem = OitRenderSystem::Instance::get();
	auto sceneSystem = manager->get<TestSceneSystem>();
	if (!oitSystem->isOitActive())
		throw runtime_error("OIT is not active on a capable device.");

	auto expected = blend(BlendMode(), toStored(translucentGreen), 
		blend(BlendMode(), toStored(translucentRed), opaqueBlue));

	for (uint32 frame = 0; frame < 3; frame++)
	{
		manager->runEvent("Render");
		manager->runEvent("Present");

		const auto& backbuffer = oitSystem->getBackbuffer();
		if (!isNear(backbuffer.get(uint2(0, 0)), opaqueBlue, 0.0f))
			throw runtime_error("Hidden translucent layers are visible.");
		for (uint32 i = 1; i < backbuffer.getTexelCount(); i++)
		{
			if (!isNear(backbuffer[i], expected))
				throw runtime_error("Bad composited OIT frame.");
		}

		const auto& stats = oitSystem->getCompositor().getStats();
		if (stats.appendedCount != 70 || stats.droppedCount != 0 || 
			stats.coveredPixelCount != 34 || stats.maxPixelFragmentCount != 2)
		{
			throw runtime_error("Bad OIT frame statistics.");
		}
		if (oitSystem->getCompositor().getState() != FrameState::Idle)
			throw runtime_error("Compositor is not idle after present.");
	}

	if (oitSystem->getFrameIndex() != 3 || sceneSystem->opaqueCount != 3 || 
		sceneSystem->translucentCount != 3 || sceneSystem->fallbackCount != 0)
	{
		throw runtime_error("Bad OIT render event sequence.");
	}

	oitSystem->resize(uint2(2, 2));
	manager->runEvent("Render");
	manager->runEvent("Present");
	if (oitSystem->getBackbuffer().getTexelCount() != 4 || 
		!isNear(oitSystem->getBackbuffer().get(uint2(1, 1)), expected))
	{
		throw runtime_error("Bad frame after resize.");
	}
}

static void testFallbackFrames()
{
	auto manager = make_shared<Manager>();
	manager->createSystem<ThreadSystem>((uint32)2);
	manager->createSystem<OitRenderSystem>(uint2(3, 3), FeatureLevel::Level10_0);
	manager->createSystem<TestSceneSystem>();
	manager->initialize();

	auto oitSystem = OitRenderSystem::Instance::get();
	auto sceneSystem = manager->get<TestSceneSystem>();
	if (oitSystem->isOitActive() || oitSystem->getCompositor().isCapable())
		throw runtime_error("OIT is active on a legacy device.");

	manager->runEvent("Render");
	manager->runEvent("Present");

	if (sceneSystem->translucentCount != 0 || sceneSystem->fallbackCount != 1)
		throw runtime_error("Fallback translucency path is not used.");

	auto expected = blend(BlendMode(), translucentGreen, blend(BlendMode(), translucentRed, opaqueBlue));
	if (!isNear(oitSystem->getBackbuffer().get(uint2(2, 2)), expected) ||
		!isNear(oitSystem->getBackbuffer().get(uint2(0, 0)), opaqueBlue, 0.0f))
	{
		throw runtime_error("Bad fallback frame.");
	}
}

static void testSettings()
{
	auto settingsPath = fs::temp_directory_path() / "vitrine-test-settings.txt";

	{
		auto manager = make_shared<Manager>();
		manager->createSystem<SettingsSystem>(settingsPath);
		manager->createSystem<ThreadSystem>((uint32)2);
		manager->createSystem<OitRenderSystem>(uint2(2, 2), FeatureLevel::Level12_0);
		manager->createSystem<TestSceneSystem>();

		auto settingsSystem = SettingsSystem::Instance::get();
		settingsSystem->setBool("oit.isEnabled", false);
		settingsSystem->setBool("oit.useReverseZ", true);
		manager->initialize();

		auto oitSystem = OitRenderSystem::Instance::get();
		if (oitSystem->isOitActive() || !oitSystem->getCompositor().isCapable())
			throw runtime_error("OIT enable setting is ignored.");
		if (oitSystem->getCompositor().getDepthConvention() != DepthConvention::Reversed)
			throw runtime_error("Reverse depth setting is ignored.");

		manager->runEvent("Render");
		manager->runEvent("Present");
		if (manager->get<TestSceneSystem>()->fallbackCount != 1)
			throw runtime_error("Disabled OIT does not use fallback path.");

		uint32 intValue = 7;
		settingsSystem->getInt("test.intValue", intValue);
		auto floatValue = 0.5f;
		settingsSystem->getFloat("test.floatValue", floatValue);
		if (intValue != 7 || floatValue != 0.5f)
			throw runtime_error("Missing setting does not return default value.");
		settingsSystem->setInt("test.intValue", (int64)9);
		settingsSystem->getInt("test.intValue", intValue);
		settingsSystem->setFloat("test.floatValue", 0.25);
		settingsSystem->getFloat("test.floatValue", floatValue);
		if (intValue != 9 || floatValue != 0.25f)
			throw runtime_error("Setting value is not updated.");
	}

	std::error_code errorCode;
	fs::remove(settingsPath, errorCode);
}

int main()
{
	testOitFrames();
	testFallbackFrames();
	testSettings();
}
