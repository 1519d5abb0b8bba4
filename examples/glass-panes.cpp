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

#include "vitrine/main.hpp"
#include "vitrine/system/log.hpp"
#include "vitrine/system/thread.hpp"
#include "vitrine/system/settings.hpp"
#include "vitrine/system/render/oit.hpp"

#include <fstream>

using namespace ecsm;
using namespace vitrine;
using namespace vitrine::oit;

struct Pane final
{
	uint2 min = uint2::zero;
	uint2 max = uint2::zero;
	float depth = 0.0f;
	float4 color = float4::zero;
	BlendMode blendMode = {};
};

/**
 * @brief Draws overlapping translucent panes over a checkerboard, nearest pane first.
 */
class GlassSceneSystem final : public System
{
	vector<Pane> panes;
public:
	GlassSceneSystem()
	{
		// Legacy material blend indices. (4 = srcAlpha, 5 = oneMinusSrcAlpha, 1 = one, 3 = oneMinusSrcColor)
		panes.push_back({ uint2(8, 8), uint2(40, 40), 0.3f, float4(1.0f, 0.2f, 0.2f, 0.5f), 
			BlendMode(BlendOperation::Add, toMaterialBlendFactor(4), toMaterialBlendFactor(5)) });
		panes.push_back({ uint2(24, 16), uint2(56, 48), 0.5f, float4(0.1f, 0.6f, 0.1f, 1.0f), 
			BlendMode(BlendOperation::Add, toMaterialBlendFactor(1), toMaterialBlendFactor(1)) });
		panes.push_back({ uint2(16, 28), uint2(48, 60), 0.7f, float4(0.3f, 0.3f, 1.0f, 0.6f), 
			BlendMode(BlendOperation::Add, toMaterialBlendFactor(4), toMaterialBlendFactor(3)) });

		ECSM_SUBSCRIBE_TO_EVENT("OpaqueRender", GlassSceneSystem::opaqueRender);
		ECSM_SUBSCRIBE_TO_EVENT("TranslucentRender", GlassSceneSystem::translucentRender);
		ECSM_SUBSCRIBE_TO_EVENT("FallbackTranslucentRender", GlassSceneSystem::fallbackTranslucentRender);
	}
	~GlassSceneSystem() final
	{
		if (Manager::Instance::get()->isRunning)
		{
			ECSM_UNSUBSCRIBE_FROM_EVENT("OpaqueRender", GlassSceneSystem::opaqueRender);
			ECSM_UNSUBSCRIBE_FROM_EVENT("TranslucentRender", GlassSceneSystem::translucentRender);
			ECSM_UNSUBSCRIBE_FROM_EVENT("FallbackTranslucentRender", GlassSceneSystem::fallbackTranslucentRender);
		}
	}

	void opaqueRender()
	{
		auto oitSystem = OitRenderSystem::Instance::get();
		auto& colorBuffer = oitSystem->getColorBuffer();
		auto& depthBuffer = oitSystem->getDepthBuffer();
		auto frameSize = colorBuffer.getSize();
		auto isReversed = oitSystem->getCompositor().getDepthConvention() == DepthConvention::Reversed;

		for (uint32 y = 0; y < frameSize.y; y++)
		{
			for (uint32 x = 0; x < frameSize.x; x++)
			{
				auto isDark = ((x / 8) + (y / 8)) % 2 == 0;
				colorBuffer.set(uint2(x, y), isDark ? float4(0.2f, 0.2f, 0.2f, 1.0f) : float4(0.8f, 0.8f, 0.8f, 1.0f));
			}
		}

		// Opaque pillar cutting through the middle pane.
		auto pillarDepth = isReversed ? 0.4f : 0.6f;
		for (uint32 y = 0; y < frameSize.y; y++)
		{
			for (uint32 x = 30; x < 34; x++)
			{
				colorBuffer.set(uint2(x, y), float4(0.9f, 0.7f, 0.1f, 1.0f));
				depthBuffer.set(uint2(x, y), pillarDepth);
			}
		}
	}

	void translucentRender()
	{
		auto oitSystem = OitRenderSystem::Instance::get();
		auto& threadPool = ThreadSystem::Instance::get()->getForegroundPool();
		auto isReversed = oitSystem->getCompositor().getDepthConvention() == DepthConvention::Reversed;

		for (const auto& pane : panes)
		{
			auto drawSequence = oitSystem->nextDrawSequence();
			auto depth = isReversed ? 1.0f - pane.depth : pane.depth;
			threadPool.addItems([oitSystem, pane, depth, drawSequence](const ThreadPool::Task& task)
			{
				for (uint32 y = pane.min.y + task.getItemOffset(); y < pane.min.y + task.getItemCount(); y++)
				{
					for (uint32 x = pane.min.x; x < pane.max.x; x++)
						oitSystem->appendFragment(uint2(x, y), depth, pane.color, drawSequence, pane.blendMode);
				}
			},
			pane.max.y - pane.min.y);
		}
	}

	// Painter's algorithm, farthest pane first.
	void fallbackTranslucentRender()
	{
		auto& colorBuffer = OitRenderSystem::Instance::get()->getColorBuffer();
		for (auto i = panes.rbegin(); i != panes.rend(); i++)
		{
			for (uint32 y = i->min.y; y < i->max.y; y++)
			{
				for (uint32 x = i->min.x; x < i->max.x; x++)
				{
					auto pixel = uint2(x, y);
					colorBuffer.set(pixel, blend(i->blendMode, i->color, colorBuffer.get(pixel)));
				}
			}
		}
	}
};

static void writeImage(const fs::path& filePath, const ColorBuffer& image)
{
	std::ofstream fileStream(filePath, ios::out | ios::binary);
	if (!fileStream.is_open())
		throw VitrineError("Failed to open image file. (path: " + filePath.generic_string() + ")");

	auto size = image.getSize();
	fileStream << "P6\n" << size.x << " " << size.y << "\n255\n";
	for (uint32 i = 0; i < image.getTexelCount(); i++)
	{
		auto color = Color(min(max(image[i], float4(0.0f)), float4(1.0f)));
		fileStream.put((char)color.r);
		fileStream.put((char)color.g);
		fileStream.put((char)color.b);
	}

	if (!fileStream.good())
		throw VitrineError("Failed to write image file. (path: " + filePath.generic_string() + ")");
}

void entryPoint()
{
	auto manager = new Manager();
	manager->createSystem<LogSystem>();
	manager->createSystem<SettingsSystem>();
	manager->createSystem<ThreadSystem>();
	manager->createSystem<OitRenderSystem>(uint2(64, 64), FeatureLevel::Level11_1);
	manager->createSystem<GlassSceneSystem>();
	manager->initialize();

	manager->runEvent("Render");
	manager->runEvent("Present");

	auto oitSystem = manager->get<OitRenderSystem>();
	const auto& stats = oitSystem->getCompositor().getStats();
	VITRINE_LOG_INFO("Rendered glass panes. (fragments: " + to_string(stats.appendedCount) + 
		", coveredPixels: " + to_string(stats.coveredPixelCount) + 
		", depthComplexity: " + to_string(stats.maxPixelFragmentCount) + ")");

	writeImage("glass-panes.ppm", oitSystem->getBackbuffer());
	delete manager;
}

VITRINE_DECLARE_MAIN(entryPoint)
