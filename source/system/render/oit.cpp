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
#include "vitrine/profiler.hpp"

using namespace vitrine;
using namespace vitrine::oit;

//**********************************************************************************************************************
OitRenderSystem::OitRenderSystem(uint2 frameSize, FeatureLevel featureLevel, bool setSingleton) : 
	Singleton(setSingleton), compositor(frameSize, featureLevel), colorBuffer(frameSize, float4::zero), 
	depthBuffer(frameSize, getClearDepth(DepthConvention::Standard)), backbuffer(frameSize, float4::zero)
{
	auto manager = Manager::Instance::get();
	manager->registerEventAfter("Render", "Update");
	manager->registerEventAfter("Present", "Render");
	manager->registerEvent("OpaqueRender");
	manager->registerEvent("TranslucentRender");
	manager->registerEvent("FallbackTranslucentRender");

	ECSM_SUBSCRIBE_TO_EVENT("Init", OitRenderSystem::init);
	ECSM_SUBSCRIBE_TO_EVENT("Deinit", OitRenderSystem::deinit);
}
OitRenderSystem::~OitRenderSystem()
{
	if (Manager::Instance::get()->isRunning)
	{
		ECSM_UNSUBSCRIBE_FROM_EVENT("Init", OitRenderSystem::init);
		ECSM_UNSUBSCRIBE_FROM_EVENT("Deinit", OitRenderSystem::deinit);

		auto manager = Manager::Instance::get();
		manager->unregisterEvent("Render");
		manager->unregisterEvent("Present");
		manager->unregisterEvent("OpaqueRender");
		manager->unregisterEvent("TranslucentRender");
		manager->unregisterEvent("FallbackTranslucentRender");
	}

	unsetSingleton();
}

//**********************************************************************************************************************
void OitRenderSystem::init()
{
	auto settingsSystem = SettingsSystem::Instance::tryGet();
	if (settingsSystem)
	{
		auto useReverseZ = false;
		settingsSystem->getBool("oit.useReverseZ", useReverseZ);
		compositor.setDepthConvention(useReverseZ ? DepthConvention::Reversed : DepthConvention::Standard);

		if (compositor.isCapable())
		{
			auto isEnabled = true;
			settingsSystem->getBool("oit.isEnabled", isEnabled);
			compositor.setEnabled(isEnabled);
		}
	}

	depthBuffer.fill(getClearDepth(compositor.getDepthConvention()));

	ECSM_SUBSCRIBE_TO_EVENT("Render", OitRenderSystem::render);
	ECSM_SUBSCRIBE_TO_EVENT("Present", OitRenderSystem::present);
}
void OitRenderSystem::deinit()
{
	if (Manager::Instance::get()->isRunning)
	{
		ECSM_UNSUBSCRIBE_FROM_EVENT("Render", OitRenderSystem::render);
		ECSM_UNSUBSCRIBE_FROM_EVENT("Present", OitRenderSystem::present);
	}
}

//**********************************************************************************************************************
void OitRenderSystem::render()
{
	VITRINE_CPU_ZONE_SCOPED("OIT Render");

	auto manager = Manager::Instance::get();
	auto threadSystem = ThreadSystem::Instance::tryGet();
	auto threadPool = threadSystem ? &threadSystem->getForegroundPool() : nullptr;

	colorBuffer.fill(clearColor);
	depthBuffer.fill(getClearDepth(compositor.getDepthConvention()));

	auto event = &manager->getEvent("OpaqueRender");
	if (event->hasSubscribers())
	{
		VITRINE_CPU_ZONE_SCOPED("Opaque Render");
		event->run();
	}

	if (compositor.beginWritePass())
	{
		event = &manager->getEvent("TranslucentRender");
		if (event->hasSubscribers())
		{
			VITRINE_CPU_ZONE_SCOPED("Translucent Render");
			event->run();
		}

		if (threadPool)
			threadPool->wait();

		if (compositor.beginCompositePass())
			compositor.composite(colorBuffer, depthBuffer, threadPool);
	}
	else
	{
		event = &manager->getEvent("FallbackTranslucentRender");
		if (event->hasSubscribers())
		{
			VITRINE_CPU_ZONE_SCOPED("Fallback Translucent Render");
			event->run();
		}
	}
}

void OitRenderSystem::present()
{
	VITRINE_CPU_ZONE_SCOPED("OIT Present");

	if (compositor.getState() == FrameState::CompositePass)
	{
		compositor.present(backbuffer);
		compositor.endFrame();
	}
	else
	{
		std::copy(colorBuffer.getData(), colorBuffer.getData() + colorBuffer.getTexelCount(), backbuffer.getData());
	}
	frameIndex++;
}

//**********************************************************************************************************************
void OitRenderSystem::resize(uint2 frameSize)
{
	compositor.resize(frameSize);
	colorBuffer.resize(frameSize, clearColor);
	depthBuffer.resize(frameSize, getClearDepth(compositor.getDepthConvention()));
	backbuffer.resize(frameSize, clearColor);
	VITRINE_LOG_DEBUG("Resized OIT frame surfaces. (" + to_string(frameSize.x) + "x" + to_string(frameSize.y) + ")");
}
