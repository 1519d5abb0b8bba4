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

#include "vitrine/oit/blend.hpp"

using namespace vitrine;
using namespace vitrine::oit;

const float4 vitrine::oit::blendDiagnosticColor = float4(1.0f, 0.0f, 0.0f, 1.0f);

namespace
{

using FactorFunction = float4(*)(float4 src, float4 dst);
using CombineFunction = float4(*)(float4 src, float4 dst);

// Indexed by (BlendFactor - 1).
const FactorFunction factorFunctions[blendFactorCount] =
{
	[](float4, float4) { return float4(0.0f); },
	[](float4, float4) { return float4(1.0f); },
	[](float4 src, float4) { return src; },
	[](float4 src, float4) { return float4(1.0f) - src; },
	[](float4 src, float4) { return float4(src.w); },
	[](float4 src, float4) { return float4(1.0f - src.w); },
	[](float4, float4 dst) { return float4(dst.w); },
	[](float4, float4 dst) { return float4(1.0f - dst.w); },
	[](float4, float4 dst) { return dst; },
	[](float4, float4 dst) { return float4(1.0f) - dst; },
	[](float4 src, float4 dst)
	{
		auto f = std::min(src.w, 1.0f - dst.w);
		return float4(f, f, f, 1.0f);
	},
};

// Indexed by (BlendOperation - 1). ReverseSubtract is computed as src - dst, same as Subtract.
const CombineFunction combineFunctions[blendOperationCount] =
{
	[](float4 src, float4 dst) { return src + dst; },
	[](float4 src, float4 dst) { return src - dst; },
	[](float4 src, float4 dst) { return src - dst; },
	[](float4 src, float4 dst) { return min(src, dst); },
	[](float4 src, float4 dst) { return max(src, dst); },
};

constexpr string_view blendFactorNames[blendFactorCount] =
{
	"zero", "one", "srcColor", "oneMinusSrcColor", "srcAlpha", "oneMinusSrcAlpha",
	"dstAlpha", "oneMinusDstAlpha", "dstColor", "oneMinusDstColor", "srcAlphaSaturate"
};
constexpr string_view blendOperationNames[blendOperationCount] =
{
	"add", "subtract", "reverseSubtract", "minimum", "maximum"
};

// Legacy material blend mode index to factor.
constexpr BlendFactor materialBlendFactors[8] =
{
	BlendFactor::Zero, BlendFactor::One,
	BlendFactor::SrcColor, BlendFactor::OneMinusSrcColor,
	BlendFactor::SrcAlpha, BlendFactor::OneMinusSrcAlpha,
	BlendFactor::DstAlpha, BlendFactor::OneMinusDstAlpha,
};

} // namespace

//**********************************************************************************************************************
float4 oit::blendFactor(BlendFactor mode, float4 srcColor, float4 dstColor) noexcept
{
	if (!isValidBlendFactor((uint8)mode))
		return blendDiagnosticColor;
	return factorFunctions[(uint8)mode - 1](srcColor, dstColor);
}
float4 oit::blendCombine(BlendOperation operation, float4 srcContribution, float4 dstContribution) noexcept
{
	if (!isValidBlendOperation((uint8)operation))
		return blendDiagnosticColor;
	return combineFunctions[(uint8)operation - 1](srcContribution, dstContribution);
}

float4 oit::blend(BlendOperation operation, BlendFactor srcFactor, 
	BlendFactor dstFactor, float4 srcColor, float4 dstColor) noexcept
{
	auto srcContribution = srcColor * blendFactor(srcFactor, srcColor, dstColor);
	auto dstContribution = dstColor * blendFactor(dstFactor, srcColor, dstColor);
	auto result = blendCombine(operation, srcContribution, dstContribution);
	result.w = 1.0f;
	return result;
}

//**********************************************************************************************************************
BlendFactor oit::toMaterialBlendFactor(uint8 materialIndex)
{
	if (materialIndex >= 8)
		throw VitrineError("Unknown legacy material blend mode index. (" + to_string(materialIndex) + ")");
	return materialBlendFactors[materialIndex];
}
BlendFactor oit::toBlendFactor(string_view blendFactor)
{
	for (uint8 i = 0; i < blendFactorCount; i++)
	{
		if (blendFactorNames[i] == blendFactor)
			return (BlendFactor)(i + 1);
	}
	throw VitrineError("Unknown blend factor type. (" + string(blendFactor) + ")");
}
BlendOperation oit::toBlendOperation(string_view blendOperation)
{
	for (uint8 i = 0; i < blendOperationCount; i++)
	{
		if (blendOperationNames[i] == blendOperation)
			return (BlendOperation)(i + 1);
	}
	throw VitrineError("Unknown blend operation type. (" + string(blendOperation) + ")");
}

string_view oit::toString(BlendFactor blendFactor) noexcept
{
	if (!isValidBlendFactor((uint8)blendFactor))
		return "unknown";
	return blendFactorNames[(uint8)blendFactor - 1];
}
string_view oit::toString(BlendOperation blendOperation) noexcept
{
	if (!isValidBlendOperation((uint8)blendOperation))
		return "unknown";
	return blendOperationNames[(uint8)blendOperation - 1];
}
