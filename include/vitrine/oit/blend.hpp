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
 * @brief Legacy fixed-function blending emulation functions.
 * 
 * @details
 * Translucent fragments are no longer blended by the output merger when they are drawn, so the composite pass has 
 * to reproduce what the fixed-function blend stage would have done with the fragment's own blend state. Enumerant 
 * values follow the legacy fixed-function numbering because they are packed into the 4-bit fields of a fragment 
 * node control word. Zero and the values past the last enumerant are not part of the closed sets.
 */

#pragma once
#include "vitrine/defines.hpp"
#include "math/vector.hpp"

#include <string_view>

namespace vitrine::oit
{

/**
 * @brief Legacy framebuffer blending factors.
 * @details finalColor = (sourceColor * sourceFactor) op (destinationColor * destinationFactor)
 */
enum class BlendFactor : uint8
{
	Zero             = 1,  /**< (0, 0, 0, 0) */
	One              = 2,  /**< (1, 1, 1, 1) */
	SrcColor         = 3,  /**< (Rs, Gs, Bs, As) */
	OneMinusSrcColor = 4,  /**< (1 - Rs, 1 - Gs, 1 - Bs, 1 - As) */
	SrcAlpha         = 5,  /**< (As, As, As, As) */
	OneMinusSrcAlpha = 6,  /**< (1 - As, 1 - As, 1 - As, 1 - As) */
	DstAlpha         = 7,  /**< (Ad, Ad, Ad, Ad) */
	OneMinusDstAlpha = 8,  /**< (1 - Ad, 1 - Ad, 1 - Ad, 1 - Ad) */
	DstColor         = 9,  /**< (Rd, Gd, Bd, Ad) */
	OneMinusDstColor = 10, /**< (1 - Rd, 1 - Gd, 1 - Bd, 1 - Ad) */
	SrcAlphaSaturate = 11, /**< (f, f, f, 1); f = min(As, 1 - Ad) */
};
/**
 * @brief Legacy framebuffer blending operations.
 */
enum class BlendOperation : uint8
{
	Add             = 1, /**< finalColor = srcContribution + dstContribution */
	Subtract        = 2, /**< finalColor = srcContribution - dstContribution */
	ReverseSubtract = 3, /**< finalColor = srcContribution - dstContribution (Same as Subtract!) */
	Minimum         = 4, /**< finalColor = min(srcContribution, dstContribution) */
	Maximum         = 5, /**< finalColor = max(srcContribution, dstContribution) */
};

constexpr uint8 blendFactorCount = 11;   /**< Legacy blending factor count. */
constexpr uint8 blendOperationCount = 5; /**< Legacy blending operation count. */

/**
 * @brief Color returned for blend factors or operations outside the closed sets. (Opaque red)
 */
extern const float4 blendDiagnosticColor;

/**
 * @brief Fragment blend state packed into the node control word.
 */
struct BlendMode final
{
	BlendOperation operation = BlendOperation::Add;    /**< Color combine operation. */
	BlendFactor srcFactor = BlendFactor::SrcAlpha;     /**< Source color blending factor. */
	BlendFactor dstFactor = BlendFactor::OneMinusSrcAlpha; /**< Destination color blending factor. */

	BlendMode() = default;
	BlendMode(BlendOperation operation, BlendFactor srcFactor, BlendFactor dstFactor) noexcept :
		operation(operation), srcFactor(srcFactor), dstFactor(dstFactor) { }

	bool operator==(const BlendMode& m) const noexcept
	{
		return operation == m.operation && srcFactor == m.srcFactor && dstFactor == m.dstFactor;
	}
	bool operator!=(const BlendMode& m) const noexcept { return !(*this == m); }
};

/***********************************************************************************************************************
 * @brief Returns blending factor color for the specified mode.
 * @details Unknown mode values return @ref blendDiagnosticColor.
 * 
 * @param mode target blending factor
 * @param srcColor source (fragment) color
 * @param dstColor destination (accumulated) color
 */
float4 blendFactor(BlendFactor mode, float4 srcColor, float4 dstColor) noexcept;
/**
 * @brief Combines weighted source and destination colors with the specified operation.
 * @details Unknown operation values return @ref blendDiagnosticColor.
 * 
 * @param operation target blending operation
 * @param srcContribution source color multiplied by its factor
 * @param dstContribution destination color multiplied by its factor
 */
float4 blendCombine(BlendOperation operation, float4 srcContribution, float4 dstContribution) noexcept;

/**
 * @brief Blends source color onto the destination color the way legacy fixed-function hardware did.
 * @details Resulting alpha channel is always 1.0.
 * 
 * @param operation target blending operation
 * @param srcFactor source color blending factor
 * @param dstFactor destination color blending factor
 * @param srcColor source (fragment) color
 * @param dstColor destination (accumulated) color
 */
float4 blend(BlendOperation operation, BlendFactor srcFactor, 
	BlendFactor dstFactor, float4 srcColor, float4 dstColor) noexcept;
/**
 * @brief Blends source color onto the destination color using the blend mode.
 * 
 * @param[in] mode target fragment blend mode
 * @param srcColor source (fragment) color
 * @param dstColor destination (accumulated) color
 */
static float4 blend(const BlendMode& mode, float4 srcColor, float4 dstColor) noexcept
{
	return blend(mode.operation, mode.srcFactor, mode.dstFactor, srcColor, dstColor);
}

/***********************************************************************************************************************
 * @brief Returns true if value is one of the legacy blending factors.
 * @param value packed blending factor value
 */
static constexpr bool isValidBlendFactor(uint8 value) noexcept
{
	return value >= (uint8)BlendFactor::Zero && value <= (uint8)BlendFactor::SrcAlphaSaturate;
}
/**
 * @brief Returns true if value is one of the legacy blending operations.
 * @param value packed blending operation value
 */
static constexpr bool isValidBlendOperation(uint8 value) noexcept
{
	return value >= (uint8)BlendOperation::Add && value <= (uint8)BlendOperation::Maximum;
}

/**
 * @brief Returns blending factor stored in a legacy material.
 * @details Legacy materials store blending factors as 3-bit indices and are always combined with Add operation.
 * 
 * @param materialIndex legacy material blend mode index
 * @throw VitrineError on index outside of the legacy material table.
 */
BlendFactor toMaterialBlendFactor(uint8 materialIndex);
/**
 * @brief Returns blending factor from its name.
 * @param blendFactor target blending factor name string (camelCase)
 * @throw VitrineError on unknown blending factor.
 */
BlendFactor toBlendFactor(string_view blendFactor);
/**
 * @brief Returns blending operation from its name.
 * @param blendOperation target blending operation name string (camelCase)
 * @throw VitrineError on unknown blending operation.
 */
BlendOperation toBlendOperation(string_view blendOperation);

/**
 * @brief Returns blending factor name string. (camelCase)
 * @details Unknown values return "unknown".
 * @param blendFactor target blending factor
 */
string_view toString(BlendFactor blendFactor) noexcept;
/**
 * @brief Returns blending operation name string. (camelCase)
 * @details Unknown values return "unknown".
 * @param blendOperation target blending operation
 */
string_view toString(BlendOperation blendOperation) noexcept;

} // namespace vitrine::oit
