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
 * @brief Frame surface (color, depth) storage functions.
 */

#pragma once
#include "vitrine/defines.hpp"
#include "math/vector.hpp"

#include <vector>
#include <algorithm>

namespace vitrine
{

/**
 * @brief Depth buffer value convention.
 * 
 * @details
 * Reversed depth maps the near plane to 1.0 and the far plane to 0.0, which spreads floating point precision 
 * more evenly across the view distance. Every depth comparison in the compositor goes through this convention.
 */
enum class DepthConvention : uint8
{
	Standard, /**< Near = 0.0, far = 1.0, cleared to 1.0. */
	Reversed, /**< Near = 1.0, far = 0.0, cleared to 0.0. */
	Count     /**< Depth convention type count. */
};

/**
 * @brief Returns depth buffer clear value for the specified convention. (Farthest depth)
 * @param convention target depth convention
 */
static constexpr float getClearDepth(DepthConvention convention) noexcept
{
	return convention == DepthConvention::Reversed ? 0.0f : 1.0f;
}
/**
 * @brief Returns true if depth a is strictly farther from the viewer than depth b.
 * 
 * @param a first depth value
 * @param b second depth value
 * @param convention target depth convention
 */
static constexpr bool isFarther(float a, float b, DepthConvention convention) noexcept
{
	return convention == DepthConvention::Reversed ? a < b : a > b;
}

/***********************************************************************************************************************
 * @brief Row-major two dimensional texel storage.
 * @tparam T texel data type
 */
template<typename T>
class ImageBuffer final
{
	vector<T> texels;
	uint2 size = uint2::zero;
public:
	/**
	 * @brief Creates a new empty image buffer.
	 */
	ImageBuffer() = default;
	/**
	 * @brief Creates a new image buffer filled with the specified value.
	 * 
	 * @param size image size in texels
	 * @param value initial texel value
	 */
	explicit ImageBuffer(uint2 size, const T& value = T()) : texels((psize)size.x * size.y, value), size(size) { }

	/**
	 * @brief Returns image size in texels.
	 */
	uint2 getSize() const noexcept { return size; }
	/**
	 * @brief Returns total image texel count.
	 */
	uint32 getTexelCount() const noexcept { return size.x * size.y; }
	/**
	 * @brief Returns row-major texel index of the specified pixel.
	 * @param pixel target pixel coordinate
	 */
	uint32 getIndex(uint2 pixel) const noexcept
	{
		VITRINE_ASSERT(pixel.x < size.x && pixel.y < size.y);
		return pixel.y * size.x + pixel.x;
	}

	/**
	 * @brief Returns texel value at the specified pixel.
	 * @param pixel target pixel coordinate
	 */
	const T& get(uint2 pixel) const noexcept { return texels[getIndex(pixel)]; }
	/**
	 * @brief Sets texel value at the specified pixel.
	 * 
	 * @param pixel target pixel coordinate
	 * @param[in] value new texel value
	 */
	void set(uint2 pixel, const T& value) noexcept { texels[getIndex(pixel)] = value; }

	T& operator[](uint32 index) noexcept { VITRINE_ASSERT(index < texels.size()); return texels[index]; }
	const T& operator[](uint32 index) const noexcept { VITRINE_ASSERT(index < texels.size()); return texels[index]; }

	T* getData() noexcept { return texels.data(); }
	const T* getData() const noexcept { return texels.data(); }

	/**
	 * @brief Sets all texels to the specified value.
	 * @param[in] value target texel value
	 */
	void fill(const T& value) { std::fill(texels.begin(), texels.end(), value); }
	/**
	 * @brief Changes image size and fills it with the specified value.
	 * @warning Previous texel content is lost.
	 * 
	 * @param size new image size in texels
	 * @param[in] value initial texel value
	 */
	void resize(uint2 size, const T& value = T())
	{
		this->texels.assign((psize)size.x * size.y, value);
		this->size = size;
	}
};

using ColorBuffer = ImageBuffer<float4>; /**< Normalized RGBA color surface. */
using DepthBuffer = ImageBuffer<float>;  /**< Scalar depth surface. */

} // namespace vitrine
