// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include <boost/json/fwd.hpp>

#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <vector>

namespace Pg {

/**
 * How a destination type is filled by the array decoder.
 */
enum class ArrayShape : uint_least8_t {
	/**
	 * A fixed-size array (std::array, C array): excess elements
	 * are discarded, missing elements are value-initialized.
	 */
	FIXED,

	/**
	 * A std::vector which grows as needed.
	 */
	GROWABLE,

	/**
	 * A boost::json::value; the type of each element is derived
	 * from the literal.
	 */
	DYNAMIC,

	/**
	 * std::optional or std::unique_ptr; SQL NULL resets it.
	 */
	NULLABLE,

	/**
	 * std::vector<std::byte> filled from a base64 string.
	 */
	BINARY,

	STRING,
	BOOLEAN,
	INTEGER,
	FLOAT,

	/**
	 * Anything else; decoding a value into it is a type error.
	 */
	UNSUPPORTED,
};

template<typename T>
struct FixedArrayTraits : std::false_type {};

template<typename T, std::size_t N>
struct FixedArrayTraits<std::array<T, N>> : std::true_type {
	using element_type = T;
	static constexpr std::size_t size = N;
};

template<typename T, std::size_t N>
struct FixedArrayTraits<T[N]> : std::true_type {
	using element_type = T;
	static constexpr std::size_t size = N;
};

template<typename T>
struct IsVector : std::false_type {};

template<typename T, typename A>
struct IsVector<std::vector<T, A>> : std::true_type {};

template<typename T>
struct IsNullable : std::false_type {};

template<typename T>
struct IsNullable<std::optional<T>> : std::true_type {};

template<typename T>
struct IsNullable<std::unique_ptr<T>> : std::true_type {};

template<typename T>
consteval ArrayShape
DetectArrayShape() noexcept
{
	if constexpr (std::is_same_v<T, bool>)
		return ArrayShape::BOOLEAN;
	else if constexpr (std::is_integral_v<T>)
		return ArrayShape::INTEGER;
	else if constexpr (std::is_floating_point_v<T>)
		return ArrayShape::FLOAT;
	else if constexpr (std::is_same_v<T, std::string>)
		return ArrayShape::STRING;
	else if constexpr (std::is_same_v<T, boost::json::value>)
		return ArrayShape::DYNAMIC;
	else if constexpr (std::is_same_v<T, std::vector<std::byte>>)
		return ArrayShape::BINARY;
	else if constexpr (IsVector<T>::value)
		return ArrayShape::GROWABLE;
	else if constexpr (FixedArrayTraits<T>::value)
		return ArrayShape::FIXED;
	else if constexpr (IsNullable<T>::value)
		return ArrayShape::NULLABLE;
	else
		return ArrayShape::UNSUPPORTED;
}

template<typename T>
inline constexpr ArrayShape ArrayShapeOf = DetectArrayShape<std::remove_cv_t<T>>();

/**
 * Is this a shape which accepts an array literal?
 */
constexpr bool
IsArrayShaped(ArrayShape shape) noexcept
{
	return shape == ArrayShape::FIXED || shape == ArrayShape::GROWABLE;
}

/**
 * Calculate the new capacity of a growable destination which has
 * run out of space.
 */
constexpr std::size_t
GrowArrayCapacity(std::size_t capacity) noexcept
{
	const std::size_t new_capacity = capacity + capacity / 2;
	return new_capacity < 4 ? 4 : new_capacity;
}

} /* namespace Pg */
