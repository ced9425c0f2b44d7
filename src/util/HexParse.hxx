// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include "CharUtil.hxx"

#include <concepts>
#include <cstdint>
#include <string_view>

constexpr int
ParseHexDigit(char ch) noexcept
{
	if (IsDigitASCII(ch))
		return ch - '0';
	else if (ch >= 'a' && ch <= 'f')
		return ch - 'a' + 0xa;
	else if (ch >= 'A' && ch <= 'F')
		return ch - 'A' + 0xa;
	else
		return -1;
}

/**
 * Parse the hex digits (upper or lower case) of a fixed-length
 * string to the given integer reference.
 *
 * @return the end of the parsed string on success, nullptr on error
 */
template<std::unsigned_integral T>
constexpr const char *
ParseHexFixed(const char *input, T &output) noexcept
{
	T value{};

	for (std::size_t j = 0; j < sizeof(T) * 2; ++j) {
		int digit = ParseHexDigit(*input++);
		if (digit < 0)
			return nullptr;

		value = (value << 4) | digit;
	}

	output = value;
	return input;
}

template<std::unsigned_integral T>
constexpr bool
ParseHexFixed(std::string_view input, T &output) noexcept
{
	return input.size() == sizeof(output) * 2 &&
		ParseHexFixed(input.data(), output) != nullptr;
}
