// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>

namespace Pg {

/**
 * The array literal violates the grammar (unexpected character,
 * unterminated quote, unbalanced braces, trailing garbage).
 */
class ArraySyntaxError : public std::invalid_argument {
	std::size_t offset;

public:
	ArraySyntaxError(const std::string &_msg, std::size_t _offset)
		:std::invalid_argument(_msg), offset(_offset) {}

	/**
	 * Construct the message "invalid character 'x' CONTEXT".
	 */
	ArraySyntaxError(char ch, std::string_view context,
			 std::size_t _offset);

	/**
	 * The offset of the offending byte within the input.
	 */
	std::size_t GetOffset() const noexcept {
		return offset;
	}
};

/**
 * A well-formed literal which cannot be represented by the
 * destination type.
 */
class ArrayTypeError : public std::invalid_argument {
public:
	ArrayTypeError(std::string_view value, std::string_view type);
};

/**
 * The caller passed a destination which cannot be decoded into at
 * all (e.g. a null pointer).
 */
class InvalidArrayDestination : public std::invalid_argument {
public:
	using std::invalid_argument::invalid_argument;
};

/**
 * The decoder and the scanner disagree about the position in the
 * input.  This indicates a bug.
 */
class ArrayPhaseError : public std::logic_error {
public:
	ArrayPhaseError() noexcept
		:std::logic_error("array decoder out of sync") {}
};

} /* namespace Pg */
