// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include <cstddef>
#include <cstdint>
#include <exception>

namespace Pg {

/**
 * Events reported by #ArrayScanner::Step().
 */
enum class ArrayOpcode : uint_least8_t {
	/**
	 * An uninteresting byte.
	 */
	CONTINUE,

	/**
	 * The first byte of a quoted or bare literal.  Its end is
	 * implied by the next opcode which is not #CONTINUE.
	 */
	BEGIN_LITERAL,

	BEGIN_ARRAY,

	/**
	 * A comma has completed an array element.
	 */
	ARRAY_VALUE,

	/**
	 * A closing brace has completed an array (and its last
	 * element, if there was one).
	 */
	END_ARRAY,

	/**
	 * A space outside of a literal which can be ignored.  This is
	 * the last "continue" code.
	 */
	SKIP_SPACE,

	/**
	 * The top-level value ended *before* the byte that was just
	 * passed.  This is the first "stop" code.
	 */
	END,

	/**
	 * A syntax error; see ArrayScanner::GetError().
	 */
	ERROR,
};

/**
 * A state machine which scans a PostgreSQL array literal one byte at
 * a time.  It knows nothing about the destination type; it only
 * reports where literals and arrays begin and end.
 *
 * Call Reset(), then pass bytes to Step() one by one, and call
 * EndOfInput() if the input runs out.
 */
class ArrayScanner {
public:
	/**
	 * Nesting arrays deeper than this is a syntax error.  It
	 * bounds the recursion of the decoder.
	 */
	static constexpr std::size_t MAX_DEPTH = 1000;

private:
	enum class State : uint_least8_t {
		BEGIN_VALUE,
		BEGIN_VALUE_OR_EMPTY,
		END_VALUE,
		END_TOP,
		IN_STRING,
		IN_STRING_ESCAPE,
		IN_BARE,
		ERROR,
		REDO,
	};

	State state = State::BEGIN_VALUE;

	/**
	 * The saved state and opcode for the one-byte undo.
	 */
	State redo_state;
	ArrayOpcode redo_code;
	bool redo = false;

	/**
	 * Has the top-level value ended?
	 */
	bool end_top = false;

	/**
	 * The number of arrays we're currently in.
	 */
	std::size_t depth = 0;

	/**
	 * Total number of bytes consumed; used for error messages.
	 */
	std::size_t n_bytes = 0;

	std::exception_ptr error;

public:
	void Reset() noexcept;

	ArrayOpcode Step(char ch);

	/**
	 * Tell the scanner that there is no more input.  Returns
	 * #ArrayOpcode::END if the top-level value is complete,
	 * #ArrayOpcode::ERROR otherwise.
	 */
	ArrayOpcode EndOfInput();

	/**
	 * Let the next Step() return the given opcode instead of
	 * consuming a byte.  Only one level of undo is supported.
	 */
	void Undo(ArrayOpcode op) noexcept;

	std::size_t GetDepth() const noexcept {
		return depth;
	}

	bool IsEndTop() const noexcept {
		return end_top;
	}

	/**
	 * Returns the #ArraySyntaxError after #ArrayOpcode::ERROR
	 * has been returned.
	 */
	std::exception_ptr GetError() const noexcept {
		return error;
	}

private:
	ArrayOpcode Dispatch(unsigned char ch);

	ArrayOpcode BeginValue(unsigned char ch);
	ArrayOpcode BeginValueOrEmpty(unsigned char ch);
	ArrayOpcode EndValue(unsigned char ch);
	ArrayOpcode InString(unsigned char ch);
	ArrayOpcode InBare(unsigned char ch);

	void PopArray() noexcept;

	ArrayOpcode Fail(unsigned char ch, const char *context);
};

} /* namespace Pg */
