// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "ArrayScanner.hxx"
#include "ArrayError.hxx"

#include <cassert>

namespace Pg {

[[gnu::const]]
static constexpr bool
IsControlChar(unsigned char ch) noexcept
{
	return ch < 0x20;
}

void
ArrayScanner::Reset() noexcept
{
	state = State::BEGIN_VALUE;
	redo = false;
	end_top = false;
	depth = 0;
	n_bytes = 0;
	error = {};
}

ArrayOpcode
ArrayScanner::Step(char ch)
{
	/* the redo state returns the opcode of a byte which was
	   already counted */
	const bool consume = state != State::REDO;

	const auto op = Dispatch(static_cast<unsigned char>(ch));
	if (consume)
		++n_bytes;
	return op;
}

ArrayOpcode
ArrayScanner::EndOfInput()
{
	if (state == State::REDO) {
		redo = false;
		state = redo_state;
	}

	if (error)
		return ArrayOpcode::ERROR;

	if (end_top)
		return ArrayOpcode::END;

	if (state == State::IN_BARE && depth == 0) {
		/* a bare top-level literal has no terminator */
		state = State::END_TOP;
		end_top = true;
		return ArrayOpcode::END;
	}

	Dispatch(' ');
	if (end_top)
		return ArrayOpcode::END;

	if (!error) {
		state = State::ERROR;
		error = std::make_exception_ptr(ArraySyntaxError("unexpected end of input",
								 n_bytes));
	}

	return ArrayOpcode::ERROR;
}

void
ArrayScanner::Undo(ArrayOpcode op) noexcept
{
	assert(!redo);

	redo_code = op;
	redo_state = state;
	state = State::REDO;
	redo = true;
}

ArrayOpcode
ArrayScanner::Dispatch(unsigned char ch)
{
	switch (state) {
	case State::BEGIN_VALUE:
		return BeginValue(ch);

	case State::BEGIN_VALUE_OR_EMPTY:
		return BeginValueOrEmpty(ch);

	case State::END_VALUE:
		return EndValue(ch);

	case State::END_TOP:
		return ArrayOpcode::END;

	case State::IN_STRING:
		return InString(ch);

	case State::IN_STRING_ESCAPE:
		/* the escaped byte is taken verbatim; its meaning is
		   up to UnquoteArrayLiteral() */
		state = State::IN_STRING;
		return ArrayOpcode::CONTINUE;

	case State::IN_BARE:
		return InBare(ch);

	case State::ERROR:
		return ArrayOpcode::ERROR;

	case State::REDO:
		redo = false;
		state = redo_state;
		return redo_code;
	}

	assert(false);
	return ArrayOpcode::ERROR;
}

inline ArrayOpcode
ArrayScanner::BeginValue(unsigned char ch)
{
	switch (ch) {
	case ' ':
		return ArrayOpcode::SKIP_SPACE;

	case '{':
		if (depth >= MAX_DEPTH) {
			state = State::ERROR;
			error = std::make_exception_ptr(ArraySyntaxError("exceeded maximum nesting depth",
									 n_bytes));
			return ArrayOpcode::ERROR;
		}

		++depth;
		state = State::BEGIN_VALUE_OR_EMPTY;
		return ArrayOpcode::BEGIN_ARRAY;

	case '"':
		state = State::IN_STRING;
		return ArrayOpcode::BEGIN_LITERAL;

	case ',':
	case '}':
		return Fail(ch, "looking for beginning of value");

	default:
		if (IsControlChar(ch))
			return Fail(ch, "looking for beginning of value");

		state = State::IN_BARE;
		return ArrayOpcode::BEGIN_LITERAL;
	}
}

inline ArrayOpcode
ArrayScanner::BeginValueOrEmpty(unsigned char ch)
{
	if (ch == ' ')
		return ArrayOpcode::SKIP_SPACE;

	if (ch == '}')
		/* empty array */
		return EndValue(ch);

	return BeginValue(ch);
}

inline ArrayOpcode
ArrayScanner::EndValue(unsigned char ch)
{
	if (depth == 0) {
		/* the top-level value was completed before this
		   byte */
		state = State::END_TOP;
		end_top = true;
		return ArrayOpcode::END;
	}

	switch (ch) {
	case ' ':
		state = State::END_VALUE;
		return ArrayOpcode::SKIP_SPACE;

	case ',':
		state = State::BEGIN_VALUE;
		return ArrayOpcode::ARRAY_VALUE;

	case '}':
		PopArray();
		return ArrayOpcode::END_ARRAY;

	default:
		return Fail(ch, "after array element");
	}
}

inline ArrayOpcode
ArrayScanner::InString(unsigned char ch)
{
	switch (ch) {
	case '"':
		state = State::END_VALUE;
		return ArrayOpcode::CONTINUE;

	case '\\':
		state = State::IN_STRING_ESCAPE;
		return ArrayOpcode::CONTINUE;

	default:
		if (IsControlChar(ch))
			return Fail(ch, "in string literal");

		return ArrayOpcode::CONTINUE;
	}
}

inline ArrayOpcode
ArrayScanner::InBare(unsigned char ch)
{
	if (ch == ',' || ch == '}')
		/* don't consume the delimiter; the decoder needs to
		   see it */
		return EndValue(ch);

	if (IsControlChar(ch))
		return Fail(ch, "in bare literal");

	return ArrayOpcode::CONTINUE;
}

void
ArrayScanner::PopArray() noexcept
{
	assert(depth > 0);

	--depth;
	redo = false;

	if (depth == 0) {
		state = State::END_TOP;
		end_top = true;
	} else
		state = State::END_VALUE;
}

ArrayOpcode
ArrayScanner::Fail(unsigned char ch, const char *context)
{
	state = State::ERROR;
	error = std::make_exception_ptr(ArraySyntaxError(static_cast<char>(ch),
							 context, n_bytes));
	return ArrayOpcode::ERROR;
}

} /* namespace Pg */
