// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "ArrayDecoder.hxx"
#include "ArrayUnquote.hxx"
#include "io/Logger.hxx"
#include "util/CharUtil.hxx"

#include <boost/json/array.hpp>
#include <boost/json/value.hpp>

#include <algorithm>

namespace Pg {

static const LLogger logger("pg/array");

[[gnu::pure]]
static bool
IsNullLiteral(std::string_view literal) noexcept
{
	constexpr std::string_view null_literal = "null";
	return std::equal(literal.begin(), literal.end(),
			  null_literal.begin(), null_literal.end(),
			  [](char a, char b){ return ToLowerASCII(a) == b; });
}

ArrayLiteralKind
ClassifyArrayLiteral(std::string_view literal) noexcept
{
	if (literal.starts_with('"'))
		return ArrayLiteralKind::QUOTED;

	if (literal == "t" || literal == "f")
		return ArrayLiteralKind::BOOLEAN;

	if (IsNullLiteral(literal))
		return ArrayLiteralKind::NULL_VALUE;

	return ArrayLiteralKind::BARE;
}

/**
 * Does this bare literal look like a JSON number?  This excludes
 * "inf" and "nan" which std::from_chars() would accept.
 */
[[gnu::pure]]
static bool
LooksLikeNumber(std::string_view s) noexcept
{
	if (s.starts_with('-'))
		s.remove_prefix(1);

	return !s.empty() && IsDigitASCII(s.front());
}

ArrayOpcode
ArrayDecoder::Next(ArrayOpcode skip)
{
	while (true) {
		ArrayOpcode op;
		if (position < input.size()) {
			op = scanner.Step(input[position++]);
		} else {
			op = scanner.EndOfInput();
			position = input.size() + 1;
		}

		if (op == ArrayOpcode::ERROR)
			std::rethrow_exception(scanner.GetError());

		if (op != skip)
			return op;
	}
}

void
ArrayDecoder::Unread(ArrayOpcode op) noexcept
{
	--position;
	scanner.Undo(op);
}

std::string_view
ArrayDecoder::ReadLiteral()
{
	/* the first byte was consumed by NextValue() */
	const std::size_t start = position - 1;

	const auto op = Next(ArrayOpcode::CONTINUE);
	Unread(op);

	auto literal = input.substr(start, position - start);
	if (!literal.starts_with('"'))
		while (literal.ends_with(' '))
			literal.remove_suffix(1);

	return literal;
}

std::string_view
ArrayDecoder::Unquote(std::string_view literal)
{
	const auto value = UnquoteArrayLiteral(literal, unquote_buffer);
	if (!value)
		throw ArraySyntaxError("malformed quoted literal",
				       literal.data() - input.data());

	return *value;
}

void
ArrayDecoder::SkipValue()
{
	switch (NextValue()) {
	case ArrayOpcode::BEGIN_ARRAY:
		SkipArray();
		break;

	case ArrayOpcode::BEGIN_LITERAL:
		{
			/* skipped literals must be well-formed, too */
			const auto literal = ReadLiteral();
			if (literal.starts_with('"'))
				Unquote(literal);
		}
		break;

	default:
		throw ArrayPhaseError{};
	}
}

void
ArrayDecoder::SkipArray()
{
	ForEachElement([this](){ SkipValue(); });
}

void
ArrayDecoder::DiscardValue(std::size_t index, std::size_t size)
{
	logger.Fmt(4, "discarding element {} of array with fixed length {}",
		   index, size);
	SkipValue();
}

void
ArrayDecoder::SaveTypeError(std::string_view value, std::string_view type)
{
	ArrayTypeError error(value, type);
	logger(3, error.what());

	if (!saved_error)
		saved_error = std::make_exception_ptr(std::move(error));
}

void
ArrayDecoder::DecodeDynamic(boost::json::value &dest)
{
	switch (NextValue()) {
	case ArrayOpcode::BEGIN_ARRAY:
		DecodeDynamicArray(dest);
		break;

	case ArrayOpcode::BEGIN_LITERAL:
		StoreDynamic(ReadLiteral(), dest);
		break;

	default:
		throw ArrayPhaseError{};
	}
}

void
ArrayDecoder::DecodeDynamicArray(boost::json::value &dest)
{
	boost::json::array array;

	ForEachElement([this, &array](){
		DecodeDynamic(array.emplace_back(nullptr));
	});

	dest = std::move(array);
}

void
ArrayDecoder::StoreDynamic(std::string_view literal, boost::json::value &dest)
{
	switch (ClassifyArrayLiteral(literal)) {
	case ArrayLiteralKind::NULL_VALUE:
		dest = nullptr;
		break;

	case ArrayLiteralKind::BOOLEAN:
		dest = literal.front() == 't';
		break;

	case ArrayLiteralKind::QUOTED:
		{
			const auto value = Unquote(literal);
			dest = boost::json::string(value.data(), value.size());
		}
		break;

	case ArrayLiteralKind::BARE:
		if (LooksLikeNumber(literal)) {
			std::int64_t i;
			std::uint64_t u;
			double f;

			if (ParseArrayNumber(literal, i)) {
				dest = i;
				break;
			}

			if (ParseArrayNumber(literal, u)) {
				dest = u;
				break;
			}

			if (ParseArrayNumber(literal, f)) {
				dest = f;
				break;
			}
		}

		dest = nullptr;
		SaveTypeError(literal, "boost::json::value");
		break;
	}
}

void
ArrayDecoder::Finish()
{
	if (Next(ArrayOpcode::SKIP_SPACE) != ArrayOpcode::END)
		throw ArrayPhaseError{};

	/* the byte which produced END (if any) and everything after
	   it must be spaces */
	for (std::size_t i = position - 1; i < input.size(); ++i)
		if (input[i] != ' ')
			throw ArraySyntaxError(input[i], "after top-level value", i);

	if (saved_error)
		std::rethrow_exception(saved_error);
}

} /* namespace Pg */
