// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include "ArrayScanner.hxx"
#include "ArrayShape.hxx"
#include "ArrayError.hxx"
#include "lib/sodium/Base64Alloc.hxx"

#include <boost/core/demangle.hpp>
#include <boost/json/fwd.hpp>

#include <charconv>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <typeinfo>
#include <utility>

namespace Pg {

/**
 * The lexical kind of an array element literal.
 */
enum class ArrayLiteralKind : uint_least8_t {
	/**
	 * The bare token "NULL".
	 */
	NULL_VALUE,

	/**
	 * The bare token "t" or "f".
	 */
	BOOLEAN,

	QUOTED,

	/**
	 * Any other bare token (a number or an unquoted string).
	 */
	BARE,
};

[[gnu::pure]]
ArrayLiteralKind
ClassifyArrayLiteral(std::string_view literal) noexcept;

/**
 * The state of one DecodeArray() call: the input, a cursor into it
 * and the #ArrayScanner which is driven over it.
 *
 * Syntax errors are thrown immediately.  Type errors are recorded
 * by SaveTypeError() and the first one is thrown by Finish(), after
 * the whole input has been consumed.
 */
class ArrayDecoder {
	const std::string_view input;

	/**
	 * The read position in #input.  After the end of the input
	 * has been reported to the scanner, this is input.size()+1.
	 */
	std::size_t position = 0;

	ArrayScanner scanner;

	/**
	 * The first type error.
	 */
	std::exception_ptr saved_error;

	/**
	 * Scratch space for Unquote().
	 */
	std::string unquote_buffer;

public:
	explicit ArrayDecoder(std::string_view _input) noexcept
		:input(_input)
	{
		scanner.Reset();
	}

	ArrayDecoder(const ArrayDecoder &) = delete;
	ArrayDecoder &operator=(const ArrayDecoder &) = delete;

	/**
	 * Feed bytes into the scanner until it returns something
	 * other than #skip.
	 *
	 * Throws #ArraySyntaxError.
	 */
	ArrayOpcode Next(ArrayOpcode skip);

	/**
	 * Push back the byte which produced the given opcode.  This
	 * must be the last opcode returned by Next().
	 */
	void Unread(ArrayOpcode op) noexcept;

	/**
	 * Skip whitespace and return #ArrayOpcode::BEGIN_ARRAY or
	 * #ArrayOpcode::BEGIN_LITERAL.
	 */
	ArrayOpcode NextValue() {
		return Next(ArrayOpcode::SKIP_SPACE);
	}

	/**
	 * Consume the rest of a literal after NextValue() has returned
	 * #ArrayOpcode::BEGIN_LITERAL.  Trailing spaces of a bare
	 * literal are not part of it.
	 */
	std::string_view ReadLiteral();

	/**
	 * Unquote a quoted literal.  The return value is valid until
	 * the next call.
	 *
	 * Throws #ArraySyntaxError if the literal is malformed.
	 */
	std::string_view Unquote(std::string_view literal);

	/**
	 * Consume one value (literal or array) and throw it away.
	 */
	void SkipValue();

	/**
	 * Consume the rest of an array after
	 * #ArrayOpcode::BEGIN_ARRAY and throw it away.
	 */
	void SkipArray();

	/**
	 * Skip an element which does not fit into a fixed-size
	 * destination.
	 */
	void DiscardValue(std::size_t index, std::size_t size);

	/**
	 * Record an #ArrayTypeError.  Only the first one will be
	 * thrown by Finish().
	 */
	void SaveTypeError(std::string_view value, std::string_view type);

	/**
	 * Decode one value into a dynamic container.
	 */
	void DecodeDynamic(boost::json::value &dest);

	/**
	 * Decode the rest of an array after
	 * #ArrayOpcode::BEGIN_ARRAY into a dynamic container.
	 */
	void DecodeDynamicArray(boost::json::value &dest);

	void StoreDynamic(std::string_view literal, boost::json::value &dest);

	/**
	 * Verify that nothing but spaces follows the top-level value
	 * and throw the first saved type error.
	 */
	void Finish();

	/**
	 * Iterate over the elements of an array after
	 * #ArrayOpcode::BEGIN_ARRAY.  The function is invoked once per
	 * element and must consume exactly one value.
	 */
	template<typename F>
	void ForEachElement(F &&f) {
		while (true) {
			/* look ahead for '}'; this can only happen on
			   the first iteration */
			auto op = Next(ArrayOpcode::SKIP_SPACE);
			if (op == ArrayOpcode::END_ARRAY)
				break;

			/* back up so the element decoder can see the
			   byte we just read */
			Unread(op);

			f();

			op = Next(ArrayOpcode::SKIP_SPACE);
			if (op == ArrayOpcode::END_ARRAY)
				break;

			if (op != ArrayOpcode::ARRAY_VALUE)
				throw ArrayPhaseError{};
		}
	}
};

template<typename T>
std::string
GetArrayTypeName()
{
	return boost::core::demangle(typeid(T).name());
}

template<typename T>
T &
EmplaceNullable(std::optional<T> &dest)
{
	if (!dest)
		dest.emplace();
	return *dest;
}

template<typename T>
T &
EmplaceNullable(std::unique_ptr<T> &dest)
{
	if (!dest)
		dest = std::make_unique<T>();
	return *dest;
}

/**
 * Parse a number, checking the range of the destination type.
 *
 * @return false if the string is not a number which fits in the
 * destination
 */
template<typename T>
bool
ParseArrayNumber(std::string_view s, T &dest) noexcept
{
	const char *end = s.data() + s.size();
	T value;
	const auto [ptr, ec] = std::from_chars(s.data(), end, value);
	if (ec != std::errc{} || ptr != end)
		return false;

	dest = value;
	return true;
}

template<typename T>
void
DecodeArrayValue(ArrayDecoder &d, T &dest);

template<typename T>
void
DecodeArrayElements(ArrayDecoder &d, T &dest);

template<typename T>
void
StoreArrayLiteral(ArrayDecoder &d, std::string_view literal, T &dest);

template<typename T>
void
ResetArrayElement(T &dest)
{
	if constexpr (std::is_array_v<T>) {
		for (auto &i : dest)
			ResetArrayElement(i);
	} else
		dest = T{};
}

/**
 * Decode the next value (array or literal) into the destination.
 */
template<typename T>
void
DecodeArrayValue(ArrayDecoder &d, T &dest)
{
	switch (d.NextValue()) {
	case ArrayOpcode::BEGIN_ARRAY:
		DecodeArrayElements(d, dest);
		break;

	case ArrayOpcode::BEGIN_LITERAL:
		StoreArrayLiteral(d, d.ReadLiteral(), dest);
		break;

	default:
		throw ArrayPhaseError{};
	}
}

/**
 * Decode the rest of an array after #ArrayOpcode::BEGIN_ARRAY into
 * the destination.
 */
template<typename T>
void
DecodeArrayElements(ArrayDecoder &d, T &dest)
{
	constexpr ArrayShape shape = ArrayShapeOf<T>;

	if constexpr (shape == ArrayShape::GROWABLE) {
		using E = typename T::value_type;

		std::size_t i = 0;
		d.ForEachElement([&d, &dest, &i](){
			if (i >= dest.capacity())
				dest.reserve(GrowArrayCapacity(dest.capacity()));

			if (i >= dest.size())
				dest.resize(i + 1);

			if constexpr (std::is_same_v<E, bool>) {
				/* std::vector<bool> has no bool
				   references */
				bool value = dest[i];
				DecodeArrayValue(d, value);
				dest[i] = value;
			} else
				DecodeArrayValue(d, dest[i]);

			++i;
		});

		if (i == 0)
			dest.clear();
		else if (i < dest.size())
			dest.erase(std::next(dest.begin(), i), dest.end());
	} else if constexpr (shape == ArrayShape::FIXED) {
		constexpr std::size_t size = FixedArrayTraits<T>::size;

		std::size_t i = 0;
		d.ForEachElement([&d, &dest, &i](){
			if (i < size)
				DecodeArrayValue(d, dest[i]);
			else
				d.DiscardValue(i, size);

			++i;
		});

		for (; i < size; ++i)
			ResetArrayElement(dest[i]);
	} else if constexpr (shape == ArrayShape::DYNAMIC) {
		d.DecodeDynamicArray(dest);
	} else if constexpr (shape == ArrayShape::NULLABLE) {
		DecodeArrayElements(d, EmplaceNullable(dest));
	} else {
		static_assert(!IsArrayShaped(shape));

		d.SaveTypeError("array", GetArrayTypeName<T>());
		d.SkipArray();
	}
}

/**
 * Store one literal (as returned by ArrayDecoder::ReadLiteral()) in
 * the destination.
 */
template<typename T>
void
StoreArrayLiteral(ArrayDecoder &d, std::string_view literal, T &dest)
{
	constexpr ArrayShape shape = ArrayShapeOf<T>;
	const auto kind = ClassifyArrayLiteral(literal);

	if constexpr (shape == ArrayShape::NULLABLE) {
		if (kind == ArrayLiteralKind::NULL_VALUE)
			dest.reset();
		else
			StoreArrayLiteral(d, literal, EmplaceNullable(dest));
	} else if constexpr (shape == ArrayShape::DYNAMIC) {
		d.StoreDynamic(literal, dest);
	} else {
		switch (kind) {
		case ArrayLiteralKind::NULL_VALUE:
			/* NULL has no representation in most types;
			   leave them alone */
			if constexpr (shape == ArrayShape::GROWABLE ||
				      shape == ArrayShape::BINARY)
				dest.clear();
			break;

		case ArrayLiteralKind::BOOLEAN:
			if constexpr (shape == ArrayShape::BOOLEAN)
				dest = literal.front() == 't';
			else if constexpr (shape == ArrayShape::STRING)
				dest.assign(literal);
			else
				d.SaveTypeError("bool", GetArrayTypeName<T>());
			break;

		case ArrayLiteralKind::QUOTED:
			if constexpr (shape == ArrayShape::STRING) {
				dest.assign(d.Unquote(literal));
			} else if constexpr (shape == ArrayShape::BINARY) {
				auto value = DecodeBase64(d.Unquote(literal));
				if (value)
					dest = std::move(*value);
				else
					d.SaveTypeError("invalid base64 string",
							GetArrayTypeName<T>());
			} else {
				d.Unquote(literal);
				d.SaveTypeError("string", GetArrayTypeName<T>());
			}
			break;

		case ArrayLiteralKind::BARE:
			if constexpr (shape == ArrayShape::STRING) {
				dest.assign(literal);
			} else if constexpr (shape == ArrayShape::INTEGER ||
					     shape == ArrayShape::FLOAT) {
				if (!ParseArrayNumber(literal, dest))
					d.SaveTypeError(literal, GetArrayTypeName<T>());
			} else
				d.SaveTypeError(literal, GetArrayTypeName<T>());
			break;
		}
	}
}

} /* namespace Pg */
