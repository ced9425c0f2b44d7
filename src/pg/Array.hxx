// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

/*
 * Decoding and encoding PostgreSQL array literals.
 */

#pragma once

#include "ArrayDecoder.hxx"

#include <boost/json/fwd.hpp>

#include <concepts>
#include <forward_list>
#include <iterator>
#include <string>
#include <string_view>
#include <type_traits>

namespace Pg {

/**
 * Decode a PostgreSQL array literal (or a single top-level literal)
 * into the given destination.  The destination type determines how
 * each element is interpreted; see #ArrayShape.
 *
 * Throws #ArraySyntaxError on malformed input and #ArrayTypeError if
 * an element cannot be represented by the destination; in the latter
 * case, all other elements have been decoded nonetheless.
 *
 * The destination may also be a pointer, which is dereferenced;
 * #InvalidArrayDestination is thrown if it is null.  C arrays are
 * taken by reference and never decay to a pointer.
 */
template<typename T>
void
DecodeArray(std::string_view src, T &&dest)
{
	using D = std::remove_cvref_t<T>;

	if constexpr (std::is_pointer_v<D> || std::is_null_pointer_v<D>) {
		if (dest == nullptr)
			throw InvalidArrayDestination("null destination");

		if constexpr (std::is_pointer_v<D>)
			DecodeArray(src, *dest);
	} else {
		static_assert(std::is_lvalue_reference_v<T>,
			      "destination must be an lvalue");

		ArrayDecoder d(src);
		DecodeArrayValue(d, dest);
		d.Finish();
	}
}

/**
 * Decode an array of strings.  SQL NULL elements are returned as
 * empty strings.
 *
 * Throws std::invalid_argument on syntax error.
 */
std::forward_list<std::string>
DecodeArray(const char *p);

template<typename L>
requires std::convertible_to<typename L::value_type, std::string_view> && std::forward_iterator<typename L::const_iterator>
std::string
EncodeArray(const L &src) noexcept
{
	if (std::empty(src))
		return "{}";

	std::string dest("{");

	bool first = true;
	for (const std::string_view i : src) {
		if (first)
			first = false;
		else
			dest.push_back(',');

		dest.push_back('"');

		for (const auto ch : i) {
			if (ch == '\\' || ch == '"')
				dest.push_back('\\');
			dest.push_back(ch);
		}

		dest.push_back('"');
	}

	dest.push_back('}');
	return dest;
}

/**
 * Encode a value tree as returned by DecodeArray() with a
 * boost::json::value destination.
 *
 * Throws std::invalid_argument if the tree contains an object.
 */
std::string
EncodeArray(const boost::json::value &src);

} /* namespace Pg */
