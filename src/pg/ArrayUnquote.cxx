// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "ArrayUnquote.hxx"
#include "util/CharUtil.hxx"
#include "util/HexParse.hxx"

#include <cstdint>

namespace Pg {

static constexpr char32_t REPLACEMENT_CHAR = 0xfffd;

struct DecodedChar {
	char32_t ch;
	std::size_t size;
};

[[gnu::const]]
static constexpr bool
IsContinuation(unsigned char ch) noexcept
{
	return (ch & 0xc0) == 0x80;
}

/**
 * Decode one UTF-8 sequence at the beginning of the (non-empty)
 * string.  Malformed sequences (including overlong encodings and
 * surrogates) yield #REPLACEMENT_CHAR with size 1.
 */
[[gnu::pure]]
static DecodedChar
DecodeUTF8(std::string_view s) noexcept
{
	static constexpr DecodedChar invalid{REPLACEMENT_CHAR, 1};

	const auto b0 = static_cast<unsigned char>(s[0]);
	if (b0 < 0x80)
		return {b0, 1};

	if (b0 < 0xc2)
		return invalid;

	if (b0 < 0xe0) {
		if (s.size() < 2 || !IsContinuation(s[1]))
			return invalid;

		return {char32_t(b0 & 0x1f) << 6 | char32_t(s[1] & 0x3f), 2};
	}

	if (b0 < 0xf0) {
		if (s.size() < 3)
			return invalid;

		const auto b1 = static_cast<unsigned char>(s[1]);
		const unsigned char lo = b0 == 0xe0 ? 0xa0 : 0x80;
		const unsigned char hi = b0 == 0xed ? 0x9f : 0xbf;
		if (b1 < lo || b1 > hi || !IsContinuation(s[2]))
			return invalid;

		return {char32_t(b0 & 0x0f) << 12 | char32_t(b1 & 0x3f) << 6 |
			char32_t(s[2] & 0x3f), 3};
	}

	if (b0 < 0xf5) {
		if (s.size() < 4)
			return invalid;

		const auto b1 = static_cast<unsigned char>(s[1]);
		const unsigned char lo = b0 == 0xf0 ? 0x90 : 0x80;
		const unsigned char hi = b0 == 0xf4 ? 0x8f : 0xbf;
		if (b1 < lo || b1 > hi ||
		    !IsContinuation(s[2]) || !IsContinuation(s[3]))
			return invalid;

		return {char32_t(b0 & 0x07) << 18 | char32_t(b1 & 0x3f) << 12 |
			char32_t(s[2] & 0x3f) << 6 | char32_t(s[3] & 0x3f), 4};
	}

	return invalid;
}

static void
AppendUTF8(std::string &dest, char32_t ch)
{
	if (ch < 0x80) {
		dest.push_back(static_cast<char>(ch));
	} else if (ch < 0x800) {
		dest.push_back(static_cast<char>(0xc0 | (ch >> 6)));
		dest.push_back(static_cast<char>(0x80 | (ch & 0x3f)));
	} else if (ch < 0x10000) {
		dest.push_back(static_cast<char>(0xe0 | (ch >> 12)));
		dest.push_back(static_cast<char>(0x80 | ((ch >> 6) & 0x3f)));
		dest.push_back(static_cast<char>(0x80 | (ch & 0x3f)));
	} else {
		dest.push_back(static_cast<char>(0xf0 | (ch >> 18)));
		dest.push_back(static_cast<char>(0x80 | ((ch >> 12) & 0x3f)));
		dest.push_back(static_cast<char>(0x80 | ((ch >> 6) & 0x3f)));
		dest.push_back(static_cast<char>(0x80 | (ch & 0x3f)));
	}
}

/**
 * Parse a "\uXXXX" escape at the beginning of the string.
 *
 * @return the code unit or -1 on error
 */
[[gnu::pure]]
static int_least32_t
ParseUnicodeEscape(std::string_view s) noexcept
{
	if (s.size() < 6 || s[0] != '\\' || s[1] != 'u')
		return -1;

	uint16_t value;
	if (!ParseHexFixed(s.substr(2, 4), value))
		return -1;

	return value;
}

[[gnu::const]]
static constexpr bool
IsSurrogate(char32_t ch) noexcept
{
	return ch >= 0xd800 && ch < 0xe000;
}

/**
 * Combine a UTF-16 surrogate pair.  Returns #REPLACEMENT_CHAR if
 * the two are not a valid pair.
 */
[[gnu::const]]
static constexpr char32_t
CombineSurrogates(int_least32_t high, int_least32_t low) noexcept
{
	if (high >= 0xd800 && high < 0xdc00 && low >= 0xdc00 && low < 0xe000)
		return ((char32_t(high - 0xd800) << 10) | char32_t(low - 0xdc00)) + 0x10000;

	return REPLACEMENT_CHAR;
}

/**
 * Does the string need to be copied by the slow path?  Returns the
 * position of the first byte which needs attention.
 */
[[gnu::pure]]
static std::size_t
FindUnusual(std::string_view s) noexcept
{
	std::size_t i = 0;
	while (i < s.size()) {
		const auto ch = static_cast<unsigned char>(s[i]);
		if (ch == '\\' || ch == '"' || ch < 0x20)
			break;

		if (IsASCII(ch)) {
			++i;
			continue;
		}

		const auto d = DecodeUTF8(s.substr(i));
		if (d.ch == REPLACEMENT_CHAR && d.size == 1)
			break;

		i += d.size;
	}

	return i;
}

std::optional<std::string_view>
UnquoteArrayLiteral(std::string_view src, std::string &buffer)
{
	if (src.size() < 2 || src.front() != '"' || src.back() != '"')
		return std::nullopt;

	src = src.substr(1, src.size() - 2);

	std::size_t r = FindUnusual(src);
	if (r == src.size())
		/* fast path: nothing to unescape */
		return src;

	buffer.clear();
	buffer.reserve(src.size());
	buffer.append(src.substr(0, r));

	while (r < src.size()) {
		const auto ch = static_cast<unsigned char>(src[r]);

		if (ch == '\\') {
			if (r + 1 >= src.size())
				return std::nullopt;

			if (src[r + 1] != 'u') {
				/* any other escaped byte stands for
				   itself, even '{', '}' and '"' */
				buffer.push_back(src[r + 1]);
				r += 2;
				continue;
			}

			const auto unit = ParseUnicodeEscape(src.substr(r));
			if (unit < 0)
				return std::nullopt;

			r += 6;

			char32_t value = unit;
			if (IsSurrogate(value)) {
				const auto low = ParseUnicodeEscape(src.substr(r));
				value = CombineSurrogates(unit, low);
				if (value != REPLACEMENT_CHAR)
					/* a valid pair; consume the
					   second half */
					r += 6;
			}

			AppendUTF8(buffer, value);
		} else if (ch == '"' || ch < 0x20) {
			return std::nullopt;
		} else if (IsASCII(ch)) {
			buffer.push_back(src[r]);
			++r;
		} else {
			const auto d = DecodeUTF8(src.substr(r));
			AppendUTF8(buffer, d.ch);
			r += d.size;
		}
	}

	return std::string_view{buffer};
}

} /* namespace Pg */
