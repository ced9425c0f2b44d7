// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "ArrayError.hxx"

#include <fmt/format.h>

namespace Pg {

static std::string
QuoteChar(unsigned char ch)
{
	if (ch == '\'')
		return "'\\''";

	if (ch >= 0x20 && ch < 0x7f)
		return fmt::format("'{}'", static_cast<char>(ch));

	return fmt::format("'\\x{:02x}'", ch);
}

ArraySyntaxError::ArraySyntaxError(char ch, std::string_view context,
				   std::size_t _offset)
	:std::invalid_argument(fmt::format("invalid character {} {}",
					   QuoteChar(ch), context)),
	 offset(_offset) {}

ArrayTypeError::ArrayTypeError(std::string_view value, std::string_view type)
	:std::invalid_argument(fmt::format("cannot decode {} into value of type {}",
					   value, type)) {}

} /* namespace Pg */
