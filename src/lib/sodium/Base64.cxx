// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "Base64Alloc.hxx"
#include "Base64.hxx"

std::optional<std::vector<std::byte>>
DecodeBase64(std::string_view src)
{
	/* the decoded size is never larger than the input */
	std::vector<std::byte> buffer(src.size());

	std::size_t decoded_size;
	const char *end;
	if (sodium_base642bin(buffer, src,
			      nullptr, &decoded_size, &end,
			      sodium_base64_VARIANT_ORIGINAL) != 0 ||
	    end != src.data() + src.size())
		return std::nullopt;

	buffer.resize(decoded_size);
	return buffer;
}
