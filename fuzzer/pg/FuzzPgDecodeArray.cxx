// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "pg/Array.hxx"

#include <boost/json/value.hpp>

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

extern "C" {
int LLVMFuzzerTestOneInput(const uint8_t *data, size_t size);
}

int LLVMFuzzerTestOneInput(const uint8_t *data, size_t size)
{
	const std::string_view input{reinterpret_cast<const char *>(data), size};

	try {
		boost::json::value value;
		Pg::DecodeArray(input, value);
		Pg::EncodeArray(value);
	} catch (const std::invalid_argument &) {
	}

	try {
		std::vector<std::vector<std::string>> v;
		Pg::DecodeArray(input, v);
	} catch (const std::invalid_argument &) {
	}

	return 0;
}
