// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "pg/Array.hxx"
#include "io/Logger.hxx"
#include "util/PrintException.hxx"

#include <boost/json/serialize.hpp>
#include <boost/json/value.hpp>

#include <fmt/core.h>

#include <string.h>
#include <stdlib.h>

int
main(int argc, char **argv) noexcept
try {
	unsigned verbose = 1;

	int i = 1;
	for (; i < argc && strcmp(argv[i], "-v") == 0; ++i)
		++verbose;

	if (i + 1 != argc) {
		fmt::print(stderr, "usage: DecodePgArray [-v]... LITERAL\n");
		return EXIT_FAILURE;
	}

	SetLogLevel(verbose);

	boost::json::value value;
	Pg::DecodeArray(argv[i], value);

	fmt::print("{}\n{}\n", boost::json::serialize(value),
		   Pg::EncodeArray(value));
	return EXIT_SUCCESS;
} catch (...) {
	PrintException(std::current_exception());
	return EXIT_FAILURE;
}
