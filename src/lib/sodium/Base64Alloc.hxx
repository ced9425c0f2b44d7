// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#pragma once

#include <cstddef>
#include <optional>
#include <string_view>
#include <vector>

/**
 * Decode a string in the standard (padded) base64 alphabet.  Trailing
 * garbage is an error.
 *
 * @return the decoded bytes or std::nullopt on error
 */
[[gnu::pure]]
std::optional<std::vector<std::byte>>
DecodeBase64(std::string_view src);
