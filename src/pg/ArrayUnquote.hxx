// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace Pg {

/**
 * Unquote a double-quoted array element, resolving backslash escapes
 * (including "\uXXXX").
 *
 * @param buffer scratch space which may be used for the result; it
 * must stay alive as long as the return value is used
 * @return the unquoted value (pointing either into #src or into
 * #buffer) or std::nullopt if the literal is malformed
 */
[[nodiscard]]
std::optional<std::string_view>
UnquoteArrayLiteral(std::string_view src, std::string &buffer);

} /* namespace Pg */
