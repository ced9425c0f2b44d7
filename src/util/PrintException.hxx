// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#pragma once

#include <exception>

/**
 * Print the full message of the exception (including its nested
 * chain) to stderr.
 */
void
PrintException(const std::exception_ptr &ep) noexcept;
