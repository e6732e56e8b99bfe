// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <string_view>

static constexpr std::size_t MAX_USERNAME_LENGTH = 32;

/**
 * Is this a valid account name for a jailed user?  Only lower case
 * letters, digits, underscore and dash are allowed; the first
 * character must be a letter or an underscore.
 */
[[gnu::pure]]
bool
IsValidUsername(std::string_view name) noexcept;

/**
 * Throws #ValidationError if the name is not valid.
 */
void
CheckUsername(std::string_view name);
