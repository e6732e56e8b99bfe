// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Username.hxx"
#include "Error.hxx"
#include "util/CharUtil.hxx"

#include <fmt/format.h>

static constexpr bool
IsUsernameStartChar(char ch) noexcept
{
	return IsLowerAlphaASCII(ch) || ch == '_';
}

static constexpr bool
IsUsernameChar(char ch) noexcept
{
	return IsUsernameStartChar(ch) || IsDigitASCII(ch) || ch == '-';
}

bool
IsValidUsername(std::string_view name) noexcept
{
	if (name.empty() || name.size() > MAX_USERNAME_LENGTH ||
	    !IsUsernameStartChar(name.front()))
		return false;

	for (const char ch : name)
		if (!IsUsernameChar(ch))
			return false;

	return true;
}

void
CheckUsername(std::string_view name)
{
	if (name.empty())
		throw ValidationError("Empty user name");

	if (!IsValidUsername(name))
		throw ValidationError(fmt::format("Invalid user name: '{}'",
						  name));
}
