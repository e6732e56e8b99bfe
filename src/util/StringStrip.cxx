// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "StringStrip.hxx"
#include "CharUtil.hxx"

#include <string.h>

const char *
StripLeft(const char *p) noexcept
{
	while (IsWhitespaceNotNull(*p))
		++p;

	return p;
}

std::string_view
StripLeft(std::string_view s) noexcept
{
	std::size_t i = 0;
	while (i < s.size() && IsWhitespaceOrNull(s[i]))
		++i;

	s.remove_prefix(i);
	return s;
}

std::string_view
StripRight(std::string_view s) noexcept
{
	std::size_t n = s.size();
	while (n > 0 && IsWhitespaceOrNull(s[n - 1]))
		--n;

	return s.substr(0, n);
}

void
StripRight(char *p) noexcept
{
	std::size_t old_length = strlen(p);
	std::size_t new_length = StripRight(std::string_view{p, old_length}).size();
	p[new_length] = 0;
}

std::string_view
Strip(std::string_view s) noexcept
{
	return StripRight(StripLeft(s));
}
