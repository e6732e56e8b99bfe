// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "IdentityRecord.hxx"
#include "util/IterableSplitString.hxx"

#include <fmt/format.h>

#include <array>
#include <charconv>

/**
 * Split the line at colons into exactly N fields.
 *
 * @return false if the number of fields does not match
 */
template<std::size_t N>
static bool
SplitFields(std::array<std::string_view, N> &dest, std::string_view line) noexcept
{
	std::size_t n = 0;
	for (const auto i : IterableSplitString(line, ':')) {
		if (n >= N)
			return false;

		dest[n++] = i;
	}

	return n == N;
}

template<typename T>
static bool
ParseId(T &dest, std::string_view s) noexcept
{
	if (s.empty())
		return false;

	const auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(),
					       dest);
	return ec == std::errc{} && ptr == s.data() + s.size();
}

std::optional<PasswdEntry>
PasswdEntry::Parse(std::string_view line) noexcept
{
	std::array<std::string_view, 7> f;
	if (!SplitFields(f, line) || f[0].empty())
		return std::nullopt;

	PasswdEntry e;
	if (!ParseId(e.uid, f[2]) || !ParseId(e.gid, f[3]))
		return std::nullopt;

	e.name = f[0];
	e.password = f[1];
	e.gecos = f[4];
	e.home = f[5];
	e.shell = f[6];
	return e;
}

std::string
PasswdEntry::Format() const noexcept
{
	return fmt::format("{}:{}:{}:{}:{}:{}:{}",
			   name, password, uid, gid, gecos, home, shell);
}

std::optional<GroupEntry>
GroupEntry::Parse(std::string_view line) noexcept
{
	std::array<std::string_view, 4> f;
	if (!SplitFields(f, line) || f[0].empty())
		return std::nullopt;

	GroupEntry e;
	if (!ParseId(e.gid, f[2]))
		return std::nullopt;

	e.name = f[0];
	e.password = f[1];
	e.members = f[3];
	return e;
}

std::string
GroupEntry::Format() const noexcept
{
	return fmt::format("{}:{}:{}:{}", name, password, gid, members);
}
