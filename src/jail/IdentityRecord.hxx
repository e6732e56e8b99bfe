// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <optional>
#include <string>
#include <string_view>

#include <sys/types.h>

/**
 * One line of the account database (passwd(5)).
 */
struct PasswdEntry {
	std::string name;
	std::string password;
	uid_t uid = 0;
	gid_t gid = 0;
	std::string gecos;
	std::string home;
	std::string shell;

	/**
	 * Parse a line (without the trailing newline).
	 *
	 * @return std::nullopt if the line is not a well-formed
	 * record
	 */
	[[gnu::pure]]
	static std::optional<PasswdEntry> Parse(std::string_view line) noexcept;

	std::string Format() const noexcept;

	bool operator==(const PasswdEntry &) const noexcept = default;
};

/**
 * One line of the group database (group(5)).
 */
struct GroupEntry {
	std::string name;
	std::string password;
	gid_t gid = 0;
	std::string members;

	[[gnu::pure]]
	static std::optional<GroupEntry> Parse(std::string_view line) noexcept;

	std::string Format() const noexcept;

	bool operator==(const GroupEntry &) const noexcept = default;
};
