// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "io/Logger.hxx"

#include <optional>
#include <string>
#include <string_view>

struct JailConfig;

/**
 * Switches the login shell of an account between the confined
 * (chroot) shell and its previous shell.  Only the shell field of the
 * account record is ever modified.
 *
 * The previous shell is remembered in a small file in the state
 * directory, so a later release can restore it.
 */
class ShellSwitch {
	const JailConfig &config;

	const LLogger logger{"shell"};

public:
	explicit ShellSwitch(const JailConfig &_config) noexcept
		:config(_config) {}

	/**
	 * Throws #ValidationError if there is no such account.
	 */
	std::string GetShell(std::string_view username) const;

	bool IsConfined(std::string_view username) const;

	/**
	 * Rewrite the shell field of the account.
	 *
	 * Throws #ValidationError if there is no such account,
	 * #IdentityWriteError if the account file cannot be written.
	 *
	 * @return false if the shell was already set
	 */
	bool SetShell(std::string_view username, std::string_view shell);

	/**
	 * Remember the current shell (unless it is confined already
	 * or a previous shell has been remembered before) and switch
	 * to the confined shell.
	 *
	 * @return false if the account was already confined
	 */
	bool Confine(std::string_view username);

	/**
	 * Switch back to the remembered shell (or the configured
	 * normal shell) and forget the remembered one.
	 *
	 * @return false if the account was not confined
	 */
	bool Restore(std::string_view username);

	/**
	 * Return the shell remembered by Confine().
	 *
	 * Throws on I/O error.
	 */
	std::optional<std::string> GetRecordedShell(std::string_view username) const;

	std::string GetRecordPath(std::string_view username) const noexcept;

private:
	void RecordShell(std::string_view username, std::string_view shell);
	void DeleteRecord(std::string_view username);
};
