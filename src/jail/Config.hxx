// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

/**
 * Default location of the configuration file.  It is optional.
 */
static constexpr const char *DEFAULT_CONFIG_PATH =
	"/etc/sitejail/sitejail.conf";

struct JailConfig {
	/**
	 * The directory containing all per-user jails, the base
	 * template and the state directory.
	 */
	std::string jail_root = "/home/jail";

	/**
	 * The directory containing the real home directories.
	 */
	std::string home_root = "/home";

	std::string passwd_path = "/etc/passwd";
	std::string group_path = "/etc/group";

	/**
	 * The durable mount table.
	 */
	std::string fstab_path = "/etc/fstab";

	/**
	 * The SQLite database of the hosting control panel which
	 * lists the site users.
	 */
	std::string database_path = "/home/clp/htdocs/app/data/db.sq3";

	/**
	 * The login shell of jailed accounts; it enters the chroot.
	 */
	std::string confined_shell = "/usr/sbin/jk_chrootsh";

	/**
	 * The restricted shell which runs inside the jail.
	 */
	std::string limited_shell = "/usr/sbin/jk_lsh";

	/**
	 * The shell which released accounts get if their previous
	 * shell is unknown.
	 */
	std::string normal_shell = "/bin/bash";

	/**
	 * The program which populates the base template ("jk_init").
	 * Empty disables it.
	 */
	std::string skeleton_tool = "jk_init";

	std::vector<std::string> skeleton_sections{
		"basicshell", "netutils", "ssh", "sftp", "scp", "editors",
	};

	/**
	 * Accounts which are copied into the identity files of the
	 * base template.
	 */
	std::vector<std::string> system_accounts{"root", "nobody"};

	std::string chroot_shell_config = "/etc/jailkit/jk_chrootsh.conf";

	/**
	 * Log lines are appended to this file.  Empty disables it.
	 */
	std::string log_file = "/var/log/sitejail.log";

	std::string GetBasePath() const noexcept {
		return jail_root + "/.base";
	}

	std::string GetStatePath() const noexcept {
		return jail_root + "/.state";
	}

	std::string GetUserJailPath(std::string_view username) const noexcept;

	std::string GetRealHome(std::string_view username) const noexcept;

	/**
	 * Throws std::runtime_error if the configuration is not
	 * usable.
	 */
	void Check() const;
};

/**
 * Load the configuration file into the given object, overriding the
 * defaults which are already set there.
 *
 * Throws on error.
 */
void
LoadConfigFile(JailConfig &config, const std::filesystem::path &path);
