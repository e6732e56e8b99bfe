// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <string>
#include <vector>

enum class Command {
	JAIL,
	RELEASE,
	REPAIR,
	DIAGNOSE,
};

struct CommandLine {
	Command command = Command::JAIL;

	/**
	 * The configuration file; if empty, the default file is
	 * loaded if it exists.
	 */
	std::string config_path;

	/* these override the configuration file if not empty */
	std::string database_path, jail_root, log_file;

	unsigned verbose = 1;

	/**
	 * Skip the confirmation prompt?
	 */
	bool yes = false;

	bool help = false;

	/**
	 * The accounts to process; if empty, they are obtained from
	 * the site database.
	 */
	std::vector<std::string> users;
};

/**
 * Throws std::runtime_error on usage error.
 */
CommandLine
ParseCommandLine(int argc, char **argv);

void
PrintUsage(const char *program) noexcept;
