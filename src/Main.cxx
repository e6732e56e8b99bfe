// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "CommandLine.hxx"
#include "jail/Config.hxx"
#include "jail/Interrupt.hxx"
#include "jail/Lifecycle.hxx"
#include "jail/LinuxHostOperations.hxx"
#include "jail/SiteUsers.hxx"
#include "io/Logger.hxx"
#include "io/UniqueFileDescriptor.hxx"
#include "util/PrintException.hxx"
#include "util/ScopeExit.hxx"

#include <errno.h>
#include <fcntl.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <unistd.h>

static const LLogger logger{"sitejail"};

static JailConfig
LoadConfig(const CommandLine &cmdline)
{
	JailConfig config;

	if (!cmdline.config_path.empty())
		LoadConfigFile(config, cmdline.config_path);
	else if (access(DEFAULT_CONFIG_PATH, F_OK) == 0)
		LoadConfigFile(config, DEFAULT_CONFIG_PATH);

	if (!cmdline.database_path.empty())
		config.database_path = cmdline.database_path;

	if (!cmdline.jail_root.empty())
		config.jail_root = cmdline.jail_root;

	if (!cmdline.log_file.empty())
		config.log_file = cmdline.log_file;

	config.Check();
	return config;
}

static UniqueFileDescriptor
OpenLogFile(const std::string &path) noexcept
{
	UniqueFileDescriptor fd;
	if (!path.empty() &&
	    !fd.Open(path.c_str(), O_WRONLY|O_APPEND|O_CREAT, 0640))
		logger.Fmt(1, "Warning: failed to open log file '{}': {}",
			   path, strerror(errno));

	return fd;
}

static bool
Confirm(const char *question) noexcept
{
	fprintf(stderr, "%s (y/N) ", question);
	fflush(stderr);

	char buffer[64];
	if (fgets(buffer, sizeof(buffer), stdin) == nullptr)
		return false;

	return buffer[0] == 'y' || buffer[0] == 'Y';
}

static const char *
GetVerb(Command command) noexcept
{
	switch (command) {
	case Command::JAIL:
		return "jail";

	case Command::RELEASE:
		return "release";

	case Command::REPAIR:
		return "repair";

	case Command::DIAGNOSE:
		break;
	}

	return "diagnose";
}

int
main(int argc, char **argv) noexcept
try {
	const auto cmdline = ParseCommandLine(argc, argv);
	if (cmdline.help) {
		PrintUsage(argv[0]);
		return EXIT_SUCCESS;
	}

	SetLogLevel(cmdline.verbose);

	LinuxHostOperations host;
	CheckPrivileges(host);

	const auto config = LoadConfig(cmdline);
	Lifecycle lifecycle(config, host);

	if (cmdline.command == Command::DIAGNOSE) {
		const auto report = lifecycle.Diagnose(cmdline.users.front());
		fputs(report.c_str(), stdout);
		return EXIT_SUCCESS;
	}

	const auto log_fd = OpenLogFile(config.log_file);
	SetLogFile(log_fd);
	AtScopeExit() { SetLogFile(FileDescriptor::Undefined()); };

	InstallInterruptHandlers();

	const auto users = cmdline.users.empty()
		? QuerySiteUsers(config.database_path.c_str())
		: cmdline.users;

	if (users.empty()) {
		logger(1, "No users found");
		return EXIT_SUCCESS;
	}

	logger.Fmt(1, "About to {} {} user(s):", GetVerb(cmdline.command),
		   users.size());
	for (const auto &i : users)
		logger.Fmt(1, "  {}", i);

	if (!cmdline.yes && isatty(STDIN_FILENO) && !Confirm("Proceed?")) {
		logger(1, "Aborted");
		return EXIT_SUCCESS;
	}

	std::vector<UserOutcome> outcomes;

	switch (cmdline.command) {
	case Command::JAIL:
		lifecycle.Prepare();
		outcomes = lifecycle.JailAll(users);
		break;

	case Command::RELEASE:
		outcomes = lifecycle.ReleaseAll(users);
		break;

	case Command::REPAIR:
		outcomes = lifecycle.RepairAll(users);
		break;

	case Command::DIAGNOSE:
		break;
	}

	LogSummary(outcomes);
	return EXIT_SUCCESS;
} catch (...) {
	PrintException(std::current_exception());
	return EXIT_FAILURE;
}
