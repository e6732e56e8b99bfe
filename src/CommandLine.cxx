// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "CommandLine.hxx"
#include "jail/Config.hxx"
#include "lib/fmt/RuntimeError.hxx"

#include <getopt.h>
#include <stdio.h>

enum {
	OPTION_FIX = 0x100,
	OPTION_RELEASE,
	OPTION_DIAGNOSE,
};

static constexpr struct option long_options[] = {
	{"config", required_argument, nullptr, 'c'},
	{"db-path", required_argument, nullptr, 'd'},
	{"jail-root", required_argument, nullptr, 'j'},
	{"log-file", required_argument, nullptr, 'l'},
	{"verbose", no_argument, nullptr, 'v'},
	{"quiet", no_argument, nullptr, 'q'},
	{"yes", no_argument, nullptr, 'y'},
	{"fix", no_argument, nullptr, OPTION_FIX},
	{"release", no_argument, nullptr, OPTION_RELEASE},
	{"diagnose", required_argument, nullptr, OPTION_DIAGNOSE},
	{"help", no_argument, nullptr, 'h'},
	{},
};

static void
SetCommand(CommandLine &cmdline, Command command)
{
	if (cmdline.command != Command::JAIL && cmdline.command != command)
		throw std::runtime_error("Conflicting commands");

	cmdline.command = command;
}

CommandLine
ParseCommandLine(int argc, char **argv)
{
	CommandLine cmdline;

	/* report errors by exception, not on stderr */
	opterr = 0;
	optind = 1;

	int o;
	while ((o = getopt_long(argc, argv, ":c:d:j:l:vqyh",
				long_options, nullptr)) != -1) {
		switch (o) {
		case 'c':
			cmdline.config_path = optarg;
			break;

		case 'd':
			cmdline.database_path = optarg;
			break;

		case 'j':
			cmdline.jail_root = optarg;
			break;

		case 'l':
			cmdline.log_file = optarg;
			break;

		case 'v':
			++cmdline.verbose;
			break;

		case 'q':
			cmdline.verbose = 0;
			break;

		case 'y':
			cmdline.yes = true;
			break;

		case OPTION_FIX:
			SetCommand(cmdline, Command::REPAIR);
			break;

		case OPTION_RELEASE:
			SetCommand(cmdline, Command::RELEASE);
			break;

		case OPTION_DIAGNOSE:
			SetCommand(cmdline, Command::DIAGNOSE);
			cmdline.users.emplace_back(optarg);
			break;

		case 'h':
			cmdline.help = true;
			return cmdline;

		case ':':
			throw FmtRuntimeError("Option '{}' requires an argument",
					      argv[optind - 1]);

		default:
			throw FmtRuntimeError("Unknown option '{}'",
					      argv[optind - 1]);
		}
	}

	if (cmdline.command == Command::DIAGNOSE &&
	    (optind < argc || cmdline.users.size() != 1))
		throw std::runtime_error("--diagnose takes exactly one user");

	for (int i = optind; i < argc; ++i)
		cmdline.users.emplace_back(argv[i]);

	return cmdline;
}

void
PrintUsage(const char *program) noexcept
{
	fprintf(stderr,
		"Usage: %s [OPTIONS] [USER...]\n"
		"\n"
		"Confine site users in a chroot jail.  Without USER arguments,\n"
		"the users are obtained from the site database.\n"
		"\n"
		"Options:\n"
		"  -c, --config FILE     configuration file (default %s)\n"
		"  -d, --db-path FILE    site database\n"
		"  -j, --jail-root DIR   directory containing the jails\n"
		"  -l, --log-file FILE   append log messages to this file\n"
		"  -v, --verbose         more log messages\n"
		"  -q, --quiet           only errors\n"
		"  -y, --yes             do not ask for confirmation\n"
		"      --fix             repair the users (restore shell and home)\n"
		"      --release         release the users from their jails\n"
		"      --diagnose USER   print a report about one user\n"
		"  -h, --help            show this help\n",
		program, DEFAULT_CONFIG_PATH);
}
