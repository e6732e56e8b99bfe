// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Config.hxx"
#include "io/config/ConfigParser.hxx"
#include "io/config/FileLineParser.hxx"
#include "util/StringAPI.hxx"

#include <fmt/core.h>

#include <stdexcept>

std::string
JailConfig::GetUserJailPath(std::string_view username) const noexcept
{
	return fmt::format("{}/{}", jail_root, username);
}

std::string
JailConfig::GetRealHome(std::string_view username) const noexcept
{
	return fmt::format("{}/{}", home_root, username);
}

static void
CheckAbsolute(const std::string &path, const char *name)
{
	if (path.empty() || path.front() != '/')
		throw std::runtime_error(fmt::format("'{}' must be an absolute path",
						     name));
}

void
JailConfig::Check() const
{
	CheckAbsolute(jail_root, "jail_root");
	CheckAbsolute(home_root, "home_root");
	CheckAbsolute(confined_shell, "confined_shell");
	CheckAbsolute(limited_shell, "limited_shell");
	CheckAbsolute(normal_shell, "normal_shell");

	if (jail_root == "/")
		throw std::runtime_error("jail_root must not be the root directory");
}

class JailConfigParser final : public ConfigParser {
	JailConfig &config;

	/**
	 * Have the defaults of repeatable directives been cleared
	 * already?
	 */
	bool have_skeleton_sections = false, have_system_accounts = false;

public:
	explicit JailConfigParser(JailConfig &_config) noexcept
		:config(_config) {}

	/* virtual methods from class ConfigParser */
	void ParseLine(FileLineParser &line) override;
};

void
JailConfigParser::ParseLine(FileLineParser &line)
{
	const char *word = line.ExpectWord();

	if (StringIsEqual(word, "jail_root"))
		config.jail_root = line.ExpectPathAndEnd().native();
	else if (StringIsEqual(word, "home_root"))
		config.home_root = line.ExpectPathAndEnd().native();
	else if (StringIsEqual(word, "passwd"))
		config.passwd_path = line.ExpectPathAndEnd().native();
	else if (StringIsEqual(word, "group"))
		config.group_path = line.ExpectPathAndEnd().native();
	else if (StringIsEqual(word, "fstab"))
		config.fstab_path = line.ExpectPathAndEnd().native();
	else if (StringIsEqual(word, "database"))
		config.database_path = line.ExpectPathAndEnd().native();
	else if (StringIsEqual(word, "confined_shell"))
		config.confined_shell = line.ExpectPathAndEnd().native();
	else if (StringIsEqual(word, "limited_shell"))
		config.limited_shell = line.ExpectPathAndEnd().native();
	else if (StringIsEqual(word, "normal_shell"))
		config.normal_shell = line.ExpectPathAndEnd().native();
	else if (StringIsEqual(word, "skeleton_tool")) {
		if (line.SkipWord("none")) {
			line.ExpectEnd();
			config.skeleton_tool.clear();
		} else
			config.skeleton_tool = line.ExpectValueAndEnd();
	} else if (StringIsEqual(word, "skeleton_section")) {
		if (!have_skeleton_sections) {
			config.skeleton_sections.clear();
			have_skeleton_sections = true;
		}

		config.skeleton_sections.emplace_back(line.ExpectValueAndEnd());
	} else if (StringIsEqual(word, "system_account")) {
		if (!have_system_accounts) {
			config.system_accounts.clear();
			have_system_accounts = true;
		}

		config.system_accounts.emplace_back(line.ExpectValueAndEnd());
	} else if (StringIsEqual(word, "chroot_shell_config"))
		config.chroot_shell_config = line.ExpectPathAndEnd().native();
	else if (StringIsEqual(word, "log_file")) {
		if (line.SkipWord("none")) {
			line.ExpectEnd();
			config.log_file.clear();
		} else
			config.log_file = line.ExpectPathAndEnd().native();
	} else
		throw LineParser::Error("Unknown option");
}

void
LoadConfigFile(JailConfig &config, const std::filesystem::path &path)
{
	JailConfigParser parser(config);
	VariableConfigParser v_parser(parser);
	CommentConfigParser parser2(v_parser);
	IncludeConfigParser parser3(std::filesystem::path{path}, parser2);

	ParseConfigFile(path, parser3);
}
