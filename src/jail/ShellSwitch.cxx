// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "ShellSwitch.hxx"
#include "Config.hxx"
#include "Error.hxx"
#include "IdentityFile.hxx"
#include "io/FileWriter.hxx"
#include "io/MakeDirectory.hxx"
#include "io/StringFile.hxx"
#include "lib/fmt/SystemError.hxx"

#include <fmt/core.h>

#include <unistd.h>

static PasswdEntry
LoadAccount(const JailConfig &config, std::string_view username)
{
	const auto passwd = PasswdFile::LoadExisting(config.passwd_path);
	const auto *entry = passwd.Find(username);
	if (entry == nullptr)
		throw ValidationError(fmt::format("No such account: '{}'",
						  username));

	return *entry;
}

std::string
ShellSwitch::GetShell(std::string_view username) const
{
	return LoadAccount(config, username).shell;
}

bool
ShellSwitch::IsConfined(std::string_view username) const
{
	return GetShell(username) == config.confined_shell;
}

bool
ShellSwitch::SetShell(std::string_view username, std::string_view shell)
{
	auto passwd = PasswdFile::LoadExisting(config.passwd_path);
	const auto *old_entry = passwd.Find(username);
	if (old_entry == nullptr)
		throw ValidationError(fmt::format("No such account: '{}'",
						  username));

	if (old_entry->shell == shell)
		return false;

	auto entry = *old_entry;
	entry.shell = shell;
	passwd.Replace(entry);

	try {
		passwd.Save();
	} catch (...) {
		std::throw_with_nested(IdentityWriteError(fmt::format("Failed to change the shell of '{}'",
								      username)));
	}

	logger.Fmt(2, "Changed shell of '{}' to '{}'", username, shell);
	return true;
}

std::string
ShellSwitch::GetRecordPath(std::string_view username) const noexcept
{
	return fmt::format("{}/{}.shell", config.GetStatePath(), username);
}

std::optional<std::string>
ShellSwitch::GetRecordedShell(std::string_view username) const
{
	const auto path = GetRecordPath(username);

	try {
		auto shell = LoadStringFile(path.c_str());
		if (shell.empty())
			return std::nullopt;

		return shell;
	} catch (const std::system_error &e) {
		if (IsFileNotFound(e))
			return std::nullopt;

		throw;
	}
}

void
ShellSwitch::RecordShell(std::string_view username, std::string_view shell)
{
	MakeNestedDirectory(config.GetStatePath().c_str(),
			    MakeDirectoryOptions{.mode = 0700});

	const auto path = GetRecordPath(username);
	ReplaceFile(path.c_str(), fmt::format("{}\n", shell), 0600);
}

void
ShellSwitch::DeleteRecord(std::string_view username)
{
	const auto path = GetRecordPath(username);
	if (unlink(path.c_str()) < 0 && errno != ENOENT)
		throw FmtErrno("Failed to delete '{}'", path);
}

bool
ShellSwitch::Confine(std::string_view username)
{
	const auto account = LoadAccount(config, username);
	if (account.shell == config.confined_shell)
		return false;

	if (!GetRecordedShell(username))
		RecordShell(username, account.shell);

	SetShell(username, config.confined_shell);
	logger.Fmt(1, "Confined '{}' (previous shell '{}')",
		   username, account.shell);
	return true;
}

bool
ShellSwitch::Restore(std::string_view username)
{
	const auto account = LoadAccount(config, username);
	const auto recorded = GetRecordedShell(username);

	if (account.shell != config.confined_shell) {
		/* not confined; a stale record is obsolete */
		if (recorded)
			DeleteRecord(username);
		return false;
	}

	std::string shell = config.normal_shell;
	if (recorded && *recorded != config.confined_shell)
		shell = *recorded;

	SetShell(username, shell);
	DeleteRecord(username);

	logger.Fmt(1, "Restored shell '{}' of '{}'", shell, username);
	return true;
}
