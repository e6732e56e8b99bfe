// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Lifecycle.hxx"
#include "Config.hxx"
#include "Diagnose.hxx"
#include "Error.hxx"
#include "HostOperations.hxx"
#include "IdentityFile.hxx"
#include "Interrupt.hxx"
#include "JailTree.hxx"
#include "Username.hxx"
#include "io/MakeDirectory.hxx"
#include "lib/fmt/SystemError.hxx"
#include "util/Exception.hxx"

#include <fmt/core.h>

#include <array>

#include <sys/stat.h>
#include <unistd.h>

const char *
ToString(UserOutcome::Status status) noexcept
{
	using Status = UserOutcome::Status;

	switch (status) {
	case Status::JAILED:
		return "jailed";

	case Status::ALREADY_JAILED:
		return "already jailed";

	case Status::RELEASED:
		return "released";

	case Status::REPAIRED:
		return "repaired";

	case Status::SKIPPED:
		return "skipped";

	case Status::WARNING:
		return "warning";

	case Status::FAILED:
		break;
	}

	return "failed";
}

Lifecycle::Lifecycle(const JailConfig &_config, HostOperations &_host) noexcept
	:config(_config), host(_host),
	 mounts(_host, _config.fstab_path),
	 base(_config, _host),
	 provisioner(_config, _host, base, mounts),
	 shell(_config)
{
}

void
CheckPrivileges(const HostOperations &host)
{
	if (!host.IsPrivileged())
		throw PrivilegeError("This program must be run as root");
}

void
Lifecycle::Prepare()
{
	CheckPrivileges(host);

	for (const auto *path : {&config.confined_shell, &config.limited_shell})
		if (access(path->c_str(), X_OK) < 0)
			throw DependencyMissing(fmt::format("Required program not found: {}",
							    *path));

	base.EnsureBase();
}

template<typename F>
UserOutcome
Lifecycle::Guard(std::string_view username, F &&f)
{
	try {
		return f(username);
	} catch (const FatalJailError &) {
		throw;
	} catch (const ValidationError &) {
		const auto msg = GetFullMessage(std::current_exception());
		logger.Fmt(1, "Warning: skipping '{}': {}", username, msg);
		return {std::string{username}, UserOutcome::Status::SKIPPED, msg};
	} catch (...) {
		const auto msg = GetFullMessage(std::current_exception());
		logger.Fmt(1, "Failed to process '{}': {}", username, msg);
		return {std::string{username}, UserOutcome::Status::FAILED, msg};
	}
}

template<typename F>
std::vector<UserOutcome>
Lifecycle::ForEach(std::span<const std::string> usernames, F &&f)
{
	std::vector<UserOutcome> outcomes;
	outcomes.reserve(usernames.size());

	for (const auto &i : usernames) {
		CheckInterrupted();
		outcomes.push_back(Guard(i, f));
	}

	return outcomes;
}

PasswdEntry
Lifecycle::LoadAccount(std::string_view username) const
{
	CheckUsername(username);

	const auto passwd = PasswdFile::LoadExisting(config.passwd_path);
	const auto *account = passwd.Find(username);
	if (account == nullptr)
		throw ValidationError(fmt::format("No such account: '{}'",
						  username));

	return *account;
}

UserOutcome
Lifecycle::DoJail(std::string_view username)
{
	switch (provisioner.Provision(username)) {
	case ProvisionResult::JAILED:
		return {std::string{username}, UserOutcome::Status::JAILED, {}};

	case ProvisionResult::ALREADY_JAILED:
		return {std::string{username}, UserOutcome::Status::ALREADY_JAILED, {}};

	case ProvisionResult::NO_HOME:
		break;
	}

	return {
		std::string{username}, UserOutcome::Status::WARNING,
		"home directory does not exist, nothing mounted",
	};
}

UserOutcome
Lifecycle::Jail(std::string_view username)
{
	return Guard(username, [this](std::string_view u){
		return DoJail(u);
	});
}

std::vector<UserOutcome>
Lifecycle::JailAll(std::span<const std::string> usernames)
{
	return ForEach(usernames, [this](std::string_view u){
		return DoJail(u);
	});
}

UserOutcome
Lifecycle::DoRelease(std::string_view username)
{
	const auto account = LoadAccount(username);
	const auto real_home = OriginalHome(config, account.home, username);
	const auto jail_home = JailPath(config.GetUserJailPath(username),
					real_home);

	bool modified = mounts.Unbind(jail_home);
	CheckInterrupted();
	modified = shell.Restore(username) || modified;

	if (!modified)
		return {std::string{username}, UserOutcome::Status::SKIPPED,
			"not jailed"};

	logger.Fmt(1, "Released '{}'", username);
	return {std::string{username}, UserOutcome::Status::RELEASED, {}};
}

UserOutcome
Lifecycle::Release(std::string_view username)
{
	return Guard(username, [this](std::string_view u){
		return DoRelease(u);
	});
}

std::vector<UserOutcome>
Lifecycle::ReleaseAll(std::span<const std::string> usernames)
{
	return ForEach(usernames, [this](std::string_view u){
		return DoRelease(u);
	});
}

void
Lifecycle::SetHome(std::string_view username, std::string_view home)
{
	auto passwd = PasswdFile::LoadExisting(config.passwd_path);
	const auto *old_entry = passwd.Find(username);
	if (old_entry == nullptr)
		throw ValidationError(fmt::format("No such account: '{}'",
						  username));

	auto entry = *old_entry;
	entry.home = home;
	passwd.Replace(entry);

	try {
		passwd.Save();
	} catch (...) {
		std::throw_with_nested(IdentityWriteError(fmt::format("Failed to change the home of '{}'",
								      username)));
	}

	logger.Fmt(1, "Changed home of '{}' to '{}'", username, home);
}

UserOutcome
Lifecycle::DoRepair(std::string_view username)
{
	const auto account = LoadAccount(username);
	const auto real_home = OriginalHome(config, account.home, username);
	const auto jail_home = JailPath(config.GetUserJailPath(username),
					real_home);

	mounts.Unbind(jail_home);

	CheckInterrupted();

	shell.Restore(username);

	if (IsInsideJailRoot(config, account.home))
		SetHome(username, real_home);

	if (MakeNestedDirectory(real_home.c_str())) {
		host.Chown(real_home.c_str(), account.uid, account.gid);

		if (chmod(real_home.c_str(), 0755) < 0)
			throw FmtErrno("Failed to chmod '{}'", real_home);

		logger.Fmt(1, "Created home directory '{}'", real_home);
	}

	logger.Fmt(1, "Repaired '{}'", username);
	return {std::string{username}, UserOutcome::Status::REPAIRED, {}};
}

UserOutcome
Lifecycle::Repair(std::string_view username)
{
	return Guard(username, [this](std::string_view u){
		return DoRepair(u);
	});
}

std::vector<UserOutcome>
Lifecycle::RepairAll(std::span<const std::string> usernames)
{
	return ForEach(usernames, [this](std::string_view u){
		return DoRepair(u);
	});
}

std::string
Lifecycle::Diagnose(std::string_view username)
{
	return ::Diagnose(config, host, base, mounts, username);
}

void
LogSummary(std::span<const UserOutcome> outcomes) noexcept
{
	const LLogger logger{"summary"};

	std::array<unsigned, std::size_t(UserOutcome::Status::FAILED) + 1> counts{};

	for (const auto &i : outcomes) {
		++counts[std::size_t(i.status)];

		if (i.message.empty())
			logger.Fmt(1, "{}: {}", i.username, ToString(i.status));
		else
			logger.Fmt(1, "{}: {}: {}", i.username,
				   ToString(i.status), i.message);
	}

	std::string line = fmt::format("{} user(s)", outcomes.size());
	for (std::size_t i = 0; i < counts.size(); ++i)
		if (counts[i] > 0)
			line += fmt::format(", {} {}", counts[i],
					    ToString(UserOutcome::Status(i)));

	logger(1, line);
}
