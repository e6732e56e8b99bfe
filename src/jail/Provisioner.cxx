// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Provisioner.hxx"
#include "BaseTemplate.hxx"
#include "Config.hxx"
#include "Error.hxx"
#include "HostOperations.hxx"
#include "IdentityFile.hxx"
#include "Interrupt.hxx"
#include "JailTree.hxx"
#include "MountManager.hxx"
#include "State.hxx"
#include "Username.hxx"
#include "io/MakeDirectory.hxx"

#include <fmt/core.h>

#include <sys/stat.h>

static bool
IsDirectory(const char *path) noexcept
{
	struct stat st;
	return stat(path, &st) == 0 && S_ISDIR(st.st_mode);
}

PasswdEntry
Provisioner::EnsureAccount(std::string_view username)
{
	if (const auto passwd = PasswdFile::LoadExisting(config.passwd_path);
	    const auto *e = passwd.Find(username))
		return *e;

	if (host.FindProgram("useradd").empty())
		throw UserJailError(fmt::format("Cannot create account '{}': useradd not found",
						username));

	logger.Fmt(1, "Creating account '{}'", username);

	const int status = host.Run({
		"useradd", "-m",
		"-d", config.GetRealHome(username),
		"-s", config.confined_shell,
		std::string{username},
	});
	if (status != 0)
		throw UserJailError(fmt::format("useradd '{}' failed with status {}",
						username, status));

	const auto passwd = PasswdFile::LoadExisting(config.passwd_path);
	if (const auto *e = passwd.Find(username))
		return *e;

	throw UserJailError(fmt::format("Account '{}' was not created",
					  username));
}

ProvisionResult
Provisioner::Provision(std::string_view username)
{
	CheckUsername(username);

	const ChildLogger ulogger(logger, username);

	auto account = EnsureAccount(username);

	if (InspectJail(config, base, mounts, account).GetState() == JailState::JAILED) {
		ulogger(2, "Already jailed");
		return ProvisionResult::ALREADY_JAILED;
	}

	CheckInterrupted();

	const auto user_jail = config.GetUserJailPath(username);
	if (const auto missing = base.CheckIntegrity(user_jail); !missing.empty()) {
		ulogger.Fmt(1, "Instantiating jail '{}'", user_jail);
		base.Instantiate(user_jail);
	}

	MergeUserIdentity(config, user_jail, account);

	CheckInterrupted();

	const auto real_home = OriginalHome(config, account.home, username);
	const auto jail_home = JailPath(user_jail, real_home);
	const bool have_home = IsDirectory(real_home.c_str());

	bool mounted = false;

	try {
		if (have_home) {
			if (!mounts.IsMounted(jail_home) &&
			    MakeNestedDirectory(jail_home.c_str()))
				host.Chown(jail_home.c_str(),
					   account.uid, account.gid);

			mounted = mounts.Bind(real_home, jail_home, false) == BindResult::MOUNTED;
		} else
			ulogger.Fmt(1, "Warning: home directory '{}' does not exist, the jail will be empty",
				    real_home);

		CheckInterrupted();

		shell.Confine(username);

		/* verify the result before making it permanent */
		if (!shell.IsConfined(username))
			throw IntegrityError(fmt::format("Shell of '{}' is not '{}' after the switch",
							 username, config.confined_shell));

		if (have_home) {
			if (!mounts.IsMounted(jail_home))
				throw IntegrityError(fmt::format("'{}' is not mounted after the bind",
								 jail_home));

			mounts.Persist(real_home, jail_home);
		}
	} catch (...) {
		Rollback(username, jail_home, mounted);
		throw;
	}

	if (!have_home)
		return ProvisionResult::NO_HOME;

	ulogger(1, "Jailed");
	return ProvisionResult::JAILED;
}

void
Provisioner::Rollback(std::string_view username,
		      const std::string &jail_home, bool mounted) noexcept
{
	const ChildLogger ulogger(logger, username);

	try {
		shell.Restore(username);
	} catch (...) {
		ulogger(1, "Failed to restore the shell: ",
			std::current_exception());
	}

	if (mounted) {
		try {
			mounts.Release(jail_home);
		} catch (...) {
			ulogger(1, "Failed to release the mount: ",
				std::current_exception());
		}
	}
}
