// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "ShellSwitch.hxx"
#include "io/Logger.hxx"

#include <string>
#include <string_view>

struct JailConfig;
struct PasswdEntry;
class HostOperations;
class BaseTemplate;
class MountManager;

enum class ProvisionResult {
	/**
	 * The account has been jailed by this call.
	 */
	JAILED,

	/**
	 * The account was jailed already; nothing was changed.
	 */
	ALREADY_JAILED,

	/**
	 * The account is confined, but its real home directory does
	 * not exist, so there is nothing to mount.
	 */
	NO_HOME,
};

/**
 * Materializes (or repairs) the jail of one account.
 */
class Provisioner {
	const JailConfig &config;
	HostOperations &host;
	BaseTemplate &base;
	MountManager &mounts;

	ShellSwitch shell;

	const LLogger logger{"provision"};

public:
	Provisioner(const JailConfig &_config, HostOperations &_host,
		    BaseTemplate &_base, MountManager &_mounts) noexcept
		:config(_config), host(_host), base(_base), mounts(_mounts),
		 shell(_config) {}

	/**
	 * Jail the given account; it is created if it does not
	 * exist.  If this fails, the shell is restored and mounts
	 * created by this call are released.
	 *
	 * Throws #UserJailError (or std::system_error) on per-user
	 * errors, #FatalJailError on fatal errors.
	 */
	ProvisionResult Provision(std::string_view username);

private:
	PasswdEntry EnsureAccount(std::string_view username);

	void Rollback(std::string_view username,
		      const std::string &jail_home, bool mounted) noexcept;
};
