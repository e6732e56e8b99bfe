// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "BaseTemplate.hxx"
#include "MountManager.hxx"
#include "Provisioner.hxx"
#include "ShellSwitch.hxx"
#include "io/Logger.hxx"

#include <span>
#include <string>
#include <string_view>
#include <vector>

struct JailConfig;
class HostOperations;

struct UserOutcome {
	enum class Status {
		JAILED,
		ALREADY_JAILED,
		RELEASED,
		REPAIRED,
		SKIPPED,
		WARNING,
		FAILED,
	};

	std::string username;

	Status status;

	/**
	 * A human-readable explanation (for #SKIPPED, #WARNING and
	 * #FAILED).
	 */
	std::string message;

	bool IsSuccess() const noexcept {
		return status != Status::WARNING && status != Status::FAILED;
	}
};

[[gnu::const]]
const char *
ToString(UserOutcome::Status status) noexcept;

/**
 * Drives the jail lifecycle (jail, release, repair, diagnose) over a
 * sequence of accounts.  Errors which concern only one account are
 * recorded in its #UserOutcome and the next account is processed;
 * #FatalJailError aborts the whole run.
 *
 * Transient mounts of the run are released when this object is
 * destroyed.
 */
class Lifecycle {
	const JailConfig &config;
	HostOperations &host;

	MountManager mounts;
	BaseTemplate base;
	Provisioner provisioner;
	ShellSwitch shell;

	const LLogger logger{"jail"};

public:
	Lifecycle(const JailConfig &_config, HostOperations &_host) noexcept;

	MountManager &GetMountManager() noexcept {
		return mounts;
	}

	/**
	 * Check the privileges and the required programs, and make
	 * sure the base template is usable.
	 *
	 * Throws #FatalJailError on error.
	 */
	void Prepare();

	UserOutcome Jail(std::string_view username);
	std::vector<UserOutcome> JailAll(std::span<const std::string> usernames);

	/**
	 * Undo the jail of an account: unmount its home, remove the
	 * durable mount entry and restore its shell.  The jail
	 * directory is kept.
	 */
	UserOutcome Release(std::string_view username);
	std::vector<UserOutcome> ReleaseAll(std::span<const std::string> usernames);

	/**
	 * Bring a (possibly broken) account back into the unjailed
	 * state.
	 */
	UserOutcome Repair(std::string_view username);
	std::vector<UserOutcome> RepairAll(std::span<const std::string> usernames);

	/**
	 * Throws #ValidationError if the account does not exist.
	 */
	std::string Diagnose(std::string_view username);

private:
	template<typename F>
	UserOutcome Guard(std::string_view username, F &&f);

	template<typename F>
	std::vector<UserOutcome> ForEach(std::span<const std::string> usernames,
					 F &&f);

	PasswdEntry LoadAccount(std::string_view username) const;

	void SetHome(std::string_view username, std::string_view home);

	UserOutcome DoJail(std::string_view username);
	UserOutcome DoRelease(std::string_view username);
	UserOutcome DoRepair(std::string_view username);
};

/**
 * Log the outcome of each account and a summary.
 */
/**
 * Throws #PrivilegeError if the process is not privileged.
 */
void
CheckPrivileges(const HostOperations &host);

void
LogSummary(std::span<const UserOutcome> outcomes) noexcept;
