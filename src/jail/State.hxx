// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <string>

struct JailConfig;
struct PasswdEntry;
class BaseTemplate;
class MountManager;

enum class JailState {
	/**
	 * Not confined, home not mounted, no durable mount entry.
	 */
	UNJAILED,

	/**
	 * Confined, home mounted and listed in the durable mount
	 * table, jail intact and identity records present.
	 */
	JAILED,

	/**
	 * Anything in between, e.g. after a crash.
	 */
	BROKEN,
};

[[gnu::const]]
const char *
ToString(JailState state) noexcept;

/**
 * A snapshot of the jail-related properties of one account.
 */
struct JailStatus {
	/**
	 * The original (real) home directory.
	 */
	std::string real_home;

	/**
	 * The real home directory as seen from outside the jail,
	 * i.e. the bind mount target.
	 */
	std::string jail_home;

	bool confined = false;
	bool mounted = false;

	/**
	 * Does the durable mount table contain exactly this bind
	 * mount?
	 */
	bool durable = false;

	/**
	 * Does the durable mount table contain any entry for
	 * #jail_home?
	 */
	bool durable_target = false;

	bool jail_intact = false;
	bool identity = false;

	[[gnu::pure]]
	JailState GetState() const noexcept;
};

/**
 * Inspect the given account.  This function does not modify
 * anything.
 *
 * Throws on error.
 */
JailStatus
InspectJail(const JailConfig &config, BaseTemplate &base,
	    const MountManager &mounts, const PasswdEntry &account);
