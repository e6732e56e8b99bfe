// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "State.hxx"
#include "BaseTemplate.hxx"
#include "Config.hxx"
#include "IdentityRecord.hxx"
#include "JailTree.hxx"
#include "MountManager.hxx"

const char *
ToString(JailState state) noexcept
{
	switch (state) {
	case JailState::UNJAILED:
		return "unjailed";

	case JailState::JAILED:
		return "jailed";

	case JailState::BROKEN:
		break;
	}

	return "broken";
}

JailState
JailStatus::GetState() const noexcept
{
	if (!confined && !mounted && !durable_target)
		return JailState::UNJAILED;

	if (confined && mounted && durable && jail_intact && identity)
		return JailState::JAILED;

	return JailState::BROKEN;
}

JailStatus
InspectJail(const JailConfig &config, BaseTemplate &base,
	    const MountManager &mounts, const PasswdEntry &account)
{
	const auto user_jail = config.GetUserJailPath(account.name);

	JailStatus status;
	status.real_home = OriginalHome(config, account.home, account.name);
	status.jail_home = JailPath(user_jail, status.real_home);

	status.confined = account.shell == config.confined_shell;
	status.mounted = mounts.IsMounted(status.jail_home);
	status.durable = mounts.HasDurableEntry(status.real_home,
						status.jail_home);
	status.durable_target = status.durable ||
		mounts.HasDurableTarget(status.jail_home);
	status.jail_intact = base.CheckIntegrity(user_jail).empty();
	status.identity = status.jail_intact &&
		HasUserIdentity(user_jail, account.name);

	return status;
}
