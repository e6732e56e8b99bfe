// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "jail/Lifecycle.hxx"
#include "jail/Error.hxx"
#include "TestEnvironment.hxx"

#include <gtest/gtest.h>

static bool
Contains(const std::string &haystack, std::string_view needle) noexcept
{
	return haystack.find(needle) != haystack.npos;
}

TEST(Diagnose, Jailed)
{
	TestEnvironment env;
	Lifecycle lifecycle(env.config, env.host);
	lifecycle.Prepare();
	lifecycle.Jail("alice");

	const auto passwd = TestEnvironment::ReadFile(env.config.passwd_path);
	const auto fstab = TestEnvironment::ReadFile(env.config.fstab_path);
	const auto n_binds = env.host.bind_calls.size();
	const auto n_unmounts = env.host.unmount_calls.size();

	const auto report = lifecycle.Diagnose("alice");
	EXPECT_TRUE(Contains(report, "Diagnosis for 'alice'"));
	EXPECT_TRUE(Contains(report, "[OK] confined shell"));
	EXPECT_TRUE(Contains(report, "[OK] present in the jail"));
	EXPECT_TRUE(Contains(report, "[OK] mounted"));
	EXPECT_TRUE(Contains(report, "[OK] jail home path is correct"));
	EXPECT_TRUE(Contains(report, "SELinux: not installed"));
	EXPECT_TRUE(Contains(report, "State: jailed"));

	/* read-only */
	EXPECT_EQ(TestEnvironment::ReadFile(env.config.passwd_path), passwd);
	EXPECT_EQ(TestEnvironment::ReadFile(env.config.fstab_path), fstab);
	EXPECT_EQ(env.host.bind_calls.size(), n_binds);
	EXPECT_EQ(env.host.unmount_calls.size(), n_unmounts);
}

TEST(Diagnose, Unjailed)
{
	TestEnvironment env;
	Lifecycle lifecycle(env.config, env.host);

	const auto report = lifecycle.Diagnose("bob");
	EXPECT_TRUE(Contains(report, "[ERROR] not the confined shell"));
	EXPECT_TRUE(Contains(report, "[ERROR] not mounted"));
	EXPECT_TRUE(Contains(report, "[ERROR] no record in the jail"));
	EXPECT_TRUE(Contains(report, "State: unjailed"));

	/* nothing was created */
	EXPECT_FALSE(TestEnvironment::Exists(env.config.jail_root));
}

TEST(Diagnose, Broken)
{
	TestEnvironment env;
	Lifecycle lifecycle(env.config, env.host);
	lifecycle.Prepare();
	lifecycle.Jail("alice");
	env.host.mounted.clear();

	const auto report = lifecycle.Diagnose("alice");
	EXPECT_TRUE(Contains(report, "[ERROR] not mounted"));
	EXPECT_TRUE(Contains(report, "State: broken"));
}

TEST(Diagnose, UnknownAccount)
{
	TestEnvironment env;
	Lifecycle lifecycle(env.config, env.host);

	EXPECT_THROW(lifecycle.Diagnose("nosuchuser"), ValidationError);
	EXPECT_THROW(lifecycle.Diagnose("Bad Name"), ValidationError);
}
