// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "jail/ShellSwitch.hxx"
#include "jail/Error.hxx"
#include "jail/IdentityFile.hxx"
#include "TestEnvironment.hxx"

#include <gtest/gtest.h>

TEST(ShellSwitch, SetShellOnlyTouchesShell)
{
	TestEnvironment env;
	ShellSwitch shell(env.config);

	const auto before = PasswdFile::LoadExisting(env.config.passwd_path);

	EXPECT_TRUE(shell.SetShell("alice", "/bin/sh"));
	EXPECT_FALSE(shell.SetShell("alice", "/bin/sh"));
	EXPECT_EQ(shell.GetShell("alice"), "/bin/sh");

	const auto after = PasswdFile::LoadExisting(env.config.passwd_path);

	auto expected = *before.Find("alice");
	expected.shell = "/bin/sh";
	EXPECT_EQ(*after.Find("alice"), expected);
	EXPECT_EQ(*after.Find("bob"), *before.Find("bob"));
	EXPECT_EQ(*after.Find("root"), *before.Find("root"));
}

TEST(ShellSwitch, UnknownAccount)
{
	TestEnvironment env;
	ShellSwitch shell(env.config);

	EXPECT_THROW(shell.SetShell("nosuchuser", "/bin/sh"), ValidationError);
	EXPECT_THROW(shell.Confine("nosuchuser"), ValidationError);
}

TEST(ShellSwitch, ConfineRestore)
{
	TestEnvironment env;
	ShellSwitch shell(env.config);

	EXPECT_FALSE(shell.IsConfined("bob"));
	EXPECT_TRUE(shell.Confine("bob"));
	EXPECT_TRUE(shell.IsConfined("bob"));
	EXPECT_EQ(shell.GetRecordedShell("bob"), "/bin/zsh");

	/* confining again keeps the original record */
	EXPECT_FALSE(shell.Confine("bob"));
	EXPECT_EQ(shell.GetRecordedShell("bob"), "/bin/zsh");

	EXPECT_TRUE(shell.Restore("bob"));
	EXPECT_EQ(shell.GetShell("bob"), "/bin/zsh");
	EXPECT_FALSE(shell.GetRecordedShell("bob"));
	EXPECT_FALSE(TestEnvironment::Exists(shell.GetRecordPath("bob")));

	EXPECT_FALSE(shell.Restore("bob"));
}

TEST(ShellSwitch, RestoreWithoutRecord)
{
	TestEnvironment env;
	ShellSwitch shell(env.config);

	shell.SetShell("alice", env.config.confined_shell);
	EXPECT_TRUE(shell.IsConfined("alice"));

	EXPECT_TRUE(shell.Restore("alice"));
	EXPECT_EQ(shell.GetShell("alice"), env.config.normal_shell);
}
