// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "jail/Lifecycle.hxx"
#include "jail/Error.hxx"
#include "jail/IdentityFile.hxx"
#include "jail/Interrupt.hxx"
#include "jail/MountTable.hxx"
#include "jail/State.hxx"
#include "TestEnvironment.hxx"

#include <gtest/gtest.h>

#include <filesystem>

#include <unistd.h>

using Status = UserOutcome::Status;

static JailState
GetState(TestEnvironment &env, Lifecycle &lifecycle, std::string_view username)
{
	BaseTemplate base(env.config, env.host);
	const auto passwd = PasswdFile::LoadExisting(env.config.passwd_path);
	return InspectJail(env.config, base, lifecycle.GetMountManager(),
			   *passwd.Find(username)).GetState();
}

static std::string
GetShell(const TestEnvironment &env, std::string_view username)
{
	return PasswdFile::LoadExisting(env.config.passwd_path).Find(username)->shell;
}

TEST(Lifecycle, Prepare)
{
	TestEnvironment env;
	Lifecycle lifecycle(env.config, env.host);

	lifecycle.Prepare();
	EXPECT_TRUE(TestEnvironment::Exists(JailPath(env.config.GetBasePath(),
						     "dev/null")));

	/* the second run reuses the base template */
	lifecycle.Prepare();
	EXPECT_EQ(env.host.device_calls.size(), 4u);
}

TEST(Lifecycle, NotPrivileged)
{
	TestEnvironment env;
	env.host.privileged = false;

	Lifecycle lifecycle(env.config, env.host);
	EXPECT_THROW(CheckPrivileges(env.host), PrivilegeError);
	EXPECT_THROW(lifecycle.Prepare(), PrivilegeError);
	EXPECT_FALSE(TestEnvironment::Exists(env.config.jail_root));
}

TEST(Lifecycle, MissingShell)
{
	TestEnvironment env;
	env.config.confined_shell = env.Path("host/usr/sbin/nonexistent");

	Lifecycle lifecycle(env.config, env.host);
	EXPECT_THROW(lifecycle.Prepare(), DependencyMissing);
	EXPECT_FALSE(TestEnvironment::Exists(env.config.jail_root));
}

TEST(Lifecycle, JailAll)
{
	TestEnvironment env;
	Lifecycle lifecycle(env.config, env.host);
	lifecycle.Prepare();

	const std::vector<std::string> users{"alice", "bob", ""};
	const auto outcomes = lifecycle.JailAll(users);
	ASSERT_EQ(outcomes.size(), 3u);

	EXPECT_EQ(outcomes[0].username, "alice");
	EXPECT_EQ(outcomes[0].status, Status::JAILED);
	EXPECT_TRUE(outcomes[0].IsSuccess());
	EXPECT_EQ(outcomes[1].status, Status::JAILED);
	EXPECT_EQ(outcomes[2].status, Status::SKIPPED);
	EXPECT_EQ(outcomes[2].message, "Empty user name");

	for (const char *u : {"alice", "bob"}) {
		EXPECT_EQ(GetShell(env, u), env.config.confined_shell);
		EXPECT_TRUE(env.host.mounted.contains(env.JailHome(u)));
		EXPECT_EQ(GetState(env, lifecycle, u), JailState::JAILED);

		const auto jail_passwd = PasswdFile::LoadExisting(JailPath(env.config.GetUserJailPath(u),
									   "etc/passwd"));
		const auto *e = jail_passwd.Find(u);
		ASSERT_NE(e, nullptr);
		EXPECT_EQ(e->home, env.RealHome(u));
		EXPECT_EQ(e->shell, env.config.limited_shell);

		/* the other account is not visible in this jail */
		EXPECT_FALSE(jail_passwd.Contains(std::string_view{u} == "alice" ? "bob" : "alice"));
	}

	/* the account records were not touched otherwise */
	const auto passwd = PasswdFile::LoadExisting(env.config.passwd_path);
	EXPECT_EQ(passwd.Find("alice")->home, env.RealHome("alice"));
	EXPECT_EQ(passwd.Find("bob")->home, env.RealHome("bob"));
	EXPECT_EQ(passwd.Find("root")->shell, "/bin/bash");

	const auto fstab = MountTable::Load(env.config.fstab_path);
	EXPECT_EQ(fstab.Count(env.RealHome("alice"), env.JailHome("alice")), 1u);
	EXPECT_EQ(fstab.Count(env.RealHome("bob"), env.JailHome("bob")), 1u);
	EXPECT_TRUE(fstab.ContainsTarget("/proc"));
}

TEST(Lifecycle, Idempotent)
{
	TestEnvironment env;
	Lifecycle lifecycle(env.config, env.host);
	lifecycle.Prepare();

	const std::vector<std::string> users{"alice"};
	EXPECT_EQ(lifecycle.JailAll(users).front().status, Status::JAILED);

	const auto passwd = TestEnvironment::ReadFile(env.config.passwd_path);
	const auto group = TestEnvironment::ReadFile(env.config.group_path);
	const auto fstab = TestEnvironment::ReadFile(env.config.fstab_path);
	const auto n_binds = env.host.bind_calls.size();

	lifecycle.Prepare();
	EXPECT_EQ(lifecycle.JailAll(users).front().status, Status::ALREADY_JAILED);

	EXPECT_EQ(env.host.bind_calls.size(), n_binds);
	EXPECT_EQ(TestEnvironment::ReadFile(env.config.passwd_path), passwd);
	EXPECT_EQ(TestEnvironment::ReadFile(env.config.group_path), group);
	EXPECT_EQ(TestEnvironment::ReadFile(env.config.fstab_path), fstab);
}

TEST(Lifecycle, Release)
{
	TestEnvironment env;
	const auto passwd = TestEnvironment::ReadFile(env.config.passwd_path);
	const auto fstab = TestEnvironment::ReadFile(env.config.fstab_path);

	Lifecycle lifecycle(env.config, env.host);
	lifecycle.Prepare();
	EXPECT_EQ(lifecycle.Jail("bob").status, Status::JAILED);

	const auto outcome = lifecycle.Release("bob");
	EXPECT_EQ(outcome.status, Status::RELEASED);

	EXPECT_EQ(GetShell(env, "bob"), "/bin/zsh");
	EXPECT_FALSE(env.host.mounted.contains(env.JailHome("bob")));
	EXPECT_EQ(GetState(env, lifecycle, "bob"), JailState::UNJAILED);
	EXPECT_EQ(TestEnvironment::ReadFile(env.config.passwd_path), passwd);
	EXPECT_EQ(TestEnvironment::ReadFile(env.config.fstab_path), fstab);

	/* the home contents are untouched */
	EXPECT_EQ(TestEnvironment::ReadFile(env.RealHome("bob") + "/index.html"),
		  "hello\n");

	EXPECT_EQ(lifecycle.Release("bob").status, Status::SKIPPED);
}

TEST(Lifecycle, ReleaseUnknown)
{
	TestEnvironment env;
	Lifecycle lifecycle(env.config, env.host);

	const std::vector<std::string> users{"nosuchuser", "alice"};
	const auto outcomes = lifecycle.ReleaseAll(users);
	ASSERT_EQ(outcomes.size(), 2u);
	EXPECT_EQ(outcomes[0].status, Status::SKIPPED);
	EXPECT_NE(outcomes[0].message.find("No such account"), std::string::npos);
	EXPECT_EQ(outcomes[1].status, Status::SKIPPED);
}

TEST(Lifecycle, BindFailure)
{
	TestEnvironment env;
	Lifecycle lifecycle(env.config, env.host);
	lifecycle.Prepare();

	env.host.fail_bind = true;

	const auto failed = lifecycle.Jail("alice");
	EXPECT_EQ(failed.status, Status::FAILED);
	EXPECT_FALSE(failed.message.empty());

	/* nothing was left behind */
	EXPECT_EQ(GetShell(env, "alice"), "/bin/bash");
	EXPECT_FALSE(lifecycle.GetMountManager().HasDurableTarget(env.JailHome("alice")));
	EXPECT_EQ(GetState(env, lifecycle, "alice"), JailState::UNJAILED);

	/* the next run succeeds */
	env.host.fail_bind = false;
	EXPECT_EQ(lifecycle.Jail("alice").status, Status::JAILED);
	EXPECT_EQ(GetState(env, lifecycle, "alice"), JailState::JAILED);
}

TEST(Lifecycle, PersistFailure)
{
	TestEnvironment env;

	/* the durable mount table cannot be written */
	env.config.fstab_path = env.Path("nodir/fstab");

	Lifecycle lifecycle(env.config, env.host);
	lifecycle.Prepare();

	const auto failed = lifecycle.Jail("alice");
	EXPECT_EQ(failed.status, Status::FAILED);
	EXPECT_NE(failed.message.find("Failed to persist mount"), std::string::npos);
	EXPECT_NE(failed.message.find("No such file or directory"), std::string::npos);

	/* the transient bind mount was released and the shell restored */
	EXPECT_FALSE(env.host.mounted.contains(env.JailHome("alice")));
	EXPECT_FALSE(lifecycle.GetMountManager().IsTransient(env.JailHome("alice")));
	EXPECT_EQ(GetShell(env, "alice"), "/bin/bash");
}

TEST(Lifecycle, PersistFailureWhileMounted)
{
	TestEnvironment env;
	env.config.fstab_path = env.Path("nodir/fstab");

	Lifecycle lifecycle(env.config, env.host);
	lifecycle.Prepare();

	/* a leftover mount from an earlier run */
	env.host.mounted.emplace(env.JailHome("alice"));

	EXPECT_EQ(lifecycle.Jail("alice").status, Status::FAILED);

	/* not owned by this run, so it stays; the shell is restored */
	EXPECT_TRUE(env.host.mounted.contains(env.JailHome("alice")));
	EXPECT_EQ(GetShell(env, "alice"), "/bin/bash");
}

TEST(Lifecycle, RepairDamagedJail)
{
	TestEnvironment env;
	Lifecycle lifecycle(env.config, env.host);
	lifecycle.Prepare();

	EXPECT_EQ(lifecycle.Jail("alice").status, Status::JAILED);

	const auto user_jail = env.config.GetUserJailPath("alice");
	const auto dev_null = JailPath(user_jail, "dev/null");
	const auto shell = JailPath(user_jail, env.config.confined_shell);
	ASSERT_EQ(unlink(dev_null.c_str()), 0);
	ASSERT_EQ(unlink(shell.c_str()), 0);
	EXPECT_EQ(GetState(env, lifecycle, "alice"), JailState::BROKEN);

	const auto n_binds = env.host.bind_calls.size();

	EXPECT_EQ(lifecycle.Jail("alice").status, Status::JAILED);
	EXPECT_TRUE(TestEnvironment::Exists(dev_null));
	EXPECT_TRUE(TestEnvironment::Exists(shell));
	EXPECT_EQ(GetState(env, lifecycle, "alice"), JailState::JAILED);

	/* the existing mount was reused */
	EXPECT_EQ(env.host.bind_calls.size(), n_binds);
	EXPECT_EQ(MountTable::Load(env.config.fstab_path).Count(env.RealHome("alice"),
								 env.JailHome("alice")),
		  1u);
}

TEST(Lifecycle, JailReleaseJail)
{
	TestEnvironment env;
	Lifecycle lifecycle(env.config, env.host);
	lifecycle.Prepare();

	EXPECT_EQ(lifecycle.Jail("bob").status, Status::JAILED);
	EXPECT_EQ(lifecycle.Release("bob").status, Status::RELEASED);
	EXPECT_EQ(GetShell(env, "bob"), "/bin/zsh");

	EXPECT_EQ(lifecycle.Jail("bob").status, Status::JAILED);
	EXPECT_EQ(GetShell(env, "bob"), env.config.confined_shell);
	EXPECT_TRUE(env.host.mounted.contains(env.JailHome("bob")));
	EXPECT_EQ(GetState(env, lifecycle, "bob"), JailState::JAILED);
	EXPECT_EQ(MountTable::Load(env.config.fstab_path).Count(env.RealHome("bob"),
								 env.JailHome("bob")),
		  1u);

	/* the shell recorded before the first jail is still restored */
	EXPECT_EQ(lifecycle.Release("bob").status, Status::RELEASED);
	EXPECT_EQ(GetShell(env, "bob"), "/bin/zsh");
}

TEST(Lifecycle, BrokenAfterReboot)
{
	TestEnvironment env;
	Lifecycle lifecycle(env.config, env.host);
	lifecycle.Prepare();
	lifecycle.Jail("alice");

	/* the mount is gone, the durable entry remains */
	env.host.mounted.clear();
	EXPECT_EQ(GetState(env, lifecycle, "alice"), JailState::BROKEN);

	EXPECT_EQ(lifecycle.Jail("alice").status, Status::JAILED);
	EXPECT_EQ(GetState(env, lifecycle, "alice"), JailState::JAILED);
	EXPECT_EQ(MountTable::Load(env.config.fstab_path)
		  .Count(env.RealHome("alice"), env.JailHome("alice")), 1u);
}

TEST(Lifecycle, Repair)
{
	TestEnvironment env;
	Lifecycle lifecycle(env.config, env.host);
	lifecycle.Prepare();
	lifecycle.Jail("alice");

	/* damage: the home field points into the jail */
	{
		auto passwd = PasswdFile::LoadExisting(env.config.passwd_path);
		auto e = *passwd.Find("alice");
		e.home = fmt::format("{}/.{}", env.config.GetUserJailPath("alice"),
				     env.RealHome("alice"));
		passwd.Replace(e);
		passwd.Save();
	}

	EXPECT_EQ(lifecycle.Repair("alice").status, Status::REPAIRED);

	const auto passwd = PasswdFile::LoadExisting(env.config.passwd_path);
	EXPECT_EQ(passwd.Find("alice")->home, env.RealHome("alice"));
	EXPECT_EQ(passwd.Find("alice")->shell, "/bin/bash");
	EXPECT_FALSE(env.host.mounted.contains(env.JailHome("alice")));
	EXPECT_EQ(GetState(env, lifecycle, "alice"), JailState::UNJAILED);
}

TEST(Lifecycle, RepairMissingHome)
{
	TestEnvironment env;
	std::filesystem::remove_all(env.RealHome("bob"));

	Lifecycle lifecycle(env.config, env.host);
	const std::vector<std::string> users{"bob"};
	EXPECT_EQ(lifecycle.RepairAll(users).front().status, Status::REPAIRED);

	EXPECT_TRUE(TestEnvironment::Exists(env.RealHome("bob")));
	ASSERT_EQ(env.host.chown_calls.size(), 1u);
	EXPECT_EQ(env.host.chown_calls.front(), env.RealHome("bob"));
}

TEST(Lifecycle, MissingHome)
{
	TestEnvironment env;
	std::filesystem::remove_all(env.RealHome("bob"));

	Lifecycle lifecycle(env.config, env.host);
	lifecycle.Prepare();

	const auto outcome = lifecycle.Jail("bob");
	EXPECT_EQ(outcome.status, Status::WARNING);
	EXPECT_FALSE(outcome.IsSuccess());
	EXPECT_EQ(GetShell(env, "bob"), env.config.confined_shell);
	EXPECT_TRUE(env.host.bind_calls.empty());
}

TEST(Lifecycle, CreateAccount)
{
	TestEnvironment env;
	env.host.programs["useradd"] = "/usr/sbin/useradd";

	Lifecycle lifecycle(env.config, env.host);
	lifecycle.Prepare();

	EXPECT_EQ(lifecycle.Jail("carol").status, Status::JAILED);
	EXPECT_TRUE(env.host.HasRun("useradd"));
	EXPECT_EQ(GetShell(env, "carol"), env.config.confined_shell);
	EXPECT_TRUE(env.host.mounted.contains(env.JailHome("carol")));

	/* no previous shell was recorded, release falls back to the
	   normal shell */
	EXPECT_EQ(lifecycle.Release("carol").status, Status::RELEASED);
	EXPECT_EQ(GetShell(env, "carol"), env.config.normal_shell);
}

TEST(Lifecycle, CreateAccountFailure)
{
	TestEnvironment env;

	Lifecycle lifecycle(env.config, env.host);
	lifecycle.Prepare();

	auto outcome = lifecycle.Jail("carol");
	EXPECT_EQ(outcome.status, Status::FAILED);
	EXPECT_NE(outcome.message.find("useradd not found"), std::string::npos);

	env.host.programs["useradd"] = "/usr/sbin/useradd";
	env.host.exit_status["useradd"] = 9;

	outcome = lifecycle.Jail("dave");
	EXPECT_EQ(outcome.status, Status::FAILED);
	EXPECT_NE(outcome.message.find("status 9"), std::string::npos);
}

TEST(Lifecycle, InvalidName)
{
	TestEnvironment env;
	env.host.programs["useradd"] = "/usr/sbin/useradd";

	Lifecycle lifecycle(env.config, env.host);
	lifecycle.Prepare();

	const auto outcome = lifecycle.Jail("../etc");
	EXPECT_EQ(outcome.status, Status::SKIPPED);
	EXPECT_NE(outcome.message.find("Invalid user name"), std::string::npos);
	EXPECT_FALSE(env.host.HasRun("useradd"));
}

TEST(Lifecycle, Interrupted)
{
	TestEnvironment env;
	Lifecycle lifecycle(env.config, env.host);
	lifecycle.Prepare();

	RequestInterrupt();

	const std::vector<std::string> users{"alice", "bob"};
	EXPECT_THROW(lifecycle.JailAll(users), Interrupted);
	EXPECT_TRUE(env.host.bind_calls.empty());

	ClearInterrupt();
}
