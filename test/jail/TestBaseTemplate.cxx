// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "jail/BaseTemplate.hxx"
#include "jail/Error.hxx"
#include "jail/IdentityFile.hxx"
#include "TestEnvironment.hxx"

#include <gtest/gtest.h>

#include <algorithm>

#include <sys/stat.h>
#include <unistd.h>

static mode_t
GetMode(const std::string &path)
{
	struct stat st;
	if (lstat(path.c_str(), &st) < 0)
		return 0;

	return st.st_mode & 07777;
}

TEST(BaseTemplate, Manifest)
{
	TestEnvironment env;
	BaseTemplate base(env.config, env.host);

	const auto &m = base.GetManifest();
	EXPECT_EQ(m.files.size(), 3u);

	const auto has = [&m](std::string_view p){
		return std::find(m.paths.begin(), m.paths.end(), p) != m.paths.end();
	};

	EXPECT_TRUE(has(JailPath({}, env.config.confined_shell).substr(1)));
	EXPECT_TRUE(has(JailPath({}, env.config.limited_shell).substr(1)));
	EXPECT_TRUE(has("etc/passwd"));
	EXPECT_TRUE(has("etc/group"));
	EXPECT_TRUE(has("dev/null"));
	EXPECT_TRUE(has("dev/urandom"));
}

TEST(BaseTemplate, MissingShell)
{
	TestEnvironment env;
	env.config.limited_shell = env.Path("host/usr/sbin/nonexistent");

	BaseTemplate base(env.config, env.host);
	EXPECT_THROW(base.GetManifest(), DependencyMissing);
}

TEST(BaseTemplate, EnsureBase)
{
	TestEnvironment env;
	BaseTemplate base(env.config, env.host);

	const auto base_path = env.config.GetBasePath();
	EXPECT_FALSE(base.CheckIntegrity(base_path).empty());

	EXPECT_TRUE(base.EnsureBase());
	EXPECT_TRUE(base.CheckIntegrity(base_path).empty());
	EXPECT_EQ(env.host.device_calls.size(), 4u);
	EXPECT_EQ(GetMode(base_path), 0755);
	EXPECT_EQ(GetMode(JailPath(base_path, "tmp")), 01777);
	EXPECT_EQ(GetMode(JailPath(base_path, env.config.confined_shell)), 0755);

	/* only the system accounts are copied */
	const auto passwd = PasswdFile::LoadExisting(JailPath(base_path, "etc/passwd"));
	EXPECT_TRUE(passwd.Contains("root"));
	EXPECT_TRUE(passwd.Contains("nobody"));
	EXPECT_FALSE(passwd.Contains("daemon"));
	EXPECT_FALSE(passwd.Contains("alice"));

	const auto group = GroupFile::LoadExisting(JailPath(base_path, "etc/group"));
	EXPECT_TRUE(group.Contains("root"));
	EXPECT_TRUE(group.Contains("nogroup"));
	EXPECT_FALSE(group.Contains("alice"));

	/* intact: nothing to do */
	EXPECT_FALSE(base.EnsureBase());

	/* damaged: missing pieces are restored */
	ASSERT_EQ(unlink(JailPath(base_path, env.config.limited_shell).c_str()), 0);
	EXPECT_FALSE(base.CheckIntegrity(base_path).empty());
	EXPECT_TRUE(base.EnsureBase());
	EXPECT_TRUE(base.CheckIntegrity(base_path).empty());
	EXPECT_EQ(env.host.device_calls.size(), 4u);
}

TEST(BaseTemplate, SkeletonTool)
{
	TestEnvironment env;
	env.host.programs["jk_init"] = "/usr/sbin/jk_init";
	env.host.exit_status["jk_init"] = 1;

	BaseTemplate base(env.config, env.host);

	/* a failing tool is not fatal */
	EXPECT_TRUE(base.EnsureBase());
	ASSERT_TRUE(env.host.HasRun("jk_init"));

	const auto &args = env.host.run_calls.front();
	ASSERT_GE(args.size(), 4u);
	EXPECT_EQ(args[1], "-j");
	EXPECT_EQ(args[2], env.config.GetBasePath());
	EXPECT_EQ(args[3], "basicshell");
}

TEST(BaseTemplate, NoSkeletonTool)
{
	TestEnvironment env;
	env.config.skeleton_tool.clear();
	env.host.programs["jk_init"] = "/usr/sbin/jk_init";

	BaseTemplate base(env.config, env.host);
	EXPECT_TRUE(base.EnsureBase());
	EXPECT_TRUE(env.host.run_calls.empty());
}

TEST(BaseTemplate, Instantiate)
{
	TestEnvironment env;
	BaseTemplate base(env.config, env.host);
	base.EnsureBase();

	const auto root = env.config.GetUserJailPath("alice");

	/* a file created in the jail before is kept */
	MakeNestedDirectory(JailPath(root, "etc").c_str());
	TestEnvironment::WriteFile(JailPath(root, "etc/motd"), "hi\n", 0644);

	base.Instantiate(root);
	EXPECT_TRUE(base.CheckIntegrity(root).empty());
	EXPECT_EQ(GetMode(root), 0755);
	EXPECT_EQ(GetMode(JailPath(root, "tmp")), 01777);
	EXPECT_EQ(TestEnvironment::ReadFile(JailPath(root, "etc/motd")), "hi\n");
	EXPECT_EQ(TestEnvironment::ReadFile(JailPath(root, env.config.confined_shell)),
		  "#!/bin/sh\n");

	/* the base template is unchanged */
	EXPECT_FALSE(TestEnvironment::Exists(JailPath(env.config.GetBasePath(),
						      "etc/motd")));
}

TEST(JailTree, MergeUserIdentity)
{
	TestEnvironment env;
	BaseTemplate base(env.config, env.host);
	base.EnsureBase();

	const auto root = env.config.GetUserJailPath("alice");
	base.Instantiate(root);
	EXPECT_FALSE(HasUserIdentity(root, "alice"));

	const auto host_passwd = PasswdFile::LoadExisting(env.config.passwd_path);
	auto account = *host_passwd.Find("alice");

	/* a home inside the jail is mapped back */
	account.home = fmt::format("{}/.{}", root, env.RealHome("alice"));

	MergeUserIdentity(env.config, root, account);
	MergeUserIdentity(env.config, root, account);
	EXPECT_TRUE(HasUserIdentity(root, "alice"));

	const auto passwd = PasswdFile::LoadExisting(JailPath(root, "etc/passwd"));
	const auto *e = passwd.Find("alice");
	ASSERT_NE(e, nullptr);
	EXPECT_EQ(e->home, env.RealHome("alice"));
	EXPECT_EQ(e->shell, env.config.limited_shell);
	EXPECT_EQ(e->uid, 1001u);

	const auto group = GroupFile::LoadExisting(JailPath(root, "etc/group"));
	EXPECT_EQ(group.Count("alice"), 1u);
	EXPECT_FALSE(group.Contains("bob"));
}

TEST(JailTree, OriginalHome)
{
	JailConfig config;
	config.jail_root = "/home/jail";
	config.home_root = "/home";

	EXPECT_EQ(OriginalHome(config, "/home/alice", "alice"), "/home/alice");
	EXPECT_EQ(OriginalHome(config, "/srv/www/alice", "alice"), "/srv/www/alice");
	EXPECT_EQ(OriginalHome(config, "/home/jail/alice/./home/alice", "alice"),
		  "/home/alice");
	EXPECT_EQ(OriginalHome(config, "/home/jail/alice/srv/alice", "alice"),
		  "/srv/alice");
	EXPECT_EQ(OriginalHome(config, "/home/jail/alice", "alice"), "/home/alice");
	EXPECT_EQ(OriginalHome(config, "/home/jail", "alice"), "/home/alice");

	/* not inside the jail root, just a common prefix */
	EXPECT_EQ(OriginalHome(config, "/home/jailbird", "jailbird"),
		  "/home/jailbird");
}

TEST(JailTree, IsInsideJailRoot)
{
	JailConfig config;
	config.jail_root = "/home/jail/";

	EXPECT_TRUE(IsInsideJailRoot(config, "/home/jail"));
	EXPECT_TRUE(IsInsideJailRoot(config, "/home/jail/alice"));
	EXPECT_FALSE(IsInsideJailRoot(config, "/home/jailbird"));
	EXPECT_FALSE(IsInsideJailRoot(config, "/home/alice"));
}

TEST(JailTree, JailPath)
{
	EXPECT_EQ(JailPath("/home/jail/alice", "/home/alice"),
		  "/home/jail/alice/home/alice");
	EXPECT_EQ(JailPath("/home/jail/alice", "etc/passwd"),
		  "/home/jail/alice/etc/passwd");
}
