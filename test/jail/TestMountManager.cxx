// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "jail/MountManager.hxx"
#include "jail/MountTable.hxx"
#include "jail/Error.hxx"
#include "TestEnvironment.hxx"

#include <gtest/gtest.h>

TEST(MountManager, TransientReleasedAtScopeExit)
{
	TestEnvironment env;
	const auto source = env.RealHome("alice");
	const auto target = env.JailHome("alice");

	{
		MountManager mounts(env.host, env.config.fstab_path);
		EXPECT_EQ(mounts.Bind(source, target, false), BindResult::MOUNTED);
		EXPECT_TRUE(mounts.IsMounted(target));
		EXPECT_TRUE(mounts.IsTransient(target));
		EXPECT_FALSE(mounts.HasDurableTarget(target));

		/* the target directory was created */
		EXPECT_TRUE(TestEnvironment::Exists(target));
	}

	EXPECT_FALSE(env.host.mounted.contains(target));
	ASSERT_EQ(env.host.unmount_calls.size(), 1u);
	EXPECT_EQ(env.host.unmount_calls.front(), target);
}

TEST(MountManager, AlreadyMounted)
{
	TestEnvironment env;
	const auto source = env.RealHome("alice");
	const auto target = env.JailHome("alice");

	MountManager mounts(env.host, env.config.fstab_path);
	EXPECT_EQ(mounts.Bind(source, target, false), BindResult::MOUNTED);
	EXPECT_EQ(mounts.Bind(source, target, false), BindResult::ALREADY_MOUNTED);
	EXPECT_EQ(env.host.bind_calls.size(), 1u);
}

TEST(MountManager, Persistent)
{
	TestEnvironment env;
	const auto source = env.RealHome("alice");
	const auto target = env.JailHome("alice");

	{
		MountManager mounts(env.host, env.config.fstab_path);
		EXPECT_EQ(mounts.Bind(source, target, true), BindResult::MOUNTED);
		EXPECT_FALSE(mounts.IsTransient(target));
		EXPECT_TRUE(mounts.HasDurableEntry(source, target));

		/* binding again does not duplicate the durable entry */
		EXPECT_EQ(mounts.Bind(source, target, true), BindResult::ALREADY_MOUNTED);
	}

	/* persistent mounts survive the run */
	EXPECT_TRUE(env.host.mounted.contains(target));
	EXPECT_TRUE(env.host.unmount_calls.empty());

	const auto table = MountTable::Load(env.config.fstab_path);
	EXPECT_EQ(table.Count(source, target), 1u);

	/* foreign lines are preserved */
	const auto text = TestEnvironment::ReadFile(env.config.fstab_path);
	EXPECT_EQ(text.rfind("# /etc/fstab: static file system information.\n"
			     "proc /proc proc defaults 0 0\n", 0), 0u);
}

TEST(MountManager, Persist)
{
	TestEnvironment env;
	const auto source = env.RealHome("alice");
	const auto target = env.JailHome("alice");

	{
		MountManager mounts(env.host, env.config.fstab_path);
		mounts.Bind(source, target, false);
		mounts.Persist(source, target);
		mounts.Persist(source, target);
		EXPECT_FALSE(mounts.IsTransient(target));
	}

	EXPECT_TRUE(env.host.mounted.contains(target));
	EXPECT_EQ(MountTable::Load(env.config.fstab_path).Count(source, target), 1u);
}

TEST(MountManager, Unbind)
{
	TestEnvironment env;
	const auto source = env.RealHome("alice");
	const auto target = env.JailHome("alice");

	MountManager mounts(env.host, env.config.fstab_path);
	mounts.Bind(source, target, true);

	EXPECT_TRUE(mounts.Unbind(target));
	EXPECT_FALSE(mounts.IsMounted(target));
	EXPECT_FALSE(mounts.HasDurableTarget(target));

	/* no-op when absent */
	EXPECT_FALSE(mounts.Unbind(target));
	EXPECT_EQ(env.host.unmount_calls.size(), 1u);
}

TEST(MountManager, BindError)
{
	TestEnvironment env;
	env.host.fail_bind = true;

	MountManager mounts(env.host, env.config.fstab_path);
	EXPECT_THROW(mounts.Bind(env.RealHome("alice"), env.JailHome("alice"), true),
		     MountError);
	EXPECT_FALSE(mounts.HasDurableTarget(env.JailHome("alice")));
}

TEST(MountManager, Release)
{
	TestEnvironment env;
	const auto target = env.JailHome("alice");

	MountManager mounts(env.host, env.config.fstab_path);
	mounts.Bind(env.RealHome("alice"), target, false);
	mounts.Release(target);
	EXPECT_FALSE(mounts.IsMounted(target));

	/* not tracked anymore: nothing to do */
	mounts.Release(target);
	mounts.ReleaseTransient();
	EXPECT_EQ(env.host.unmount_calls.size(), 1u);
}
