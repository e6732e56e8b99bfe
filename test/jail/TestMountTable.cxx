// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "jail/MountTable.hxx"

#include <gtest/gtest.h>

TEST(MountTableEntry, Parse)
{
	auto e = MountTableEntry::Parse("/home/alice\t/home/jail/alice/home/alice  none bind 0 0");
	ASSERT_TRUE(e);
	EXPECT_EQ(e->source, "/home/alice");
	EXPECT_EQ(e->target, "/home/jail/alice/home/alice");
	EXPECT_EQ(e->type, "none");
	EXPECT_EQ(e->options, "bind");

	e = MountTableEntry::Parse("UUID=1234 / ext4 errors=remount-ro 0 1");
	ASSERT_TRUE(e);
	EXPECT_EQ(e->pass, 1u);

	e = MountTableEntry::Parse("tmpfs /tmp tmpfs defaults");
	ASSERT_TRUE(e);
	EXPECT_EQ(e->dump, 0u);
	EXPECT_EQ(e->pass, 0u);

	EXPECT_FALSE(MountTableEntry::Parse(""));
	EXPECT_FALSE(MountTableEntry::Parse("   # comment"));
	EXPECT_FALSE(MountTableEntry::Parse("/dev/sda1 /"));
	EXPECT_FALSE(MountTableEntry::Parse("a b c d e f g"));
	EXPECT_FALSE(MountTableEntry::Parse("a b c d x 0"));
}

TEST(MountTableEntry, Escape)
{
	EXPECT_EQ(EscapeMountPath("/home/my site"), "/home/my\\040site");

	const auto e = MountTableEntry::Bind("/home/my site", "/jail/x/home/my site");
	EXPECT_EQ(e.Format(),
		  "/home/my\\040site /jail/x/home/my\\040site none bind 0 0");

	const auto p = MountTableEntry::Parse(e.Format());
	ASSERT_TRUE(p);
	EXPECT_EQ(p->source, "/home/my site");
	EXPECT_EQ(p->target, "/jail/x/home/my site");
}

TEST(MountTable, AddRemove)
{
	MountTable t{"/nonexistent"};
	t.Parse("# <file system> <mount point> <type> <options> <dump> <pass>\n"
		"proc /proc proc defaults 0 0\n"
		"/home/bob /home/jail/bob/home/bob none bind 0 0\n");

	EXPECT_TRUE(t.Contains("/home/bob", "/home/jail/bob/home/bob"));
	EXPECT_FALSE(t.Contains("/home/alice", "/home/jail/bob/home/bob"));

	EXPECT_TRUE(t.AddBind("/home/alice", "/home/jail/alice/home/alice"));
	EXPECT_FALSE(t.AddBind("/home/alice", "/home/jail/alice/home/alice"));
	EXPECT_EQ(t.Count("/home/alice", "/home/jail/alice/home/alice"), 1u);

	EXPECT_EQ(t.RemoveTarget("/home/jail/bob/home/bob"), 1u);
	EXPECT_FALSE(t.ContainsTarget("/home/jail/bob/home/bob"));
	EXPECT_EQ(t.RemoveTarget("/home/jail/bob/home/bob"), 0u);

	EXPECT_EQ(t.Format(),
		  "# <file system> <mount point> <type> <options> <dump> <pass>\n"
		  "proc /proc proc defaults 0 0\n"
		  "/home/alice /home/jail/alice/home/alice none bind 0 0\n");
}
