// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "jail/Username.hxx"
#include "jail/Error.hxx"

#include <gtest/gtest.h>

#include <string>

TEST(Username, Valid)
{
	EXPECT_TRUE(IsValidUsername("alice"));
	EXPECT_TRUE(IsValidUsername("_svc"));
	EXPECT_TRUE(IsValidUsername("site-user_2"));
	EXPECT_TRUE(IsValidUsername(std::string(MAX_USERNAME_LENGTH, 'a')));
}

TEST(Username, Invalid)
{
	EXPECT_FALSE(IsValidUsername(""));
	EXPECT_FALSE(IsValidUsername("Alice"));
	EXPECT_FALSE(IsValidUsername("1alice"));
	EXPECT_FALSE(IsValidUsername("-alice"));
	EXPECT_FALSE(IsValidUsername("al ice"));
	EXPECT_FALSE(IsValidUsername("alice:x"));
	EXPECT_FALSE(IsValidUsername("../etc"));
	EXPECT_FALSE(IsValidUsername(".base"));
	EXPECT_FALSE(IsValidUsername(std::string(MAX_USERNAME_LENGTH + 1, 'a')));
}

TEST(Username, Check)
{
	EXPECT_NO_THROW(CheckUsername("bob"));
	EXPECT_THROW(CheckUsername(""), ValidationError);
	EXPECT_THROW(CheckUsername("root/../x"), ValidationError);

	try {
		CheckUsername("Bad");
		FAIL();
	} catch (const ValidationError &e) {
		EXPECT_STREQ(e.what(), "Invalid user name: 'Bad'");
	}
}
