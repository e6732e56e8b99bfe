// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "SiteUsers.hxx"
#include "lib/sqlite/Database.hxx"

#include <algorithm>

std::vector<std::string>
QuerySiteUsers(const char *database_path)
{
	Sqlite::Database db(database_path, true);
	auto stmt = db.Prepare("SELECT DISTINCT user FROM site "
			       "WHERE user IS NOT NULL AND user != ''");

	std::vector<std::string> result;
	while (stmt.Step()) {
		if (stmt.IsNull(0))
			continue;

		std::string user{stmt.GetText(0)};
		if (std::find(result.begin(), result.end(), user) == result.end())
			result.push_back(std::move(user));
	}

	return result;
}
