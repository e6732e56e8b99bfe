// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Database.hxx"
#include "Error.hxx"

#include <sqlite3.h>

namespace Sqlite {

Database::Database(const char *path, bool read_only)
{
	const int flags = read_only
		? SQLITE_OPEN_READONLY
		: SQLITE_OPEN_READWRITE|SQLITE_OPEN_CREATE;

	int result = sqlite3_open_v2(path, &db, flags, nullptr);
	if (result != SQLITE_OK) {
		Error error(db, result, "Failed to open database");
		/* sqlite3_open_v2() allocates a handle even on
		   failure */
		sqlite3_close(db);
		db = nullptr;
		throw error;
	}
}

Database::~Database() noexcept
{
	if (db != nullptr)
		sqlite3_close(db);
}

Statement
Database::Prepare(const char *sql)
{
	sqlite3_stmt *stmt;
	int result = sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr);
	if (result != SQLITE_OK)
		throw Error(db, result, "Failed to prepare statement");

	return Statement{stmt};
}

} /* namespace Sqlite */
