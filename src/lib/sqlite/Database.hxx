// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "Statement.hxx"

#include <utility>

struct sqlite3;

namespace Sqlite {

/**
 * A connection to a SQLite database file.
 */
class Database {
	sqlite3 *db = nullptr;

public:
	Database() noexcept = default;

	/**
	 * Open the database file.
	 *
	 * Throws #Sqlite::Error on error.
	 *
	 * @param read_only open the file read-only; it must exist
	 */
	Database(const char *path, bool read_only);

	Database(Database &&src) noexcept
		:db(std::exchange(src.db, nullptr)) {}

	~Database() noexcept;

	Database &operator=(Database &&src) noexcept {
		using std::swap;
		swap(db, src.db);
		return *this;
	}

	bool IsDefined() const noexcept {
		return db != nullptr;
	}

	/**
	 * Compile a SQL statement.
	 *
	 * Throws #Sqlite::Error on error.
	 */
	Statement Prepare(const char *sql);
};

} /* namespace Sqlite */
