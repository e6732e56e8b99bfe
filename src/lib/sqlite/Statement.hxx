// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <string_view>
#include <utility>

struct sqlite3;
struct sqlite3_stmt;

namespace Sqlite {

/**
 * A prepared statement.  Instances are obtained from
 * Database::Prepare().
 */
class Statement {
	sqlite3_stmt *stmt = nullptr;

public:
	Statement() noexcept = default;

	explicit Statement(sqlite3_stmt *_stmt) noexcept
		:stmt(_stmt) {}

	Statement(Statement &&src) noexcept
		:stmt(std::exchange(src.stmt, nullptr)) {}

	~Statement() noexcept;

	Statement &operator=(Statement &&src) noexcept {
		using std::swap;
		swap(stmt, src.stmt);
		return *this;
	}

	bool IsDefined() const noexcept {
		return stmt != nullptr;
	}

	/**
	 * Evaluate the statement up to the next row.
	 *
	 * Throws #Sqlite::Error on error.
	 *
	 * @return true if a row is available, false if the statement
	 * has finished
	 */
	bool Step();

	/**
	 * Is the value in the given column of the current row SQL
	 * NULL?
	 */
	[[gnu::pure]]
	bool IsNull(unsigned column) const noexcept;

	/**
	 * Returns the value of the given column of the current row as
	 * text.  The view is valid until the next Step() call.
	 */
	[[gnu::pure]]
	std::string_view GetText(unsigned column) const noexcept;
};

} /* namespace Sqlite */
