// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <stdexcept>

struct sqlite3;

namespace Sqlite {

/**
 * An error reported by libsqlite3.
 */
class Error final : public std::runtime_error {
	int code;

public:
	Error(int _code, const char *_msg) noexcept
		:std::runtime_error(_msg), code(_code) {}

	/**
	 * Construct an error from the last error of the given
	 * database connection.
	 */
	Error(sqlite3 *db, int _code, const char *prefix) noexcept;

	[[gnu::pure]]
	int GetCode() const noexcept {
		return code;
	}
};

} /* namespace Sqlite */
