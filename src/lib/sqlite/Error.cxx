// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Error.hxx"

#include <sqlite3.h>

#include <fmt/format.h>

namespace Sqlite {

static std::string
MakeMessage(sqlite3 *db, int code, const char *prefix) noexcept
{
	const char *msg = db != nullptr
		? sqlite3_errmsg(db)
		: sqlite3_errstr(code);
	return fmt::format("{}: {}", prefix, msg);
}

Error::Error(sqlite3 *db, int _code, const char *prefix) noexcept
	:std::runtime_error(MakeMessage(db, _code, prefix)), code(_code) {}

} /* namespace Sqlite */
