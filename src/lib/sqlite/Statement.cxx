// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Statement.hxx"
#include "Error.hxx"

#include <sqlite3.h>

namespace Sqlite {

Statement::~Statement() noexcept
{
	if (stmt != nullptr)
		sqlite3_finalize(stmt);
}

bool
Statement::Step()
{
	switch (int result = sqlite3_step(stmt)) {
	case SQLITE_ROW:
		return true;

	case SQLITE_DONE:
		return false;

	default:
		throw Error(sqlite3_db_handle(stmt), result,
			    "sqlite3_step() failed");
	}
}

bool
Statement::IsNull(unsigned column) const noexcept
{
	return sqlite3_column_type(stmt, column) == SQLITE_NULL;
}

std::string_view
Statement::GetText(unsigned column) const noexcept
{
	const auto *text = sqlite3_column_text(stmt, column);
	if (text == nullptr)
		return {};

	return {
		reinterpret_cast<const char *>(text),
		std::size_t(sqlite3_column_bytes(stmt, column)),
	};
}

} /* namespace Sqlite */
