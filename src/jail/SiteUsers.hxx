// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <string>
#include <vector>

/**
 * Obtain the site users from the control panel's SQLite database.
 * The names are not validated; duplicates are removed.
 *
 * Throws #Sqlite::Error on error.
 */
std::vector<std::string>
QuerySiteUsers(const char *database_path);
