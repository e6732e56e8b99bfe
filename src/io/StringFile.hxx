// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <string>

/**
 * Load a small text file containing a single value and return its
 * contents with surrounding whitespace stripped.
 *
 * Throws on error.
 */
std::string
LoadStringFile(const char *path);

/**
 * Load the whole contents of a text file (e.g. a line-oriented
 * database like /etc/passwd).
 *
 * Throws std::system_error on error.
 */
std::string
LoadTextFile(const char *path);
