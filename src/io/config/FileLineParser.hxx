// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "LineParser.hxx"

#include <filesystem>

/**
 * A #LineParser for a line of a configuration file, which knows the
 * location of that file.
 */
class FileLineParser : public LineParser {
	const std::filesystem::path &base_path;

public:
	FileLineParser(const std::filesystem::path &_base_path, char *_p)
		:LineParser(_p), base_path(_base_path) {}

	/**
	 * Parse a (quoted or unquoted) path.  Relative paths are
	 * resolved against the directory of the configuration file.
	 * The result is lexically normalized and has no trailing
	 * slash (except for "/" itself), so it can be compared with
	 * other configured paths.
	 */
	std::filesystem::path ExpectPath();
	std::filesystem::path ExpectPathAndEnd();
};
