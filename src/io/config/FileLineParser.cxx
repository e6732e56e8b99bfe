// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "FileLineParser.hxx"

namespace fs = std::filesystem;

static fs::path
NormalizePath(const fs::path &base, const char *value)
{
	fs::path p{value};
	if (p.is_relative())
		p = base.parent_path() / p;

	p = p.lexically_normal();

	/* lexically_normal() keeps a trailing slash */
	if (!p.has_filename() && p.has_relative_path())
		p = p.parent_path();

	return p;
}

fs::path
FileLineParser::ExpectPath()
{
	return NormalizePath(base_path, ExpectValue());
}

fs::path
FileLineParser::ExpectPathAndEnd()
{
	auto value = ExpectPath();
	ExpectEnd();
	return value;
}
