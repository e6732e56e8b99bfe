// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "ConfigParser.hxx"
#include "FileLineParser.hxx"
#include "io/StringFile.hxx"
#include "system/Error.hxx"

#include <fmt/format.h>

#include <algorithm>
#include <exception>
#include <vector>

#include <errno.h>
#include <fnmatch.h>

using std::string_view_literals::operator""sv;
namespace fs = std::filesystem;

bool
ConfigParser::PreParseLine(FileLineParser &)
{
	return false;
}

bool
CommentConfigParser::PreParseLine(FileLineParser &line)
{
	if (child.PreParseLine(line))
		return true;

	/* ignore empty lines and comments */
	return line.IsComment();
}

void
CommentConfigParser::ParseLine(FileLineParser &line)
{
	child.ParseLine(line);
}

void
CommentConfigParser::Finish()
{
	child.Finish();
}

bool
VariableConfigParser::PreParseLine(FileLineParser &line)
{
	return child.PreParseLine(line);
}

void
VariableConfigParser::ParseLine(FileLineParser &line)
{
	if (std::string_view{line.Rest()}.find("${"sv) != std::string_view::npos) {
		buffer = Expand(line.Rest());
		line.Reset(buffer.data());
	}

	if (!line.SkipWord("@set")) {
		child.ParseLine(line);
		return;
	}

	const auto [name, value] = line.ExpectAssignmentAndEnd();
	variables.insert_or_assign(std::string{name}, value);
}

void
VariableConfigParser::Finish()
{
	child.Finish();
}

void
VariableConfigParser::ExpandReference(std::string &dest,
				      std::string_view &src) const
{
	std::size_t length = 0;
	while (length < src.size() && LineParser::IsWordChar(src[length]))
		++length;

	if (length == 0)
		throw LineParser::Error("Variable name expected after '${'");

	if (length == src.size() || src[length] != '}')
		throw LineParser::Error("Missing '}' after variable name");

	const auto name = src.substr(0, length);
	src.remove_prefix(length + 1);

	const auto i = variables.find(name);
	if (i == variables.end())
		throw LineParser::Error{fmt::format("No such variable: {}"sv,
						    name)};

	dest += i->second;
}

void
VariableConfigParser::ExpandQuoted(std::string &dest,
				   std::string_view src) const
{
	while (!src.empty()) {
		const auto ref = src.find("${"sv);
		dest.append(src.substr(0, ref));
		if (ref == src.npos)
			break;

		src.remove_prefix(ref + 2);
		ExpandReference(dest, src);
	}
}

std::string
VariableConfigParser::Expand(std::string_view src) const
{
	std::string dest;

	while (!src.empty()) {
		const char ch = src.front();

		if (ch == '\'' || ch == '"') {
			const auto end = src.find(ch, 1);
			if (end == src.npos)
				/* unterminated; let LineParser report it */
				break;

			if (ch == '\'')
				dest.append(src.substr(0, end + 1));
			else {
				dest.push_back(ch);
				ExpandQuoted(dest, src.substr(1, end - 1));
				dest.push_back(ch);
			}

			src.remove_prefix(end + 1);
		} else if (src.starts_with("${"sv)) {
			src.remove_prefix(2);
			dest.push_back('\'');
			ExpandReference(dest, src);
			dest.push_back('\'');
		} else {
			dest.push_back(ch);
			src.remove_prefix(1);
		}
	}

	dest.append(src);
	return dest;
}

bool
IncludeConfigParser::PreParseLine(FileLineParser &line)
{
	return child.PreParseLine(line);
}

void
IncludeConfigParser::ParseLine(FileLineParser &line)
{
	if (line.SkipWord("@include")) {
		auto p = line.ExpectPathAndEnd();
		IncludePath(std::move(p));
	} else if (line.SkipWord("@include_optional")) {
		auto p = line.ExpectPathAndEnd();
		IncludeOptionalPath(std::move(p));
	} else
		child.ParseLine(line);
}

void
IncludeConfigParser::Finish()
{
	if (finish_child)
		child.Finish();
}

[[gnu::pure]]
static bool
IsPattern(const fs::path &p) noexcept
{
	return p.native().find_first_of("*?") != std::string::npos;
}

/**
 * Find all files in the directory whose names match the pattern, in
 * alphabetical order.
 */
static std::vector<fs::path>
ListMatchingFiles(const fs::path &directory, const fs::path &pattern)
{
	std::vector<fs::path> files;

	for (const auto &i : fs::directory_iterator(directory))
		if (fnmatch(pattern.c_str(), i.path().filename().c_str(), 0) == 0)
			files.emplace_back(i.path());

	std::sort(files.begin(), files.end());
	return files;
}

inline void
IncludeConfigParser::IncludePath(fs::path &&p)
{
	if (!IsPattern(p.filename())) {
		IncludeConfigParser sub(std::move(p), child, false);
		ParseConfigFile(sub.path, sub);
		return;
	}

	auto directory = p.parent_path();
	if (directory.empty())
		directory = ".";

	for (auto &i : ListMatchingFiles(directory, p.filename())) {
		IncludeConfigParser sub(std::move(i), child, false);
		ParseConfigFile(sub.path, sub);
	}
}

static void
ParseConfigText(const fs::path &path, std::string &&text,
		ConfigParser &parser)
{
	unsigned number = 1;
	char *p = text.data();
	char *const end = p + text.size();

	for (; p < end; ++number) {
		char *const line = p;

		char *const newline = std::find(p, end, '\n');
		*newline = 0; /* at "end", this is std::string's null terminator */
		p = newline < end ? newline + 1 : end;

		FileLineParser line_parser(path, line);

		try {
			if (!parser.PreParseLine(line_parser))
				parser.ParseLine(line_parser);
		} catch (...) {
			std::throw_with_nested(LineParser::Error{fmt::format("{}:{}"sv,
									     path.native(), number)});
		}
	}
}

inline void
IncludeConfigParser::IncludeOptionalPath(fs::path &&p)
{
	IncludeConfigParser sub(std::move(p), child, false);

	std::string text;
	try {
		text = LoadTextFile(sub.path.c_str());
	} catch (const std::system_error &e) {
		if (IsFileNotFound(e) || IsErrno(e, ENOTDIR))
			return;

		throw;
	}

	ParseConfigText(sub.path, std::move(text), sub);
	sub.Finish();
}

void
ParseConfigFile(const fs::path &path, ConfigParser &parser)
{
	ParseConfigText(path, LoadTextFile(path.c_str()), parser);
	parser.Finish();
}
