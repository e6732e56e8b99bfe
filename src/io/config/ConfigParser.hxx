// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <filesystem>
#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <utility>

class FileLineParser;

class ConfigParser {
public:
	virtual ~ConfigParser() noexcept = default;

	virtual bool PreParseLine(FileLineParser &line);
	virtual void ParseLine(FileLineParser &line) = 0;
	virtual void Finish() {}
};

/**
 * A #ConfigParser which ignores lines starting with '#'.
 */
class CommentConfigParser final : public ConfigParser {
	ConfigParser &child;

public:
	explicit CommentConfigParser(ConfigParser &_child)
		:child(_child) {}

	/* virtual methods from class ConfigParser */
	bool PreParseLine(FileLineParser &line) override;
	void ParseLine(FileLineParser &line) final;
	void Finish() override;
};

/**
 * A #ConfigParser which can define and use variables.
 */
class VariableConfigParser final : public ConfigParser {
	ConfigParser &child;

	std::map<std::string, std::string, std::less<>> variables;

	/**
	 * Holds the expanded line passed to the child.
	 */
	std::string buffer;

public:
	explicit VariableConfigParser(ConfigParser &_child)
		:child(_child) {}

	/* virtual methods from class ConfigParser */
	bool PreParseLine(FileLineParser &line) override;
	void ParseLine(FileLineParser &line) final;
	void Finish() override;

private:
	/**
	 * Parse a variable reference after "${" and append its value.
	 */
	void ExpandReference(std::string &dest, std::string_view &src) const;

	void ExpandQuoted(std::string &dest, std::string_view src) const;

	/**
	 * Expand all variable references outside of single quotes.
	 * Unquoted references are wrapped in single quotes, so their
	 * values are parsed as one value.
	 */
	std::string Expand(std::string_view src) const;
};

/**
 * A #ConfigParser which can "include" other files.
 */
class IncludeConfigParser final : public ConfigParser {
	const std::filesystem::path path;

	ConfigParser &child;

	/**
	 * Does our Finish() override call child.Finish()?  This is a
	 * kludge to avoid calling a foreign child's Finish() method
	 * multiple times, once for each included file.
	 */
	const bool finish_child;

public:
	IncludeConfigParser(std::filesystem::path &&_path,
			    ConfigParser &_child,
			    bool _finish_child=true)
		:path(std::move(_path)), child(_child),
		 finish_child(_finish_child) {}

	/* virtual methods from class ConfigParser */
	bool PreParseLine(FileLineParser &line) override;
	void ParseLine(FileLineParser &line) override;
	void Finish() override;

private:
	void IncludePath(std::filesystem::path &&p);
	void IncludeOptionalPath(std::filesystem::path &&p);
};

/**
 * Parse the given file line by line, feeding each line into the
 * parser, and finally call ConfigParser::Finish().
 *
 * Throws on error; errors in a line are nested inside an exception
 * which describes the file name and line number.
 */
void
ParseConfigFile(const std::filesystem::path &path, ConfigParser &parser);
