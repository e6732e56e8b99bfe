// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

/**
 * One entry of the static mount table (fstab(5)).  Paths are stored
 * unescaped.
 */
struct MountTableEntry {
	std::string source;
	std::string target;
	std::string type;
	std::string options;
	unsigned dump = 0, pass = 0;

	/**
	 * A bind mount entry ("none" file system, option "bind").
	 */
	static MountTableEntry Bind(std::string_view source,
				    std::string_view target) noexcept;

	/**
	 * @return std::nullopt for comments, empty lines and malformed
	 * lines
	 */
	[[gnu::pure]]
	static std::optional<MountTableEntry> Parse(std::string_view line) noexcept;

	std::string Format() const noexcept;
};

/**
 * Escape a path for use in fstab, i.e. replace whitespace and
 * backslashes with octal escapes.
 */
std::string
EscapeMountPath(std::string_view path) noexcept;

/**
 * An in-memory copy of the durable mount table.  Lines which are not
 * touched are written back verbatim.
 */
class MountTable {
	struct Line {
		std::string raw;
		std::optional<MountTableEntry> entry;
	};

	std::string path;

	std::vector<Line> lines;

public:
	explicit MountTable(std::string _path) noexcept
		:path(std::move(_path)) {}

	/**
	 * Load the table; a missing file is treated like an empty
	 * one.
	 *
	 * Throws std::system_error on error.
	 */
	static MountTable Load(std::string path);

	void Parse(std::string_view text) noexcept;

	/**
	 * Is there an entry with exactly this source and target?
	 */
	[[gnu::pure]]
	bool Contains(std::string_view source,
		      std::string_view target) const noexcept;

	/**
	 * Is there any entry with this target?
	 */
	[[gnu::pure]]
	bool ContainsTarget(std::string_view target) const noexcept;

	[[gnu::pure]]
	std::size_t Count(std::string_view source,
			  std::string_view target) const noexcept;

	/**
	 * Add a bind mount entry unless an entry with the same source
	 * and target exists already.
	 *
	 * @return true if the table was modified
	 */
	bool AddBind(std::string_view source,
		     std::string_view target) noexcept;

	/**
	 * Remove all entries with the given target.
	 *
	 * @return the number of entries removed
	 */
	std::size_t RemoveTarget(std::string_view target) noexcept;

	std::string Format() const noexcept;

	/**
	 * Write the table back atomically.
	 *
	 * Throws on error.
	 */
	void Save() const;
};
