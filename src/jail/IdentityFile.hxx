// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "IdentityRecord.hxx"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <sys/types.h>

/**
 * An in-memory copy of a colon-delimited identity file (passwd or
 * group).  Lines which cannot be parsed (comments, garbage) are
 * preserved verbatim.  Modifications are written back atomically by
 * Save().
 *
 * @param Entry #PasswdEntry or #GroupEntry
 */
template<typename Entry>
class IdentityFile {
	struct Line {
		std::string raw;
		std::optional<Entry> entry;
	};

	std::string path;

	std::vector<Line> lines;

public:
	explicit IdentityFile(std::string _path) noexcept
		:path(std::move(_path)) {}

	/**
	 * Load the file.  A missing file is treated like an empty
	 * file.
	 *
	 * Throws std::system_error on error.
	 */
	static IdentityFile Load(std::string path);

	/**
	 * Like Load(), but a missing file is an error.
	 */
	static IdentityFile LoadExisting(std::string path);

	const std::string &GetPath() const noexcept {
		return path;
	}

	void Parse(std::string_view text) noexcept;

	[[gnu::pure]]
	const Entry *Find(std::string_view name) const noexcept;

	[[gnu::pure]]
	std::size_t Count(std::string_view name) const noexcept;

	bool Contains(std::string_view name) const noexcept {
		return Find(name) != nullptr;
	}

	/**
	 * Call the given function for each well-formed record.
	 */
	template<typename F>
	void ForEach(F &&f) const {
		for (const auto &i : lines)
			if (i.entry)
				f(*i.entry);
	}

	void Append(Entry entry) noexcept;

	/**
	 * Replace the (first) record with the same name.
	 *
	 * @return false if there is no such record
	 */
	bool Replace(const Entry &entry) noexcept;

	/**
	 * Remove all records with the given name.
	 *
	 * @return the number of records removed
	 */
	std::size_t Remove(std::string_view name) noexcept;

	std::string Format() const noexcept;

	/**
	 * Write the file back.  The mode of an existing file is
	 * preserved.
	 *
	 * Throws on error.
	 */
	void Save(mode_t default_mode=0644) const;
};

using PasswdFile = IdentityFile<PasswdEntry>;
using GroupFile = IdentityFile<GroupEntry>;

extern template class IdentityFile<PasswdEntry>;
extern template class IdentityFile<GroupEntry>;
