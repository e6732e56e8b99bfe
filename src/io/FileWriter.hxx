// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "UniqueFileDescriptor.hxx"

#include <string>
#include <string_view>

#include <sys/types.h>

/**
 * Create a new file or replace an existing file.  The new contents
 * are written to a temporary file in the same directory which
 * Commit() renames over the old file; until then (or if the object
 * is destroyed without Commit()), the old file is untouched.
 */
class FileWriter {
	const std::string path;

	std::string tmp_path;

	UniqueFileDescriptor fd;

public:
	/**
	 * Throws std::system_error on error.
	 */
	explicit FileWriter(const char *_path, mode_t mode=0666);

	~FileWriter() noexcept {
		if (fd.IsDefined())
			Cancel();
	}

	FileWriter(const FileWriter &) = delete;
	FileWriter &operator=(const FileWriter &) = delete;

	FileDescriptor GetFileDescriptor() noexcept {
		return fd;
	}

	/**
	 * Throws std::runtime_error on error.
	 */
	void Write(std::string_view src);

	/**
	 * Flush the new contents to disk and move the file into place.
	 *
	 * Throws std::system_error on error.
	 */
	void Commit();

	/**
	 * Delete the temporary file.
	 */
	void Cancel() noexcept;
};

/**
 * Replace the contents of a file atomically with #FileWriter.  If the
 * file exists, its mode and owner are kept; a new file gets
 * #default_mode (not subject to the umask).
 *
 * Throws on error.
 */
void
ReplaceFile(const char *path, std::string_view contents,
	    mode_t default_mode);
