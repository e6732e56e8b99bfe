// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <dirent.h>

class FileDescriptor;
class UniqueFileDescriptor;

/**
 * Iterate over the entries of a directory.  The special entries "."
 * and ".." are skipped.
 */
class DirectoryReader {
	DIR *const dir;

public:
	/**
	 * Throws std::system_error on error.
	 */
	explicit DirectoryReader(const char *path);
	explicit DirectoryReader(UniqueFileDescriptor &&fd);

	DirectoryReader(const DirectoryReader &) = delete;

	~DirectoryReader() noexcept {
		closedir(dir);
	}

	DirectoryReader &operator=(const DirectoryReader &) = delete;

	/**
	 * @return the name of the next entry or nullptr at the end of
	 * the directory
	 */
	const char *Read() noexcept;

	[[gnu::pure]]
	FileDescriptor GetFileDescriptor() const noexcept;
};
