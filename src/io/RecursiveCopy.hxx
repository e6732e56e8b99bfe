// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

struct RecursiveCopyOptions {
	/**
	 * Replace files which already exist in the destination.  If
	 * false, existing files are kept as they are.
	 */
	bool overwrite = true;

	/**
	 * Do not descend into other mounts (compared by mount id),
	 * e.g. a home directory bind-mounted into a jail.
	 */
	bool one_filesystem = false;

	/**
	 * Apply the source's permission bits to new files and
	 * directories.
	 */
	bool preserve_mode = false;
};

/**
 * Copies a file or directory tree.  Symlinks are copied as-is;
 * character and block devices are recreated with mknod().  Existing
 * directories in the destination are merged.
 *
 * Throws on error.
 */
void
RecursiveCopy(const char *src_path, const char *dst_path,
	      RecursiveCopyOptions options={});
