// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <sys/types.h>

struct MakeDirectoryOptions {
	mode_t mode = 0755;

	/**
	 * Throw an error if the directory already exists?
	 */
	bool exclusive = false;
};

/**
 * Create a directory.  Unless #MakeDirectoryOptions::exclusive is
 * set, it is not an error if the directory exists already.
 *
 * Throws std::system_error on error.
 *
 * @return true if the directory was created, false if it existed
 * already
 */
bool
MakeDirectory(const char *path,
	      MakeDirectoryOptions options=MakeDirectoryOptions{});

/**
 * Like MakeDirectory(), but create parent directories as well (like
 * "mkdir -p").
 */
bool
MakeNestedDirectory(const char *path,
		    MakeDirectoryOptions options=MakeDirectoryOptions{});
