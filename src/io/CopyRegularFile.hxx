// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <sys/types.h> // for off_t

class FileDescriptor;

/**
 * Copy all data from one file to the other.
 *
 * Throws on error.
 */
void
CopyRegularFile(FileDescriptor src, FileDescriptor dst, off_t size);

/**
 * Copy a regular file to a new path.  An existing destination is
 * replaced atomically.  Symlinks in the source path are followed,
 * i.e. the destination is a regular file even if the source is a
 * link to one.
 *
 * Throws on error.
 *
 * @param mode the mode of the new file (not subject to the umask)
 */
void
CopyFile(const char *src_path, const char *dst_path, mode_t mode);
