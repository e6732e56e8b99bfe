// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <cstdint>
#include <string>
#include <string_view>

/**
 * One line of /proc/self/mountinfo.
 */
struct MountInfo {
	/**
	 * Unique identifier of the mount; 0 means "nothing mounted".
	 */
	uint_least64_t mnt_id;

	std::string mount_point;

	/**
	 * The relative path inside the file system which was mounted on
	 * the given mount point.  This is relevant for bind mounts.
	 */
	std::string root;

	/**
	 * The filesystem type.
	 */
	std::string filesystem;

	/**
	 * The device which was mounted on the given mount point.
	 */
	std::string source;

	bool IsDefined() const noexcept {
		return mnt_id != 0;
	}
};

/**
 * Find the mount on the given path in the mount namespace of this
 * process (exact match required).  If several mounts are stacked on
 * the same path, the topmost one is returned.
 *
 * Throws std::system_error if /proc/self/mountinfo cannot be read.
 *
 * @return an undefined #MountInfo if nothing is mounted there
 */
MountInfo
FindMount(const char *mount_point);

/**
 * Decode the octal escapes (e.g. "\040" for a space) which the kernel
 * uses in /proc/self/mountinfo and which are also used in fstab.
 */
std::string
UnescapeMountPath(std::string_view s) noexcept;
