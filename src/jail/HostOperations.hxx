// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <string>
#include <vector>

#include <sys/types.h>

/**
 * The privileged operating system primitives used to build and
 * release jails.  Everything which requires root privileges or
 * touches global kernel state goes through this interface, so the
 * jail logic can be tested without privileges.
 */
class HostOperations {
public:
	virtual ~HostOperations() noexcept = default;

	/**
	 * Does the process have the privileges to modify accounts
	 * and mounts?
	 */
	virtual bool IsPrivileged() const noexcept = 0;

	/**
	 * Is something mounted at exactly this path?
	 *
	 * Throws on error.
	 */
	virtual bool IsMountPoint(const char *path) const = 0;

	/**
	 * Throws std::system_error on error.
	 */
	virtual void BindMount(const char *source, const char *target) = 0;

	/**
	 * Throws std::system_error on error.
	 */
	virtual void Unmount(const char *target) = 0;

	/**
	 * Throws std::system_error on error.
	 */
	virtual void Chown(const char *path, uid_t uid, gid_t gid) = 0;

	/**
	 * Create a character device node.
	 *
	 * Throws std::system_error on error.
	 */
	virtual void MakeCharDevice(const char *path, mode_t mode,
				    unsigned major, unsigned minor) = 0;

	/**
	 * Find an executable in the search path.
	 *
	 * @return the absolute path or an empty string if it was not
	 * found
	 */
	virtual std::string FindProgram(const char *name) const noexcept = 0;

	/**
	 * Run a program and wait for it to exit.
	 *
	 * Throws on error (if the program could not be started).
	 *
	 * @param args the program (looked up in the search path) and
	 * its arguments
	 * @param output if not nullptr, standard output is captured
	 * into this string
	 * @return the exit status
	 */
	virtual int Run(const std::vector<std::string> &args,
			std::string *output=nullptr) = 0;

	/**
	 * Determine the absolute paths of all shared libraries
	 * (including the dynamic loader) needed to run the given
	 * executable.
	 *
	 * Throws #DependencyMissing if a library cannot be resolved.
	 */
	virtual std::vector<std::string> ListSharedLibraries(const char *path) = 0;
};
