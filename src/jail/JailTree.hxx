// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <array>
#include <string>
#include <string_view>
#include <vector>

#include <sys/types.h>

struct JailConfig;
struct PasswdEntry;
class HostOperations;

struct JailDevice {
	const char *name;
	unsigned major, minor;
};

/**
 * The character devices which are created in /dev of each jail.
 */
static constexpr std::array<JailDevice, 4> jail_devices{{
	{"null", 1, 3},
	{"zero", 1, 5},
	{"random", 1, 8},
	{"urandom", 1, 9},
}};

static constexpr mode_t JAIL_DEVICE_MODE = 0666;

/**
 * The standard directories of a jail, relative to its root.
 */
static constexpr std::array<const char *, 10> jail_directories{
	"bin", "dev", "etc", "home", "lib", "lib64", "tmp",
	"usr/bin", "usr/lib", "usr/sbin",
};

/**
 * The paths (relative to the jail root, without a leading slash)
 * which must exist in a usable jail.
 */
struct JailManifest {
	/**
	 * Host paths of the programs and libraries which are copied
	 * into the jail at the same (absolute) location.
	 */
	std::vector<std::string> files;

	std::vector<std::string> paths;

	/**
	 * Build the manifest: both shells, the shared libraries they
	 * need, the identity files and the device nodes.
	 *
	 * Throws #DependencyMissing if a shell binary or a library is
	 * missing.
	 */
	static JailManifest Make(const JailConfig &config, HostOperations &host);
};

/**
 * Concatenate a jail root and an absolute path inside the jail.
 */
std::string
JailPath(std::string_view root, std::string_view path) noexcept;

/**
 * @return a list of manifest paths which do not exist below the given
 * jail root; empty if the jail is complete
 */
std::vector<std::string>
FindMissingPaths(const std::string &root, const JailManifest &manifest);

/**
 * Create the standard directories of a jail.
 *
 * Throws on error.
 */
void
MakeSkeletonDirectories(const std::string &root);

/**
 * Copy the programs and libraries of the manifest into the jail.
 * Files which exist already are left alone.
 *
 * Throws on error.
 */
void
CopyManifestFiles(const std::string &root, const JailManifest &manifest);

/**
 * Create the missing device nodes in the jail's /dev.
 *
 * Throws on error.
 */
void
MakeDevices(HostOperations &host, const std::string &root);

/**
 * Write the jail's identity files: only the configured system
 * accounts and their groups are copied from the host.
 *
 * Throws on error.
 */
void
WriteSystemIdentity(const JailConfig &config, const std::string &root);

/**
 * Add the account (and its group) to the jail's identity files.
 * Existing records of the same name are removed first.  The in-jail
 * record shows the original home path and the limited shell.
 *
 * Throws #IdentityWriteError on error.
 */
void
MergeUserIdentity(const JailConfig &config, const std::string &root,
		  const PasswdEntry &account);

/**
 * Does the jail contain identity records for this account?
 */
bool
HasUserIdentity(const std::string &root, std::string_view username);

/**
 * Determine the original home directory of an account whose home
 * field may have been rewritten to the jail-relative form
 * "JAIL_ROOT/USER/./home/USER".
 */
[[gnu::pure]]
std::string
OriginalHome(const JailConfig &config, std::string_view home,
	     std::string_view username) noexcept;

/**
 * Does the path point inside the jail root?
 */
[[gnu::pure]]
bool
IsInsideJailRoot(const JailConfig &config, std::string_view path) noexcept;
