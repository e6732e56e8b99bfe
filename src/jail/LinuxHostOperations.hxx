// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "HostOperations.hxx"

#include <string_view>

/**
 * The real #HostOperations implementation using Linux system calls
 * and external programs.
 */
class LinuxHostOperations final : public HostOperations {
public:
	/* virtual methods from class HostOperations */
	bool IsPrivileged() const noexcept override;
	bool IsMountPoint(const char *path) const override;
	void BindMount(const char *source, const char *target) override;
	void Unmount(const char *target) override;
	void Chown(const char *path, uid_t uid, gid_t gid) override;
	void MakeCharDevice(const char *path, mode_t mode,
			    unsigned major, unsigned minor) override;
	std::string FindProgram(const char *name) const noexcept override;
	int Run(const std::vector<std::string> &args,
		std::string *output=nullptr) override;
	std::vector<std::string> ListSharedLibraries(const char *path) override;
};

/**
 * Parse the output of ldd(1).
 *
 * Throws #DependencyMissing if a library was "not found".
 */
std::vector<std::string>
ParseLddOutput(std::string_view output);
