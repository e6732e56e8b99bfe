// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "JailTree.hxx"
#include "io/Logger.hxx"

#include <optional>
#include <string>
#include <vector>

struct JailConfig;
class HostOperations;

/**
 * The shared jail skeleton ("JAIL_ROOT/.base") from which all
 * per-user jails are cloned.
 */
class BaseTemplate {
	const JailConfig &config;
	HostOperations &host;

	const LLogger logger{"base"};

	std::optional<JailManifest> manifest;

public:
	BaseTemplate(const JailConfig &_config, HostOperations &_host) noexcept
		:config(_config), host(_host) {}

	/**
	 * Determine (once) which paths a jail must contain.
	 *
	 * Throws #DependencyMissing if a shell or library is missing.
	 */
	const JailManifest &GetManifest();

	/**
	 * @return the manifest paths missing below the given jail
	 * root; empty if the jail is intact
	 */
	std::vector<std::string> CheckIntegrity(const std::string &root);

	/**
	 * Verify the base template and (re)build it if the check
	 * fails.
	 *
	 * Throws #DependencyMissing or #IntegrityError.
	 *
	 * @return true if the template was built, false if it was
	 * intact already
	 */
	bool EnsureBase();

	/**
	 * Create or repair a per-user jail: clone the base template
	 * into it without overwriting existing files, falling back to
	 * building the skeleton manually.
	 *
	 * Throws #IntegrityError if the jail is still incomplete.
	 */
	void Instantiate(const std::string &root);

private:
	void RunSkeletonTool(const std::string &root);

	/**
	 * Build the skeleton without the help of the base template.
	 *
	 * @param rewrite_identity replace the identity files with the
	 * system-only subset even if they exist
	 */
	void Populate(const std::string &root, bool rewrite_identity);

	void MakeRootOwned(const std::string &root);

	void VerifyComplete(const std::string &root);
};
