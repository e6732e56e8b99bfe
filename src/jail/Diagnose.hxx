// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <string>
#include <string_view>

struct JailConfig;
class HostOperations;
class BaseTemplate;
class MountManager;

/**
 * Generate a human-readable report about the jail of one account.
 * Nothing is modified.
 *
 * Throws #ValidationError if the account does not exist.
 */
std::string
Diagnose(const JailConfig &config, HostOperations &host,
	 BaseTemplate &base, const MountManager &mounts,
	 std::string_view username);
