// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <stdexcept>

/**
 * Base class for errors which abort the whole run.  They are never
 * caught at the per-user boundary.
 */
class FatalJailError : public std::runtime_error {
public:
	using std::runtime_error::runtime_error;
};

/**
 * The process lacks the privileges to modify accounts and mounts.
 */
class PrivilegeError : public FatalJailError {
public:
	using FatalJailError::FatalJailError;
};

/**
 * A required external program or file is missing.
 */
class DependencyMissing : public FatalJailError {
public:
	using FatalJailError::FatalJailError;
};

/**
 * The run was interrupted by a signal.
 */
class Interrupted final : public FatalJailError {
public:
	Interrupted():FatalJailError("Interrupted") {}
};

/**
 * Base class for errors which affect only one user; the orchestrator
 * logs them and continues with the next user.
 */
class UserJailError : public std::runtime_error {
public:
	using std::runtime_error::runtime_error;
};

/**
 * A malformed or nonexistent user name.
 */
class ValidationError : public UserJailError {
public:
	using UserJailError::UserJailError;
};

/**
 * A bind mount could not be created or released.
 */
class MountError : public UserJailError {
public:
	using UserJailError::UserJailError;
};

/**
 * An identity file (passwd, group) could not be rewritten.
 */
class IdentityWriteError : public UserJailError {
public:
	using UserJailError::UserJailError;
};

/**
 * A jail directory lacks required paths even after an attempt to
 * repair it.
 */
class IntegrityError : public UserJailError {
public:
	using UserJailError::UserJailError;
};
