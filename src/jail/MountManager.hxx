// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "io/Logger.hxx"

#include <string>
#include <vector>

class HostOperations;

enum class BindResult {
	/**
	 * A new bind mount was created.
	 */
	MOUNTED,

	/**
	 * Something was mounted at the target already; nothing was
	 * done.
	 */
	ALREADY_MOUNTED,
};

/**
 * Manages the bind mounts of one run.  Transient mounts are tracked
 * and released by the destructor (or by ReleaseTransient()), no
 * matter how the run ends.  Persistent mounts are recorded in the
 * durable mount table and survive the run.
 */
class MountManager {
	HostOperations &host;

	const std::string fstab_path;

	const LLogger logger{"mount"};

	struct Record {
		std::string source, target;
	};

	/**
	 * Transient mounts created by this object which have not been
	 * released or made persistent yet.
	 */
	std::vector<Record> transient;

public:
	MountManager(HostOperations &_host, std::string _fstab_path) noexcept
		:host(_host), fstab_path(std::move(_fstab_path)) {}

	~MountManager() noexcept {
		ReleaseTransient();
	}

	MountManager(const MountManager &) = delete;
	MountManager &operator=(const MountManager &) = delete;

	const std::string &GetFstabPath() const noexcept {
		return fstab_path;
	}

	/**
	 * Bind-mount #source onto #target.  The target directory is
	 * created if it does not exist.
	 *
	 * Throws #MountError on error.
	 *
	 * @param persistent if true, then the mount is added to the
	 * durable mount table (unless it is listed there already);
	 * if false, then it will be released at the end of the run
	 */
	BindResult Bind(const std::string &source, const std::string &target,
			bool persistent);

	/**
	 * Make a mount persistent: stop tracking it as transient and
	 * add it to the durable mount table.
	 *
	 * Throws #MountError on error.
	 */
	void Persist(const std::string &source, const std::string &target);

	/**
	 * Unmount the target (if mounted) and remove all durable
	 * entries for it.
	 *
	 * Throws #MountError on error.
	 *
	 * @return true if anything was changed
	 */
	bool Unbind(const std::string &target);

	/**
	 * Release a transient mount created by this object.  Does
	 * nothing if the target is not a tracked transient mount.
	 *
	 * Throws #MountError on error.
	 */
	void Release(const std::string &target);

	/**
	 * Is something mounted at the target?
	 *
	 * Throws on error.
	 */
	bool IsMounted(const std::string &target) const;

	/**
	 * Does the durable mount table contain this bind mount?
	 *
	 * Throws on error.
	 */
	bool HasDurableEntry(const std::string &source,
			     const std::string &target) const;

	/**
	 * Does the durable mount table contain any entry for this
	 * target?
	 *
	 * Throws on error.
	 */
	bool HasDurableTarget(const std::string &target) const;

	bool IsTransient(const std::string &target) const noexcept;

	/**
	 * Unmount all transient mounts.  Errors are logged.
	 */
	void ReleaseTransient() noexcept;

private:
	void AddDurableEntry(const std::string &source,
			     const std::string &target);
};
