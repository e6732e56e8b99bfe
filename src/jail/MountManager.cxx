// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "MountManager.hxx"
#include "MountTable.hxx"
#include "HostOperations.hxx"
#include "Error.hxx"
#include "io/MakeDirectory.hxx"

#include <fmt/core.h>

#include <algorithm>
#include <exception>

BindResult
MountManager::Bind(const std::string &source, const std::string &target,
		   bool persistent)
try {
	if (host.IsMountPoint(target.c_str())) {
		logger.Fmt(2, "'{}' is already mounted", target);

		if (persistent)
			AddDurableEntry(source, target);

		return BindResult::ALREADY_MOUNTED;
	}

	MakeNestedDirectory(target.c_str());

	host.BindMount(source.c_str(), target.c_str());
	logger.Fmt(2, "Mounted '{}' on '{}'", source, target);

	if (persistent)
		AddDurableEntry(source, target);
	else
		transient.push_back({source, target});

	return BindResult::MOUNTED;
} catch (const MountError &) {
	throw;
} catch (...) {
	std::throw_with_nested(MountError(fmt::format("Failed to bind '{}' on '{}'",
						      source, target)));
}

void
MountManager::Persist(const std::string &source, const std::string &target)
try {
	AddDurableEntry(source, target);

	/* still transient (and released with the run) unless the
	   durable entry was written */
	std::erase_if(transient, [&target](const Record &r){
		return r.target == target;
	});
} catch (...) {
	std::throw_with_nested(MountError(fmt::format("Failed to persist mount '{}'",
						      target)));
}

void
MountManager::AddDurableEntry(const std::string &source,
			      const std::string &target)
{
	auto table = MountTable::Load(fstab_path);
	if (table.AddBind(source, target)) {
		table.Save();
		logger.Fmt(2, "Added '{}' to {}", target, fstab_path);
	}
}

bool
MountManager::Unbind(const std::string &target)
try {
	bool modified = false;

	if (host.IsMountPoint(target.c_str())) {
		host.Unmount(target.c_str());
		logger.Fmt(2, "Unmounted '{}'", target);
		modified = true;
	}

	std::erase_if(transient, [&target](const Record &r){
		return r.target == target;
	});

	auto table = MountTable::Load(fstab_path);
	if (table.RemoveTarget(target) > 0) {
		table.Save();
		logger.Fmt(2, "Removed '{}' from {}", target, fstab_path);
		modified = true;
	}

	return modified;
} catch (...) {
	std::throw_with_nested(MountError(fmt::format("Failed to unbind '{}'",
						      target)));
}

void
MountManager::Release(const std::string &target)
{
	const auto i = std::find_if(transient.begin(), transient.end(),
				    [&target](const Record &r){
					    return r.target == target;
				    });
	if (i == transient.end())
		return;

	transient.erase(i);

	try {
		host.Unmount(target.c_str());
	} catch (...) {
		std::throw_with_nested(MountError(fmt::format("Failed to unmount '{}'",
							      target)));
	}

	logger.Fmt(2, "Released '{}'", target);
}

bool
MountManager::IsMounted(const std::string &target) const
{
	return host.IsMountPoint(target.c_str());
}

bool
MountManager::HasDurableEntry(const std::string &source,
			      const std::string &target) const
{
	return MountTable::Load(fstab_path).Contains(source, target);
}

bool
MountManager::HasDurableTarget(const std::string &target) const
{
	return MountTable::Load(fstab_path).ContainsTarget(target);
}

bool
MountManager::IsTransient(const std::string &target) const noexcept
{
	return std::any_of(transient.begin(), transient.end(),
			   [&target](const Record &r){
				   return r.target == target;
			   });
}

void
MountManager::ReleaseTransient() noexcept
{
	/* unmount in reverse order, in case mounts are nested */
	while (!transient.empty()) {
		const auto r = std::move(transient.back());
		transient.pop_back();

		try {
			host.Unmount(r.target.c_str());
			logger.Fmt(2, "Released '{}'", r.target);
		} catch (...) {
			logger(1, "Failed to release mount: ",
			       std::current_exception());
		}
	}
}
