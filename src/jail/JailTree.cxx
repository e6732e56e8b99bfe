// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "JailTree.hxx"
#include "Config.hxx"
#include "Error.hxx"
#include "HostOperations.hxx"
#include "IdentityFile.hxx"
#include "io/CopyRegularFile.hxx"
#include "io/MakeDirectory.hxx"
#include "lib/fmt/SystemError.hxx"

#include <fmt/core.h>

#include <algorithm>

#include <sys/stat.h>
#include <unistd.h>

using std::string_view_literals::operator""sv;

static bool
Exists(const char *path) noexcept
{
	struct stat st;
	return lstat(path, &st) == 0;
}

static std::string_view
StripLeadingSlashes(std::string_view path) noexcept
{
	while (path.starts_with('/'))
		path.remove_prefix(1);
	return path;
}

std::string
JailPath(std::string_view root, std::string_view path) noexcept
{
	return fmt::format("{}/{}", root, StripLeadingSlashes(path));
}

static void
AddUnique(std::vector<std::string> &v, std::string_view s) noexcept
{
	if (std::find(v.begin(), v.end(), s) == v.end())
		v.emplace_back(s);
}

JailManifest
JailManifest::Make(const JailConfig &config, HostOperations &host)
{
	JailManifest m;

	for (const auto *shell : {&config.confined_shell, &config.limited_shell}) {
		if (access(shell->c_str(), X_OK) < 0)
			throw DependencyMissing(fmt::format("Shell not found: {}",
							    *shell));

		AddUnique(m.files, *shell);

		for (const auto &lib : host.ListSharedLibraries(shell->c_str()))
			AddUnique(m.files, lib);
	}

	for (const auto &i : m.files)
		m.paths.emplace_back(StripLeadingSlashes(i));

	m.paths.emplace_back("etc/passwd"sv);
	m.paths.emplace_back("etc/group"sv);

	for (const auto &i : jail_devices)
		m.paths.emplace_back(fmt::format("dev/{}", i.name));

	return m;
}

std::vector<std::string>
FindMissingPaths(const std::string &root, const JailManifest &manifest)
{
	std::vector<std::string> missing;

	for (const auto &i : manifest.paths)
		if (!Exists(JailPath(root, i).c_str()))
			missing.push_back(i);

	return missing;
}

void
MakeSkeletonDirectories(const std::string &root)
{
	MakeNestedDirectory(root.c_str());

	for (const char *i : jail_directories)
		MakeNestedDirectory(JailPath(root, i).c_str());

	/* /tmp is world-writable and sticky */
	const auto tmp = JailPath(root, "tmp"sv);
	if (chmod(tmp.c_str(), 01777) < 0)
		throw FmtErrno("Failed to chmod '{}'", tmp);
}

static std::string_view
ParentPath(std::string_view path) noexcept
{
	const auto slash = path.rfind('/');
	if (slash == path.npos || slash == 0)
		return path.substr(0, slash == 0 ? 1 : 0);

	return path.substr(0, slash);
}

void
CopyManifestFiles(const std::string &root, const JailManifest &manifest)
{
	for (const auto &i : manifest.files) {
		const auto dest = JailPath(root, i);
		if (Exists(dest.c_str()))
			continue;

		const std::string parent{ParentPath(dest)};
		MakeNestedDirectory(parent.c_str());

		CopyFile(i.c_str(), dest.c_str(), 0755);
	}
}

void
MakeDevices(HostOperations &host, const std::string &root)
{
	const auto dev = JailPath(root, "dev"sv);
	MakeNestedDirectory(dev.c_str());

	for (const auto &i : jail_devices) {
		const auto path = fmt::format("{}/{}", dev, i.name);
		if (!Exists(path.c_str()))
			host.MakeCharDevice(path.c_str(), JAIL_DEVICE_MODE,
					    i.major, i.minor);
	}
}

[[gnu::pure]]
static bool
Contains(const std::vector<std::string> &v, std::string_view s) noexcept
{
	return std::find(v.begin(), v.end(), s) != v.end();
}

void
WriteSystemIdentity(const JailConfig &config, const std::string &root)
{
	const auto host_passwd = PasswdFile::LoadExisting(config.passwd_path);
	const auto host_group = GroupFile::LoadExisting(config.group_path);

	PasswdFile passwd{JailPath(root, "etc/passwd"sv)};
	std::vector<gid_t> gids;

	host_passwd.ForEach([&](const PasswdEntry &e){
		if (Contains(config.system_accounts, e.name) &&
		    !passwd.Contains(e.name)) {
			passwd.Append(e);
			gids.push_back(e.gid);
		}
	});

	GroupFile group{JailPath(root, "etc/group"sv)};

	host_group.ForEach([&](const GroupEntry &e){
		if ((Contains(config.system_accounts, e.name) ||
		     std::find(gids.begin(), gids.end(), e.gid) != gids.end()) &&
		    !group.Contains(e.name))
			group.Append(e);
	});

	MakeNestedDirectory(JailPath(root, "etc"sv).c_str());

	try {
		passwd.Save();
		group.Save();
	} catch (...) {
		std::throw_with_nested(IdentityWriteError(fmt::format("Failed to write identity files in '{}'",
								      root)));
	}
}

static const GroupEntry *
FindUserGroup(const GroupFile &group, const PasswdEntry &account) noexcept
{
	if (const auto *e = group.Find(account.name))
		return e;

	const GroupEntry *result = nullptr;
	group.ForEach([&](const GroupEntry &e){
		if (result == nullptr && e.gid == account.gid)
			result = &e;
	});

	return result;
}

void
MergeUserIdentity(const JailConfig &config, const std::string &root,
		  const PasswdEntry &account)
try {
	auto entry = account;
	entry.home = OriginalHome(config, account.home, account.name);
	entry.shell = config.limited_shell;

	auto passwd = PasswdFile::Load(JailPath(root, "etc/passwd"sv));
	passwd.Remove(entry.name);
	passwd.Append(std::move(entry));
	passwd.Save();

	const auto host_group = GroupFile::LoadExisting(config.group_path);
	if (const auto *g = FindUserGroup(host_group, account)) {
		auto group = GroupFile::Load(JailPath(root, "etc/group"sv));
		group.Remove(g->name);
		group.Append(*g);
		group.Save();
	}
} catch (...) {
	std::throw_with_nested(IdentityWriteError(fmt::format("Failed to merge '{}' into the jail identity files",
							      account.name)));
}

bool
HasUserIdentity(const std::string &root, std::string_view username)
{
	return PasswdFile::Load(JailPath(root, "etc/passwd"sv)).Count(username) == 1;
}

bool
IsInsideJailRoot(const JailConfig &config, std::string_view path) noexcept
{
	std::string_view root = config.jail_root;
	while (root.size() > 1 && root.ends_with('/'))
		root.remove_suffix(1);

	return path.starts_with(root) &&
		(path.size() == root.size() || path[root.size()] == '/');
}

std::string
OriginalHome(const JailConfig &config, std::string_view home,
	     std::string_view username) noexcept
{
	if (!IsInsideJailRoot(config, home))
		return std::string{home};

	const auto user_jail = config.GetUserJailPath(username);
	if (home.starts_with(user_jail)) {
		auto rest = home.substr(user_jail.size());

		/* jailkit separates the jail and the path inside the
		   jail with "/./" */
		if (rest.starts_with("/./"sv))
			rest.remove_prefix(2);

		if (rest.size() > 1 && rest.front() == '/')
			return std::string{rest};
	}

	return config.GetRealHome(username);
}
