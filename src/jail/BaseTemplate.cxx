// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "BaseTemplate.hxx"
#include "Config.hxx"
#include "Error.hxx"
#include "HostOperations.hxx"
#include "io/MakeDirectory.hxx"
#include "io/RecursiveCopy.hxx"
#include "lib/fmt/SystemError.hxx"

#include <fmt/core.h>

#include <sys/stat.h>

using std::string_view_literals::operator""sv;

static bool
IsDirectory(const char *path) noexcept
{
	struct stat st;
	return lstat(path, &st) == 0 && S_ISDIR(st.st_mode);
}

const JailManifest &
BaseTemplate::GetManifest()
{
	if (!manifest)
		manifest = JailManifest::Make(config, host);

	return *manifest;
}

std::vector<std::string>
BaseTemplate::CheckIntegrity(const std::string &root)
{
	if (!IsDirectory(root.c_str()))
		return GetManifest().paths;

	return FindMissingPaths(root, GetManifest());
}

void
BaseTemplate::MakeRootOwned(const std::string &root)
{
	host.Chown(root.c_str(), 0, 0);

	if (chmod(root.c_str(), 0755) < 0)
		throw FmtErrno("Failed to chmod '{}'", root);
}

void
BaseTemplate::RunSkeletonTool(const std::string &root)
{
	if (config.skeleton_tool.empty())
		return;

	if (host.FindProgram(config.skeleton_tool.c_str()).empty()) {
		logger.Fmt(1, "Warning: '{}' not found, building the skeleton manually",
			   config.skeleton_tool);
		return;
	}

	std::vector<std::string> args{config.skeleton_tool, "-j", root};
	args.insert(args.end(), config.skeleton_sections.begin(),
		    config.skeleton_sections.end());

	try {
		const int status = host.Run(args);
		if (status != 0)
			logger.Fmt(1, "Warning: '{}' exited with status {}, building the skeleton manually",
				   config.skeleton_tool, status);
	} catch (const std::system_error &) {
		logger(1, "Warning: failed to run the skeleton tool: ",
		       std::current_exception());
	}
}

void
BaseTemplate::Populate(const std::string &root, bool rewrite_identity)
{
	const auto &m = GetManifest();

	MakeSkeletonDirectories(root);
	CopyManifestFiles(root, m);

	if (rewrite_identity ||
	    !FindMissingPaths(root, JailManifest{{}, {"etc/passwd", "etc/group"}}).empty())
		WriteSystemIdentity(config, root);

	MakeDevices(host, root);
}

void
BaseTemplate::VerifyComplete(const std::string &root)
{
	const auto missing = CheckIntegrity(root);
	if (missing.empty())
		return;

	std::string list;
	for (const auto &i : missing) {
		if (!list.empty())
			list += ", ";
		list += i;
	}

	throw IntegrityError(fmt::format("Jail '{}' is incomplete, missing: {}",
					 root, list));
}

bool
BaseTemplate::EnsureBase()
{
	const auto base = config.GetBasePath();

	if (const auto missing = CheckIntegrity(base); missing.empty()) {
		logger.Fmt(2, "Base template '{}' is intact", base);
		return false;
	} else if (IsDirectory(base.c_str()))
		logger.Fmt(1, "Base template '{}' is incomplete ({} missing), rebuilding",
			   base, missing.size());
	else
		logger.Fmt(1, "Building base template '{}'", base);

	MakeNestedDirectory(config.jail_root.c_str());
	MakeDirectory(base.c_str());
	MakeRootOwned(base);

	RunSkeletonTool(base);
	Populate(base, true);

	VerifyComplete(base);
	logger.Fmt(1, "Base template '{}' is ready", base);
	return true;
}

void
BaseTemplate::Instantiate(const std::string &root)
{
	const auto base = config.GetBasePath();

	MakeNestedDirectory(config.jail_root.c_str());

	try {
		RecursiveCopyOptions options;
		options.overwrite = false;
		options.one_filesystem = true;
		options.preserve_mode = true;
		RecursiveCopy(base.c_str(), root.c_str(), options);
	} catch (const std::system_error &) {
		logger(1, "Warning: failed to clone the base template, building the skeleton manually: ",
		       std::current_exception());
		Populate(root, false);
	}

	MakeRootOwned(root);
	VerifyComplete(root);
}
