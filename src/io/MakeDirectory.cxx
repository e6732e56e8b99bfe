// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "MakeDirectory.hxx"
#include "lib/fmt/SystemError.hxx"
#include "util/ScopeExit.hxx"

#include <limits.h>
#include <string.h>
#include <sys/stat.h>

static bool
IsDirectory(const char *path) noexcept
{
	struct stat st;
	return stat(path, &st) == 0 && S_ISDIR(st.st_mode);
}

static int
FilterErrno(int e, const char *path,
	    const MakeDirectoryOptions options) noexcept
{
	if (e == EEXIST && !options.exclusive && IsDirectory(path))
		e = 0;

	return e;
}

bool
MakeDirectory(const char *path, const MakeDirectoryOptions options)
{
	if (mkdir(path, options.mode) == 0)
		return true;

	if (const int e = FilterErrno(errno, path, options); e != 0)
		throw FmtErrno(e, "Failed to create directory '{}'", path);

	return false;
}

static char *
LastSlash(char *p, size_t size) noexcept
{
	/* chop trailing slashes off */
	while (size > 0 && p[size - 1] == '/')
		--size;

	return (char *)memrchr(p, '/', size);
}

static bool
RecursiveMakeNestedDirectory(char *path, size_t path_length,
			     const MakeDirectoryOptions options)
{
	if (mkdir(path, options.mode) == 0)
		return true;

	const int e = FilterErrno(errno, path, options);
	switch (e) {
	case 0:
		return false;

	case ENOENT:
		/* parent directory doesn't exist - we must create it
		   first */
		break;

	default:
		throw FmtErrno(e, "Failed to create directory '{}'", path);
	}

	char *slash = LastSlash(path, path_length);
	if (slash == nullptr || slash == path)
		throw FmtErrno(e, "Failed to create directory '{}'", path);

	*slash = 0;

	{
		AtScopeExit(slash) { *slash = '/'; };

		auto middle_options = options;
		middle_options.exclusive = false;
		RecursiveMakeNestedDirectory(path, slash - path,
					     middle_options);
	}

	return MakeDirectory(path, options);
}

bool
MakeNestedDirectory(const char *path, const MakeDirectoryOptions options)
{
	size_t path_length = strlen(path);
	char copy[PATH_MAX];
	if (path_length == 0 || path_length >= sizeof(copy))
		throw FmtErrno(ENAMETOOLONG, "Bad path '{}'", path);

	strcpy(copy, path);
	return RecursiveMakeNestedDirectory(copy, path_length, options);
}
