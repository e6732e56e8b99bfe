// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "FileWriter.hxx"
#include "lib/fmt/RuntimeError.hxx"
#include "lib/fmt/SystemError.hxx"

#include <fmt/format.h>

#include <cassert>
#include <cerrno>
#include <cstring>

#include <stdio.h>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

/**
 * @return the directory part and the file name part of the path
 */
static std::pair<std::string_view, std::string_view>
SplitPath(const char *path) noexcept
{
	const char *slash = strrchr(path, '/');
	if (slash == nullptr)
		return {".", path};

	if (slash == path)
		return {"/", slash + 1};

	return {{path, slash}, slash + 1};
}

/**
 * Create "DIRECTORY/.NAME.tmp.PID" (with a numeric suffix if that
 * already exists).
 */
static std::pair<std::string, UniqueFileDescriptor>
MakeTempFile(const char *path, mode_t mode)
{
	const auto [directory, name] = SplitPath(path);
	const unsigned pid = getpid();

	for (unsigned i = 0;; ++i) {
		auto tmp_path = i == 0
			? fmt::format("{}/.{}.tmp.{}", directory, name, pid)
			: fmt::format("{}/.{}.tmp.{}.{}", directory, name,
				      pid, i);

		UniqueFileDescriptor fd;
		if (fd.Open(tmp_path.c_str(), O_CREAT|O_EXCL|O_WRONLY, mode))
			return {std::move(tmp_path), std::move(fd)};

		if (errno != EEXIST)
			throw FmtErrno("Failed to create {}", tmp_path);
	}
}

FileWriter::FileWriter(const char *_path, mode_t mode)
	:path(_path)
{
	auto tmp = MakeTempFile(_path, mode);
	tmp_path = std::move(tmp.first);
	fd = std::move(tmp.second);
}

void
FileWriter::Write(std::string_view src)
{
	ssize_t nbytes = fd.Write(src.data(), src.size());
	if (nbytes < 0)
		throw FmtErrno("Failed to write to {}", path);

	if (size_t(nbytes) < src.size())
		throw FmtRuntimeError("Short write to {}", path);
}

void
FileWriter::Commit()
{
	assert(fd.IsDefined());

	if (fsync(fd.Get()) < 0)
		throw FmtErrno("Failed to commit {}", path);

	if (!fd.Close())
		throw FmtErrno("Failed to commit {}", path);

	if (rename(tmp_path.c_str(), path.c_str()) < 0) {
		const int e = errno;
		unlink(tmp_path.c_str());
		throw FmtErrno(e, "Failed to rename {} to {}",
			       tmp_path, path);
	}
}

void
FileWriter::Cancel() noexcept
{
	assert(fd.IsDefined());

	fd.Close();
	unlink(tmp_path.c_str());
}

void
ReplaceFile(const char *path, std::string_view contents,
	    mode_t default_mode)
{
	struct stat st;
	const bool exists = stat(path, &st) == 0;
	if (!exists && errno != ENOENT)
		throw FmtErrno("Failed to stat {}", path);

	const mode_t mode = exists ? st.st_mode & 07777 : default_mode;

	FileWriter w(path, mode);

	/* the mode passed to open() was masked by the umask */
	if (fchmod(w.GetFileDescriptor().Get(), mode) < 0)
		throw FmtErrno("Failed to chmod {}", path);

	if (exists && fchown(w.GetFileDescriptor().Get(),
			     st.st_uid, st.st_gid) < 0)
		throw FmtErrno("Failed to chown {}", path);

	w.Write(contents);
	w.Commit();
}
