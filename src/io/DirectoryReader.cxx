// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "DirectoryReader.hxx"
#include "UniqueFileDescriptor.hxx"
#include "lib/fmt/SystemError.hxx"

#include <utility>

DirectoryReader::DirectoryReader(const char *path)
	:dir(opendir(path))
{
	if (dir == nullptr)
		throw FmtErrno("Failed to open directory '{}'", path);
}

static DIR *
OpenDir(UniqueFileDescriptor &&fd)
{
	auto dir = fdopendir(fd.Get());
	if (dir == nullptr)
		throw MakeErrno("Failed to reopen directory");

	fd.Steal();
	return dir;
}

DirectoryReader::DirectoryReader(UniqueFileDescriptor &&fd)
	:dir(OpenDir(std::move(fd))) {}

static constexpr bool
IsSpecialFilename(const char *s) noexcept
{
	return s[0] == '.' && (s[1] == 0 || (s[1] == '.' && s[2] == 0));
}

const char *
DirectoryReader::Read() noexcept
{
	while (const auto *ent = readdir(dir))
		if (!IsSpecialFilename(ent->d_name))
			return ent->d_name;

	return nullptr;
}

FileDescriptor
DirectoryReader::GetFileDescriptor() const noexcept
{
	return FileDescriptor(dirfd(dir));
}
