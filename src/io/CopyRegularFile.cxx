// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "CopyRegularFile.hxx"
#include "FileWriter.hxx"
#include "Open.hxx"
#include "UniqueFileDescriptor.hxx"
#include "lib/fmt/RuntimeError.hxx"
#include "lib/fmt/SystemError.hxx"

#include <array>
#include <cstddef>

#include <fcntl.h> // for posix_fadvise()
#include <sys/stat.h>

/**
 * Throws on error.
 *
 * @return true on success (all data has been copied), false if
 * copy_file_range() is not supported (no data has been copied)
 */
static bool
CopyFileRange(FileDescriptor src, FileDescriptor dst, off_t size)
{
	auto nbytes = copy_file_range(src.Get(), nullptr, dst.Get(), nullptr,
				      size, 0);
	if (nbytes <= 0)
		return false;

	size -= nbytes;

	while (size > 0) {
		nbytes = copy_file_range(src.Get(), nullptr,
					 dst.Get(), nullptr,
					 size, 0);
		if (nbytes <= 0) [[unlikely]] {
			if (nbytes == 0)
				throw std::runtime_error{"Unexpected end of file"};

			throw MakeErrno("Failed to copy file data");
		}

		size -= nbytes;
	}

	return true;
}

void
CopyRegularFile(FileDescriptor src, FileDescriptor dst, off_t size)
{
	if (size <= 0)
		return;

	if (CopyFileRange(src, dst, size))
		return;

	posix_fadvise(src.Get(), 0, size, POSIX_FADV_SEQUENTIAL);

	std::array<std::byte, 65536> buffer;

	while (size > 0) {
		const auto nbytes = src.Read(buffer);
		if (nbytes <= 0) [[unlikely]] {
			if (nbytes == 0)
				throw std::runtime_error{"Unexpected end of file"};

			throw MakeErrno("Failed to read file");
		}

		dst.FullWrite(std::span<const std::byte>{buffer}.first(nbytes));
		size -= nbytes;
	}
}

void
CopyFile(const char *src_path, const char *dst_path, mode_t mode)
{
	auto src = OpenReadOnly(src_path);

	struct stat st;
	if (fstat(src.Get(), &st) < 0)
		throw FmtErrno("Failed to stat '{}'", src_path);

	if (!S_ISREG(st.st_mode))
		throw FmtRuntimeError("Not a regular file: '{}'", src_path);

	FileWriter w(dst_path, mode);

	if (fchmod(w.GetFileDescriptor().Get(), mode) < 0)
		throw FmtErrno("Failed to chmod '{}'", dst_path);

	CopyRegularFile(src, w.GetFileDescriptor(), st.st_size);
	w.Commit();
}
