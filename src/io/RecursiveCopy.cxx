// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "RecursiveCopy.hxx"
#include "CopyRegularFile.hxx"
#include "DirectoryReader.hxx"
#include "UniqueFileDescriptor.hxx"
#include "lib/fmt/RuntimeError.hxx"
#include "lib/fmt/SystemError.hxx"

#include <cstdint>

#include <errno.h>
#include <fcntl.h>
#include <sys/stat.h>
#include <sys/sysmacros.h>
#include <linux/stat.h> // for STX_* (on Musl)

struct RecursiveCopyContext {
	const RecursiveCopyOptions options;

	/**
	 * The mount id of the source root; only used with
	 * #RecursiveCopyOptions::one_filesystem.
	 */
	uint_least64_t mnt_id{};

	explicit constexpr RecursiveCopyContext(RecursiveCopyOptions _options) noexcept
		:options(_options) {}
};

static void
RecursiveCopy(RecursiveCopyContext &ctx,
	      FileDescriptor src_parent, const char *src_filename,
	      FileDescriptor dst_parent, const char *dst_filename);

/**
 * Remove an existing non-directory so it can be replaced.
 *
 * @return false if the file exists and shall not be overwritten
 */
static bool
PrepareReplace(const RecursiveCopyContext &ctx,
	       FileDescriptor parent, const char *filename)
{
	if (!ctx.options.overwrite)
		return false;

	if (unlinkat(parent.Get(), filename, 0) < 0)
		if (const int e = errno; e != ENOENT)
			throw FmtErrno(e, "Failed to delete '{}'", filename);

	return true;
}

/**
 * Create a regular file.  If one already exists, it is deleted.
 */
static UniqueFileDescriptor
CreateRegularFile(const RecursiveCopyContext &ctx,
		  FileDescriptor parent, const char *filename, mode_t mode)
{
	UniqueFileDescriptor dst;

	/* optimistic create with O_EXCL */
	if (dst.Open(parent, filename, O_CREAT|O_EXCL|O_WRONLY|O_NOFOLLOW,
		     mode))
		return dst;

	if (const int e = errno; e != EEXIST)
		throw FmtErrno(e, "Failed to create '{}'", filename);

	if (!PrepareReplace(ctx, parent, filename))
		return {};

	if (!dst.Open(parent, filename, O_CREAT|O_EXCL|O_WRONLY|O_NOFOLLOW,
		      mode))
		throw FmtErrno("Failed to create '{}'", filename);

	return dst;
}

static UniqueFileDescriptor
MakeDirectoryAt(FileDescriptor parent, const char *filename, mode_t mode)
{
	if (mkdirat(parent.Get(), filename, mode) < 0)
		if (const int e = errno; e != EEXIST)
			throw FmtErrno(e, "Failed to create directory '{}'",
				       filename);

	UniqueFileDescriptor fd;
	if (!fd.Open(parent, filename, O_DIRECTORY|O_RDONLY|O_NOFOLLOW))
		throw FmtErrno("Failed to open directory '{}'", filename);

	return fd;
}

static void
PreserveMode(const RecursiveCopyContext &ctx, const struct statx &stx,
	     FileDescriptor dst, const char *dst_filename)
{
	if (ctx.options.preserve_mode &&
	    fchmod(dst.Get(), stx.stx_mode & ~S_IFMT) < 0)
		throw FmtErrno("Failed to set mode of '{}'", dst_filename);
}

static void
RecursiveCopyDirectory(RecursiveCopyContext &ctx,
		       UniqueFileDescriptor &&src, const struct statx &stx,
		       FileDescriptor dst_parent, const char *dst_filename)
{
	auto dst = MakeDirectoryAt(dst_parent, dst_filename,
				   stx.stx_mode & 07777);

	DirectoryReader reader{std::move(src)};
	while (const char *name = reader.Read())
		RecursiveCopy(ctx, reader.GetFileDescriptor(), name,
			      dst, name);

	PreserveMode(ctx, stx, dst, dst_filename);
}

static void
CopyRegularFileAt(RecursiveCopyContext &ctx,
		  UniqueFileDescriptor &&src, const struct statx &stx,
		  FileDescriptor dst_parent, const char *dst_filename)
{
	auto dst = CreateRegularFile(ctx, dst_parent, dst_filename,
				     stx.stx_mode & 07777);
	if (!dst.IsDefined())
		return;

	CopyRegularFile(src, dst, stx.stx_size);
	PreserveMode(ctx, stx, dst, dst_filename);
}

static void
CopyDevice(const RecursiveCopyContext &ctx, const struct statx &stx,
	   FileDescriptor dst_parent, const char *dst_filename)
{
	const dev_t dev = makedev(stx.stx_rdev_major, stx.stx_rdev_minor);
	if (mknodat(dst_parent.Get(), dst_filename, stx.stx_mode, dev) == 0)
		return;

	if (const int e = errno; e != EEXIST)
		throw FmtErrno(e, "Failed to create device '{}'",
			       dst_filename);

	if (!PrepareReplace(ctx, dst_parent, dst_filename))
		return;

	if (mknodat(dst_parent.Get(), dst_filename, stx.stx_mode, dev) < 0)
		throw FmtErrno("Failed to create device '{}'", dst_filename);
}

static void
CreateSymlink(const RecursiveCopyContext &ctx,
	      FileDescriptor parent, const char *filename, const char *target)
{
	if (symlinkat(target, parent.Get(), filename) == 0)
		return;

	if (const int e = errno; e != EEXIST)
		throw FmtErrno(e, "Failed to create '{}'", filename);

	if (!PrepareReplace(ctx, parent, filename))
		return;

	if (symlinkat(target, parent.Get(), filename) < 0)
		throw FmtErrno("Failed to create '{}'", filename);
}

static void
CopySymlink(const RecursiveCopyContext &ctx,
	    FileDescriptor src_parent, const char *src_filename,
	    FileDescriptor dst_parent, const char *dst_filename)
{
	char buffer[4096];

	ssize_t length  = readlinkat(src_parent.Get(), src_filename,
				     buffer, sizeof(buffer));
	if (length < 0)
		throw FmtErrno("Failed to read symlink '{}'", src_filename);

	if ((std::size_t)length == sizeof(buffer))
		throw FmtRuntimeError("Symlink '{}' is too long",
				      src_filename);

	buffer[length] = 0;

	CreateSymlink(ctx, dst_parent, dst_filename, buffer);
}

static void
RecursiveCopy(RecursiveCopyContext &ctx,
	      FileDescriptor src_parent, const char *src_filename,
	      FileDescriptor dst_parent, const char *dst_filename)
{
	struct statx stx;
	if (statx(src_parent.Get(), src_filename,
		  AT_SYMLINK_NOFOLLOW|AT_STATX_SYNC_AS_STAT,
		  STATX_TYPE|STATX_MODE|STATX_SIZE|STATX_MNT_ID, &stx) < 0)
		throw FmtErrno("Failed to stat '{}'", src_filename);

	if (ctx.options.one_filesystem) {
		if (ctx.mnt_id == 0)
			/* this is the top-level call - initialize the
			   "device" field */
			ctx.mnt_id = stx.stx_mnt_id;
		else if (stx.stx_mnt_id != ctx.mnt_id)
			/* this is on a different device (filesystem);
			   ignore it */
			return;
	}

	switch (stx.stx_mode & S_IFMT) {
	case S_IFLNK:
		CopySymlink(ctx, src_parent, src_filename,
			    dst_parent, dst_filename);
		return;

	case S_IFCHR:
	case S_IFBLK:
		CopyDevice(ctx, stx, dst_parent, dst_filename);
		return;

	case S_IFDIR:
	case S_IFREG:
		break;

	default:
		/* sockets and pipes are not copied */
		return;
	}

	UniqueFileDescriptor src;
	if (!src.Open(src_parent, src_filename, O_RDONLY|O_NOFOLLOW))
		throw FmtErrno("Failed to open '{}'", src_filename);

	if (S_ISDIR(stx.stx_mode))
		RecursiveCopyDirectory(ctx, std::move(src), stx,
				       dst_parent, dst_filename);
	else
		CopyRegularFileAt(ctx, std::move(src), stx,
				  dst_parent, dst_filename);
}

void
RecursiveCopy(const char *src_path, const char *dst_path,
	      RecursiveCopyOptions options)
{
	RecursiveCopyContext ctx{options};
	RecursiveCopy(ctx,
		      FileDescriptor{AT_FDCWD}, src_path,
		      FileDescriptor{AT_FDCWD}, dst_path);
}
