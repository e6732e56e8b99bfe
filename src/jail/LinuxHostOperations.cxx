// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "LinuxHostOperations.hxx"
#include "Error.hxx"
#include "io/UniqueFileDescriptor.hxx"
#include "io/linux/MountInfo.hxx"
#include "lib/fmt/SystemError.hxx"
#include "system/Mount.hxx"
#include "util/IterableSplitString.hxx"
#include "util/StringStrip.hxx"

#include <fmt/format.h>

#include <stdexcept>

#include <fcntl.h>
#include <stdlib.h>
#include <string.h>
#include <sys/stat.h>
#include <sys/sysmacros.h>
#include <sys/wait.h>
#include <unistd.h>

using std::string_view_literals::operator""sv;

/**
 * Directories searched in addition to $PATH; account management and
 * jail tools live in the "sbin" directories which are not always in
 * $PATH.
 */
static constexpr std::string_view extra_search_path =
	"/usr/local/sbin:/usr/local/bin:/usr/sbin:/usr/bin:/sbin:/bin";

bool
LinuxHostOperations::IsPrivileged() const noexcept
{
	return geteuid() == 0;
}

bool
LinuxHostOperations::IsMountPoint(const char *path) const
{
	return FindMount(path).IsDefined();
}

void
LinuxHostOperations::BindMount(const char *source, const char *target)
{
	::BindMount(source, target);
}

void
LinuxHostOperations::Unmount(const char *target)
{
	::Unmount(target);
}

void
LinuxHostOperations::Chown(const char *path, uid_t uid, gid_t gid)
{
	if (lchown(path, uid, gid) < 0)
		throw FmtErrno("Failed to chown '{}'", path);
}

void
LinuxHostOperations::MakeCharDevice(const char *path, mode_t mode,
				    unsigned major, unsigned minor)
{
	if (mknod(path, S_IFCHR | (mode & 07777), makedev(major, minor)) < 0)
		throw FmtErrno("Failed to create device '{}'", path);

	/* the mode passed to mknod() was masked by the umask */
	if (chmod(path, mode & 07777) < 0)
		throw FmtErrno("Failed to chmod '{}'", path);
}

static bool
IsExecutableFile(const char *path) noexcept
{
	struct stat st;
	return stat(path, &st) == 0 && S_ISREG(st.st_mode) &&
		access(path, X_OK) == 0;
}

static std::string
FindInPath(std::string_view search_path, std::string_view name) noexcept
{
	for (const auto dir : IterableSplitString(search_path, ':')) {
		if (dir.empty())
			continue;

		auto path = fmt::format("{}/{}", dir, name);
		if (IsExecutableFile(path.c_str()))
			return path;
	}

	return {};
}

std::string
LinuxHostOperations::FindProgram(const char *name) const noexcept
{
	if (strchr(name, '/') != nullptr)
		return IsExecutableFile(name) ? std::string{name} : std::string{};

	if (const char *path = getenv("PATH"); path != nullptr) {
		auto result = FindInPath(path, name);
		if (!result.empty())
			return result;
	}

	return FindInPath(extra_search_path, name);
}

static void
ReadAll(FileDescriptor fd, std::string &output)
{
	char buffer[4096];

	while (true) {
		ssize_t nbytes = fd.Read(buffer, sizeof(buffer));
		if (nbytes < 0) {
			if (errno == EINTR)
				continue;

			throw MakeErrno("Failed to read from pipe");
		}

		if (nbytes == 0)
			break;

		output.append(buffer, nbytes);
	}
}

static int
WaitProcess(pid_t pid)
{
	int status;
	while (waitpid(pid, &status, 0) < 0) {
		if (errno != EINTR)
			throw MakeErrno("waitpid() failed");
	}

	if (WIFEXITED(status))
		return WEXITSTATUS(status);

	if (WIFSIGNALED(status))
		return 128 + WTERMSIG(status);

	return EXIT_FAILURE;
}

int
LinuxHostOperations::Run(const std::vector<std::string> &args,
			 std::string *output)
{
	if (args.empty())
		throw std::invalid_argument("No program specified");

	std::string program = FindProgram(args.front().c_str());
	if (program.empty())
		/* same as the shell */
		return 127;

	std::vector<char *> argv;
	argv.reserve(args.size() + 1);
	for (const auto &i : args)
		argv.push_back(const_cast<char *>(i.c_str()));
	argv.push_back(nullptr);

	UniqueFileDescriptor r, w;
	if (output != nullptr) {
		int fds[2];
		if (pipe2(fds, O_CLOEXEC) < 0)
			throw MakeErrno("pipe() failed");

		r = UniqueFileDescriptor{fds[0]};
		w = UniqueFileDescriptor{fds[1]};
	}

	const pid_t pid = fork();
	if (pid < 0)
		throw MakeErrno("fork() failed");

	if (pid == 0) {
		if (w.IsDefined())
			dup2(w.Get(), STDOUT_FILENO);

		execv(program.c_str(), argv.data());
		_exit(127);
	}

	if (output != nullptr) {
		w.Close();
		try {
			ReadAll(r, *output);
		} catch (...) {
			/* don't leave a zombie behind */
			r.Close();
			int status;
			while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
			throw;
		}
	}

	return WaitProcess(pid);
}

std::vector<std::string>
ParseLddOutput(std::string_view output)
{
	std::vector<std::string> result;

	for (auto line : IterableSplitString(output, '\n')) {
		line = Strip(line);
		if (line.empty())
			continue;

		std::string_view path;

		if (const auto arrow = line.find("=>"sv);
		    arrow != line.npos) {
			const auto name = Strip(line.substr(0, arrow));
			path = Strip(line.substr(arrow + 2));

			if (path.starts_with("not found"sv))
				throw DependencyMissing(fmt::format("Shared library not found: {}",
								    name));
		} else
			path = line;

		/* chop off the load address */
		if (const auto paren = path.find(" ("sv);
		    paren != path.npos)
			path = path.substr(0, paren);

		/* skip virtual libraries like linux-vdso.so.1 and
		   informational lines like "statically linked" */
		if (!path.starts_with('/'))
			continue;

		result.emplace_back(path);
	}

	return result;
}

std::vector<std::string>
LinuxHostOperations::ListSharedLibraries(const char *path)
{
	std::string output;
	const int status = Run({"ldd", path}, &output);
	if (status == 127)
		throw DependencyMissing("ldd not found");

	if (status != 0)
		/* a static executable */
		return {};

	return ParseLddOutput(output);
}
