// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "FakeHostOperations.hxx"
#include "jail/Config.hxx"
#include "jail/Interrupt.hxx"
#include "io/FileWriter.hxx"
#include "io/MakeDirectory.hxx"
#include "io/StringFile.hxx"
#include "system/Error.hxx"

#include <fmt/core.h>

#include <filesystem>
#include <stdexcept>
#include <string>

#include <stdlib.h>
#include <sys/stat.h>

/**
 * A temporary directory with a fake host: account files, a mount
 * table, shell binaries, a shared library and the home directories
 * of "alice" and "bob".  Everything is deleted by the destructor.
 */
class TestEnvironment {
public:
	std::string root;

	JailConfig config;

	FakeHostOperations host;

	TestEnvironment() {
		char tmpl[] = "/tmp/sitejail-test.XXXXXX";
		if (mkdtemp(tmpl) == nullptr)
			throw std::runtime_error("mkdtemp() failed");

		root = tmpl;

		MakeNestedDirectory(Path("host/usr/sbin").c_str());
		MakeNestedDirectory(Path("host/lib").c_str());
		MakeNestedDirectory(Path("etc").c_str());
		MakeNestedDirectory(Path("home").c_str());

		config.jail_root = Path("jail");
		config.home_root = Path("home");
		config.passwd_path = Path("etc/passwd");
		config.group_path = Path("etc/group");
		config.fstab_path = Path("etc/fstab");
		config.database_path = Path("db.sq3");
		config.confined_shell = Path("host/usr/sbin/jk_chrootsh");
		config.limited_shell = Path("host/usr/sbin/jk_lsh");
		config.chroot_shell_config = Path("etc/jk_chrootsh.conf");
		config.log_file.clear();

		WriteFile(config.confined_shell, "#!/bin/sh\n", 0755);
		WriteFile(config.limited_shell, "#!/bin/sh\n", 0755);

		const auto lib = Path("host/lib/libfake.so.1");
		WriteFile(lib, "ELF", 0644);
		host.libraries = {lib};

		WriteFile(config.passwd_path,
			  fmt::format("root:x:0:0:root:/root:/bin/bash\n"
				      "daemon:x:1:1:daemon:/usr/sbin:/usr/sbin/nologin\n"
				      "nobody:x:65534:65534:nobody:/nonexistent:/usr/sbin/nologin\n"
				      "alice:x:1001:1001:Alice:{0}/home/alice:/bin/bash\n"
				      "bob:x:1002:1002:Bob:{0}/home/bob:/bin/zsh\n",
				      root),
			  0644);
		WriteFile(config.group_path,
			  "root:x:0:\n"
			  "daemon:x:1:\n"
			  "nogroup:x:65534:\n"
			  "alice:x:1001:\n"
			  "bob:x:1002:\n",
			  0644);
		WriteFile(config.fstab_path,
			  "# /etc/fstab: static file system information.\n"
			  "proc /proc proc defaults 0 0\n",
			  0644);

		MakeHome("alice");
		MakeHome("bob");

		host.passwd_path = config.passwd_path;
		host.group_path = config.group_path;

		ClearInterrupt();
	}

	~TestEnvironment() noexcept {
		std::error_code ec;
		std::filesystem::remove_all(root, ec);
	}

	TestEnvironment(const TestEnvironment &) = delete;
	TestEnvironment &operator=(const TestEnvironment &) = delete;

	std::string Path(std::string_view relative) const {
		return fmt::format("{}/{}", root, relative);
	}

	std::string RealHome(std::string_view username) const {
		return config.GetRealHome(username);
	}

	/**
	 * The bind mount target of the given account's home.
	 */
	std::string JailHome(std::string_view username) const {
		return config.GetUserJailPath(username) + RealHome(username);
	}

	static void WriteFile(const std::string &path, std::string_view contents,
			      mode_t mode) {
		ReplaceFile(path.c_str(), contents, mode);
		if (chmod(path.c_str(), mode) < 0)
			throw MakeErrno("chmod() failed");
	}

	static std::string ReadFile(const std::string &path) {
		return LoadTextFile(path.c_str());
	}

	static bool Exists(const std::string &path) noexcept {
		struct stat st;
		return lstat(path.c_str(), &st) == 0;
	}

	void MakeHome(std::string_view username) const {
		const auto home = RealHome(username);
		MakeDirectory(home.c_str());
		WriteFile(home + "/index.html", "hello\n", 0644);
	}
};
