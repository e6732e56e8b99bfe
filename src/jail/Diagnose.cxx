// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Diagnose.hxx"
#include "BaseTemplate.hxx"
#include "Config.hxx"
#include "Error.hxx"
#include "HostOperations.hxx"
#include "IdentityFile.hxx"
#include "JailTree.hxx"
#include "MountManager.hxx"
#include "State.hxx"
#include "Username.hxx"
#include "io/StringFile.hxx"
#include "util/Exception.hxx"
#include "util/IterableSplitString.hxx"
#include "util/StringStrip.hxx"

#include <fmt/format.h>

#include <iterator>

#include <sys/stat.h>
#include <unistd.h>

using std::string_view_literals::operator""sv;

static constexpr const char *AUTH_LOG_PATH = "/var/log/auth.log";
static constexpr std::size_t AUTH_LOG_LINES = 10;

class ReportWriter {
	fmt::memory_buffer buffer;

public:
	template<typename S, typename... Args>
	void operator()(const S &format_str, Args&&... args) {
		fmt::vformat_to(std::back_inserter(buffer),
				fmt::string_view{format_str},
				fmt::make_format_args(args...));
		buffer.push_back('\n');
	}

	void Check(bool ok, std::string_view ok_text,
		   std::string_view error_text) {
		(*this)("   [{}] {}", ok ? "OK" : "ERROR",
			ok ? ok_text : error_text);
	}

	std::string Finish() const noexcept {
		return fmt::to_string(buffer);
	}
};

static std::string
DescribeFile(const std::string &path) noexcept
{
	struct stat st;
	if (lstat(path.c_str(), &st) < 0)
		return fmt::format("{}: missing", path);

	return fmt::format("{}: owner {}:{}, mode {:04o}", path,
			   st.st_uid, st.st_gid, st.st_mode & 07777);
}

static bool
IsFile(const std::string &path) noexcept
{
	struct stat st;
	return stat(path.c_str(), &st) == 0 && S_ISREG(st.st_mode);
}

static void
DescribeSecurityModules(ReportWriter &w, HostOperations &host)
{
	if (!host.FindProgram("getenforce").empty()) {
		std::string output;
		if (host.Run({"getenforce"}, &output) == 0)
			w("   SELinux: {}", Strip(std::string_view{output}));
		else
			w("   SELinux: getenforce failed");
	} else
		w("   SELinux: not installed");

	if (!host.FindProgram("aa-status").empty())
		w("   AppArmor: {}",
		  host.Run({"aa-status", "--enabled"}) == 0
		  ? "enabled" : "disabled");
	else
		w("   AppArmor: not installed");
}

static void
DescribeAuthLog(ReportWriter &w, std::string_view username)
{
	std::string text;
	try {
		text = LoadTextFile(AUTH_LOG_PATH);
	} catch (const std::system_error &e) {
		w("   {}", GetFullMessage(e));
		return;
	}

	std::vector<std::string_view> lines;
	for (const auto line : IterableSplitString(text, '\n'))
		if (line.find(username) != line.npos)
			lines.push_back(line);

	if (lines.empty()) {
		w("   no entries");
		return;
	}

	const std::size_t first = lines.size() > AUTH_LOG_LINES
		? lines.size() - AUTH_LOG_LINES
		: 0;
	for (std::size_t i = first; i < lines.size(); ++i)
		w("   {}", lines[i]);
}

std::string
Diagnose(const JailConfig &config, HostOperations &host,
	 BaseTemplate &base, const MountManager &mounts,
	 std::string_view username)
{
	CheckUsername(username);

	const auto passwd = PasswdFile::LoadExisting(config.passwd_path);
	const auto *account = passwd.Find(username);
	if (account == nullptr)
		throw ValidationError(fmt::format("No such account: '{}'",
						  username));

	const auto user_jail = config.GetUserJailPath(username);
	const auto real_home = OriginalHome(config, account->home, username);
	const auto jail_home = JailPath(user_jail, real_home);

	ReportWriter w;
	w("Diagnosis for '{}'", username);

	w("1. Shell: {}", account->shell);
	w.Check(account->shell == config.confined_shell,
		"confined shell", "not the confined shell");

	w("2. Confined shell binary:");
	const bool host_shell = access(config.confined_shell.c_str(), X_OK) == 0;
	w.Check(host_shell, "installed on the system", "missing on the system");
	const bool jail_shell = IsFile(JailPath(user_jail, config.confined_shell));
	w.Check(jail_shell, "present in the jail", "missing in the jail");

	w("3. Home mount: {} on {}", real_home, jail_home);
	const bool mounted = mounts.IsMounted(jail_home);
	w.Check(mounted, "mounted", "not mounted");
	w.Check(mounts.HasDurableEntry(real_home, jail_home),
		fmt::format("listed in {}", mounts.GetFstabPath()),
		fmt::format("not listed in {}", mounts.GetFstabPath()));

	w("4. Permissions:");
	w("   {}", DescribeFile(user_jail));
	w("   {}", DescribeFile(jail_home));
	w("   {}", DescribeFile(real_home));

	w("5. Chroot shell configuration:");
	w.Check(IsFile(config.chroot_shell_config),
		config.chroot_shell_config,
		fmt::format("{} is missing", config.chroot_shell_config));

	w("6. Identity records:");
	w("   System: {}", account->Format());

	const auto jail_passwd = PasswdFile::Load(JailPath(user_jail, "etc/passwd"sv));
	if (const auto *e = jail_passwd.Find(username)) {
		w("   Jail: {}", e->Format());
		w.Check(e->home == real_home, "jail home path is correct",
			"jail home path is not the original home path");
	} else
		w.Check(false, {}, "no record in the jail");

	w("7. Security modules:");
	DescribeSecurityModules(w, host);

	w("8. Recent authentication log entries:");
	DescribeAuthLog(w, username);

	JailStatus status;
	try {
		status = InspectJail(config, base, mounts, *account);
		w("State: {}", ToString(status.GetState()));
	} catch (const DependencyMissing &e) {
		w("State: unknown ({})", e.what());
	}

	return w.Finish();
}
