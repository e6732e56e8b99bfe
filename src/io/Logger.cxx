// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Logger.hxx"
#include "FileDescriptor.hxx"
#include "util/Exception.hxx"

#include <fmt/format.h>

#include <array>
#include <iterator>
#include <span>

#include <sys/uio.h>
#include <time.h>
#include <unistd.h>

unsigned LoggerDetail::max_level = 1;

static FileDescriptor log_file = FileDescriptor::Undefined();

void
SetLogFile(FileDescriptor fd) noexcept
{
	log_file = fd;
}

void
LoggerDetail::LineBuffer::Append(const std::exception_ptr &ep)
{
	Append(GetFullMessage(ep));
}

static struct iovec
MakeIovec(std::string_view s) noexcept
{
	return {const_cast<char *>(s.data()), s.size()};
}

static std::string_view
FormatTimestamp(std::span<char> buffer) noexcept
{
	const time_t now = time(nullptr);
	struct tm tm;
	if (localtime_r(&now, &tm) == nullptr)
		return {};

	return {buffer.data(),
		strftime(buffer.data(), buffer.size(), "[%F %T] ", &tm)};
}

void
LoggerDetail::Emit(std::string_view domain, std::string_view message) noexcept
{
	char stamp_buffer[32];

	/* slot 0 is reserved for the timestamp of the log file copy */
	std::array<struct iovec, 6> v;
	std::size_t n = 1;

	if (!domain.empty()) {
		v[n++] = MakeIovec("[");
		v[n++] = MakeIovec(domain);
		v[n++] = MakeIovec("] ");
	}

	v[n++] = MakeIovec(message);
	v[n++] = MakeIovec("\n");

	ssize_t nbytes = writev(STDERR_FILENO, v.data() + 1, n - 1);
	(void)nbytes;

	if (log_file.IsDefined()) {
		v[0] = MakeIovec(FormatTimestamp(stamp_buffer));
		nbytes = writev(log_file.Get(), v.data(), n);
		(void)nbytes;
	}
}

void
LoggerDetail::Fmt(unsigned level, std::string_view domain,
		  fmt::string_view format_str, fmt::format_args args) noexcept
{
	if (!CheckLevel(level))
		return;

	fmt::memory_buffer buffer;
	fmt::vformat_to(std::back_inserter(buffer), format_str, args);
	Emit(domain, {buffer.data(), buffer.size()});
}

std::string
ChildLogger::MakeDomain(std::string_view parent, std::string_view name) noexcept
{
	if (parent.empty())
		return std::string{name};

	return fmt::format("{}/{}", parent, name);
}
