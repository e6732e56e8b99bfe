// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <fmt/format.h>

#include <exception>
#include <new>
#include <string>
#include <string_view>
#include <utility>

class FileDescriptor;

/*
 * Log levels: 1 = normal, 2 = verbose, 3 = debug.  Lines above the
 * configured level are discarded before any formatting happens.
 */

namespace LoggerDetail {

extern unsigned max_level;

inline bool
CheckLevel(unsigned level) noexcept
{
	return level <= max_level;
}

/**
 * The growing text of one log line.
 */
class LineBuffer {
	fmt::memory_buffer buffer;

public:
	void Append(std::string_view s) {
		buffer.append(s);
	}

	/**
	 * Appends the message of the exception and all nested
	 * exceptions.
	 */
	void Append(const std::exception_ptr &ep);

	std::string_view View() const noexcept {
		return {buffer.data(), buffer.size()};
	}
};

/**
 * Emit one complete line to stderr (and the log file, if one was
 * set).
 */
void
Emit(std::string_view domain, std::string_view message) noexcept;

void
Fmt(unsigned level, std::string_view domain,
    fmt::string_view format_str, fmt::format_args args) noexcept;

} /* namespace LoggerDetail */

inline void
SetLogLevel(unsigned level) noexcept
{
	LoggerDetail::max_level = level;
}

/**
 * Copy all log lines to the given file (in addition to stderr), each
 * prefixed with the local time.  The caller retains ownership; pass
 * FileDescriptor::Undefined() to stop.
 */
void
SetLogFile(FileDescriptor fd) noexcept;

/**
 * Writes lines of the form "[domain] message".  A logger is cheap
 * enough to be a member of every component.
 */
class Logger {
	std::string domain;

public:
	Logger() = default;

	explicit Logger(std::string_view _domain) noexcept
		:domain(_domain) {}

	std::string_view GetDomain() const noexcept {
		return domain;
	}

	static bool CheckLevel(unsigned level) noexcept {
		return LoggerDetail::CheckLevel(level);
	}

	/**
	 * Log the concatenation of all parameters.  Each may be a
	 * string or a std::exception_ptr.
	 */
	template<typename... Params>
	void operator()(unsigned level, const Params &...params) const noexcept {
		if (!CheckLevel(level))
			return;

		try {
			LoggerDetail::LineBuffer line;
			(line.Append(params), ...);
			LoggerDetail::Emit(domain, line.View());
		} catch (const std::bad_alloc &) {
			/* out of memory: drop the line */
		}
	}

	template<typename S, typename... Args>
	void Fmt(unsigned level, const S &format_str,
		 Args&&... args) const noexcept {
		LoggerDetail::Fmt(level, domain, format_str,
				  fmt::make_format_args(args...));
	}
};

/**
 * A logger for a fixed component name, e.g. "mount".
 */
using LLogger = Logger;

/**
 * A logger whose domain is nested below another one, e.g.
 * "provision/alice".
 */
class ChildLogger : public Logger {
public:
	ChildLogger(const Logger &parent, std::string_view name) noexcept
		:Logger(MakeDomain(parent.GetDomain(), name)) {}

private:
	static std::string MakeDomain(std::string_view parent,
				      std::string_view name) noexcept;
};
