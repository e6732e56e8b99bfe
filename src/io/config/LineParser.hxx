// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "util/StringStrip.hxx"
#include "util/CharUtil.hxx"

#include <stdexcept>
#include <utility>

/**
 * Splits one configuration line into tokens.  The line buffer is
 * modified in place: each returned token is null-terminated inside
 * it.
 */
class LineParser {
	char *p;

public:
	using Error = std::runtime_error;

	explicit LineParser(char *_p) noexcept {
		Reset(_p);
	}

	/**
	 * Continue with a different buffer, e.g. the line after
	 * variable expansion.
	 */
	void Reset(char *_p) noexcept {
		p = StripLeft(_p);
		StripRight(p);
	}

	char *Rest() noexcept {
		return p;
	}

	char front() const noexcept {
		return *p;
	}

	bool IsEnd() const noexcept {
		return front() == 0;
	}

	/**
	 * Is this an empty line or a "#" comment?
	 */
	bool IsComment() const noexcept {
		return IsEnd() || front() == '#';
	}

	void ExpectEnd();

	/**
	 * Skip the given keyword if it is the next whole word.
	 */
	bool SkipWord(const char *word) noexcept;

	const char *NextWord() noexcept;
	const char *ExpectWord();

	/**
	 * Parse a value which may be quoted with single or double
	 * quotes; inside double quotes, backslash escapes the next
	 * character.  Unquoted values end at the next whitespace.
	 *
	 * @return nullptr on syntax error or at the end of the line
	 */
	char *NextUnescape() noexcept;

	/**
	 * Expect a non-empty value.
	 */
	char *ExpectValue();
	char *ExpectValueAndEnd();

	/**
	 * Parse "NAME=VALUE" up to the end of the line.  The value may
	 * be quoted and may be empty.
	 *
	 * @return the name and the value
	 */
	std::pair<const char *, const char *> ExpectAssignmentAndEnd();

	static constexpr bool IsWordChar(char ch) noexcept {
		return IsAlphaNumericASCII(ch) || ch == '_';
	}

private:
	void StripWhitespace() noexcept {
		p = StripLeft(p);
	}

	char *NextUnquotedValue() noexcept;
	char *NextQuotedValue(char stop) noexcept;

	static constexpr bool IsQuote(char ch) noexcept {
		return ch == '"' || ch == '\'';
	}
};
