// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "LineParser.hxx"

#include <fmt/format.h>

#include <string.h>

void
LineParser::ExpectEnd()
{
	if (!IsEnd())
		throw Error{fmt::format("Unexpected tokens at end of line: {}",
					p)};
}

bool
LineParser::SkipWord(const char *word) noexcept
{
	const std::size_t length = strlen(word);
	if (strncmp(p, word, length) != 0 ||
	    !IsWhitespaceOrNull(p[length]))
		return false;

	p += length;
	StripWhitespace();
	return true;
}

const char *
LineParser::NextWord() noexcept
{
	if (!IsWordChar(front()))
		return nullptr;

	char *const result = p;
	do {
		++p;
	} while (IsWordChar(front()));

	if (IsWhitespaceNotNull(front())) {
		*p++ = 0;
		StripWhitespace();
	} else if (!IsEnd()) {
		/* not a whole word */
		p = result;
		return nullptr;
	}

	return result;
}

inline char *
LineParser::NextUnquotedValue() noexcept
{
	if (IsEnd())
		return nullptr;

	char *const value = p;
	while (!IsWhitespaceOrNull(front()) && !IsQuote(front()))
		++p;

	if (IsWhitespaceNotNull(front())) {
		*p++ = 0;
		StripWhitespace();
	} else if (!IsEnd()) {
		p = value;
		return nullptr;
	}

	return value;
}

inline char *
LineParser::NextQuotedValue(char stop) noexcept
{
	char *const value = p;
	char *dest = p;

	while (true) {
		char ch = *p;
		if (ch == 0)
			/* unterminated quote */
			return nullptr;

		++p;

		if (ch == stop)
			break;

		if (ch == '\\' && stop == '"') {
			ch = *p;
			if (ch == 0)
				return nullptr;

			++p;
		}

		*dest++ = ch;
	}

	*dest = 0;
	StripWhitespace();
	return value;
}

char *
LineParser::NextUnescape() noexcept
{
	if (IsQuote(front())) {
		const char stop = *p++;
		return NextQuotedValue(stop);
	}

	return NextUnquotedValue();
}

const char *
LineParser::ExpectWord()
{
	const char *value = NextWord();
	if (value == nullptr)
		throw Error("Word expected");

	return value;
}

std::pair<const char *, const char *>
LineParser::ExpectAssignmentAndEnd()
{
	if (!IsWordChar(front()))
		throw Error("Variable name expected");

	char *const name = p;
	do {
		++p;
	} while (IsWordChar(front()));

	char *const name_end = p;
	StripWhitespace();

	if (front() != '=')
		throw Error("'=' expected");

	/* the '=' may be the byte right after the name, so terminate
	   the name only after skipping it */
	++p;
	*name_end = 0;
	StripWhitespace();

	const char *value = "";
	if (!IsEnd()) {
		value = NextUnescape();
		if (value == nullptr)
			throw Error("Malformed value after '='");
	}

	ExpectEnd();
	return {name, value};
}

char *
LineParser::ExpectValue()
{
	char *value = NextUnescape();
	if (value == nullptr || *value == 0)
		throw Error("Value expected");

	return value;
}

char *
LineParser::ExpectValueAndEnd()
{
	char *value = ExpectValue();
	ExpectEnd();
	return value;
}
