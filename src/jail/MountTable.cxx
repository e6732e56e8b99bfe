// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "MountTable.hxx"
#include "io/FileWriter.hxx"
#include "io/StringFile.hxx"
#include "io/linux/MountInfo.hxx"
#include "system/Error.hxx"
#include "util/CharUtil.hxx"
#include "util/IterableSplitString.hxx"
#include "util/StringStrip.hxx"

#include <fmt/format.h>

#include <algorithm>
#include <array>
#include <charconv>


MountTableEntry
MountTableEntry::Bind(std::string_view source,
		      std::string_view target) noexcept
{
	return {
		std::string{source},
		std::string{target},
		"none",
		"bind",
	};
}

/**
 * Split at runs of whitespace (the fstab field separator).
 */
template<std::size_t N>
static std::size_t
SplitWhitespace(std::array<std::string_view, N> &dest,
		std::string_view s) noexcept
{
	std::size_t n = 0;

	while (true) {
		s = StripLeft(s);
		if (s.empty())
			break;

		if (n >= N)
			return N + 1;

		std::size_t i = 0;
		while (i < s.size() && !IsWhitespaceOrNull(s[i]))
			++i;

		dest[n++] = s.substr(0, i);
		s.remove_prefix(i);
	}

	return n;
}

static bool
ParseUnsigned(unsigned &dest, std::string_view s) noexcept
{
	const auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(),
					       dest);
	return ec == std::errc{} && ptr == s.data() + s.size();
}

std::optional<MountTableEntry>
MountTableEntry::Parse(std::string_view line) noexcept
{
	line = Strip(line);
	if (line.empty() || line.front() == '#')
		return std::nullopt;

	std::array<std::string_view, 6> f;
	const std::size_t n = SplitWhitespace(f, line);
	if (n < 4 || n > f.size())
		return std::nullopt;

	MountTableEntry e{
		UnescapeMountPath(f[0]),
		UnescapeMountPath(f[1]),
		std::string{f[2]},
		std::string{f[3]},
	};

	if ((n > 4 && !ParseUnsigned(e.dump, f[4])) ||
	    (n > 5 && !ParseUnsigned(e.pass, f[5])))
		return std::nullopt;

	return e;
}

std::string
MountTableEntry::Format() const noexcept
{
	return fmt::format("{} {} {} {} {} {}",
			   EscapeMountPath(source), EscapeMountPath(target),
			   type, options, dump, pass);
}

std::string
EscapeMountPath(std::string_view path) noexcept
{
	std::string result;
	result.reserve(path.size());

	for (const char ch : path) {
		if (ch == ' ' || ch == '\t' || ch == '\n' || ch == '\\')
			result += fmt::format("\\{:03o}", (unsigned char)ch);
		else
			result.push_back(ch);
	}

	return result;
}

MountTable
MountTable::Load(std::string path)
{
	MountTable table{std::move(path)};

	try {
		table.Parse(LoadTextFile(table.path.c_str()));
	} catch (const std::system_error &e) {
		if (!IsFileNotFound(e))
			throw;
	}

	return table;
}

void
MountTable::Parse(std::string_view text) noexcept
{
	lines.clear();

	if (!text.empty() && text.back() == '\n')
		text.remove_suffix(1);

	if (text.empty())
		return;

	for (const auto i : IterableSplitString(text, '\n'))
		lines.push_back({std::string{i}, MountTableEntry::Parse(i)});
}

bool
MountTable::Contains(std::string_view source,
		     std::string_view target) const noexcept
{
	return Count(source, target) > 0;
}

bool
MountTable::ContainsTarget(std::string_view target) const noexcept
{
	return std::any_of(lines.begin(), lines.end(), [target](const Line &i){
		return i.entry && i.entry->target == target;
	});
}

std::size_t
MountTable::Count(std::string_view source,
		  std::string_view target) const noexcept
{
	return std::count_if(lines.begin(), lines.end(), [source, target](const Line &i){
		return i.entry && i.entry->source == source &&
			i.entry->target == target;
	});
}

bool
MountTable::AddBind(std::string_view source,
		    std::string_view target) noexcept
{
	if (Contains(source, target))
		return false;

	auto entry = MountTableEntry::Bind(source, target);
	auto raw = entry.Format();
	lines.push_back({std::move(raw), std::move(entry)});
	return true;
}

std::size_t
MountTable::RemoveTarget(std::string_view target) noexcept
{
	return std::erase_if(lines, [target](const Line &i){
		return i.entry && i.entry->target == target;
	});
}

std::string
MountTable::Format() const noexcept
{
	std::string result;
	for (const auto &i : lines) {
		result += i.raw;
		result += '\n';
	}

	return result;
}

void
MountTable::Save() const
{
	ReplaceFile(path.c_str(), Format(), 0644);
}
