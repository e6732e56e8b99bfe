// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "IdentityFile.hxx"
#include "io/FileWriter.hxx"
#include "io/StringFile.hxx"
#include "system/Error.hxx"
#include "util/IterableSplitString.hxx"

#include <algorithm>


template<typename Entry>
IdentityFile<Entry>
IdentityFile<Entry>::Load(std::string path)
{
	IdentityFile file{std::move(path)};

	try {
		file.Parse(LoadTextFile(file.path.c_str()));
	} catch (const std::system_error &e) {
		if (!IsFileNotFound(e))
			throw;
	}

	return file;
}

template<typename Entry>
IdentityFile<Entry>
IdentityFile<Entry>::LoadExisting(std::string path)
{
	IdentityFile file{std::move(path)};
	file.Parse(LoadTextFile(file.path.c_str()));
	return file;
}

template<typename Entry>
void
IdentityFile<Entry>::Parse(std::string_view text) noexcept
{
	lines.clear();

	if (!text.empty() && text.back() == '\n')
		text.remove_suffix(1);

	if (text.empty())
		return;

	for (const auto i : IterableSplitString(text, '\n'))
		lines.push_back({std::string{i}, Entry::Parse(i)});
}

template<typename Entry>
const Entry *
IdentityFile<Entry>::Find(std::string_view name) const noexcept
{
	for (const auto &i : lines)
		if (i.entry && i.entry->name == name)
			return &*i.entry;

	return nullptr;
}

template<typename Entry>
std::size_t
IdentityFile<Entry>::Count(std::string_view name) const noexcept
{
	return std::count_if(lines.begin(), lines.end(), [name](const Line &i){
		return i.entry && i.entry->name == name;
	});
}

template<typename Entry>
void
IdentityFile<Entry>::Append(Entry entry) noexcept
{
	auto raw = entry.Format();
	lines.push_back({std::move(raw), std::move(entry)});
}

template<typename Entry>
bool
IdentityFile<Entry>::Replace(const Entry &entry) noexcept
{
	for (auto &i : lines) {
		if (i.entry && i.entry->name == entry.name) {
			i.entry = entry;
			i.raw = entry.Format();
			return true;
		}
	}

	return false;
}

template<typename Entry>
std::size_t
IdentityFile<Entry>::Remove(std::string_view name) noexcept
{
	return std::erase_if(lines, [name](const Line &i){
		return i.entry && i.entry->name == name;
	});
}

template<typename Entry>
std::string
IdentityFile<Entry>::Format() const noexcept
{
	std::string result;
	for (const auto &i : lines) {
		result += i.raw;
		result += '\n';
	}

	return result;
}

template<typename Entry>
void
IdentityFile<Entry>::Save(mode_t default_mode) const
{
	ReplaceFile(path.c_str(), Format(), default_mode);
}

template class IdentityFile<PasswdEntry>;
template class IdentityFile<GroupEntry>;
