// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "MountInfo.hxx"
#include "lib/fmt/SystemError.hxx"
#include "util/IterableSplitString.hxx"

#include <algorithm>
#include <array>

#include <stdio.h>
#include <stdlib.h>

using std::string_view_literals::operator""sv;

template<std::size_t N>
static void
SplitFill(std::array<std::string_view, N> &dest, std::string_view s, char separator)
{
	std::size_t i = 0;
	for (auto value : IterableSplitString(s, separator)) {
		dest[i++] = value;
		if (i >= dest.size())
			return;
	}

	std::fill(std::next(dest.begin(), i), dest.end(), std::string_view{});
}

static FILE *
OpenMountInfo()
{
	static constexpr const char *path = "/proc/self/mountinfo";

	FILE *file = fopen(path, "re");
	if (file == nullptr)
		throw FmtErrno("Failed to open {}", path);

	return file;
}

static constexpr bool
IsOctalDigit(char ch) noexcept
{
	return ch >= '0' && ch <= '7';
}

std::string
UnescapeMountPath(std::string_view s) noexcept
{
	std::string result;
	result.reserve(s.size());

	for (std::size_t i = 0; i < s.size(); ++i) {
		if (s[i] == '\\' && i + 3 < s.size() &&
		    IsOctalDigit(s[i + 1]) && IsOctalDigit(s[i + 2]) &&
		    IsOctalDigit(s[i + 3])) {
			result.push_back(char(((s[i + 1] - '0') << 6) |
					      ((s[i + 2] - '0') << 3) |
					      (s[i + 3] - '0')));
			i += 3;
		} else
			result.push_back(s[i]);
	}

	return result;
}

struct MountInfoView {
	std::string_view mnt_id;
	std::string_view root;
	std::string_view mount_point;
	std::string_view filesystem;
	std::string_view source;

	operator MountInfo() const noexcept {
		return {
			/* the string_view is not null-terminated, but
			   we know it's followed by a space, so this
			   dirty code line is "okayish" */
			strtoull(mnt_id.data(), nullptr, 10),
			UnescapeMountPath(mount_point),
			UnescapeMountPath(root),
			std::string{filesystem},
			UnescapeMountPath(source),
		};
	}
};

class MountInfoReader {
	FILE *const file;

	char line[4096];

public:
	MountInfoReader()
		:file(OpenMountInfo()) {}

	~MountInfoReader() noexcept {
		fclose(file);
	}

	MountInfoReader(const MountInfoReader &) = delete;
	MountInfoReader &operator=(const MountInfoReader &) = delete;

	bool ReadLine() noexcept {
		return fgets(line, sizeof(line), file) != nullptr;
	}

	MountInfoView GetLine() const noexcept {
		std::string_view s{line};
		if (!s.empty() && s.back() == '\n')
			s.remove_suffix(1);

		std::array<std::string_view, 12> columns;
		SplitFill(columns, s, ' ');

		/* skip the optional tagged fields */
		size_t i = 6;
		while (i < columns.size() && columns[i] != "-"sv)
			++i;

		if (i + 2 >= columns.size())
			return {};

		return {
			columns[0],
			columns[3],
			columns[4],
			columns[i + 1],
			columns[i + 2],
		};
	}
};

MountInfo
FindMount(const char *mount_point)
{
	const std::string_view wanted{mount_point};

	MountInfoReader reader;
	MountInfo result{};

	/* later lines describe mounts stacked on top of earlier ones */
	while (reader.ReadLine()) {
		const auto i = reader.GetLine();
		if (!i.mount_point.empty() &&
		    UnescapeMountPath(i.mount_point) == wanted)
			result = i;
	}

	return result;
}
