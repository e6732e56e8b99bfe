// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "StringFile.hxx"
#include "lib/fmt/RuntimeError.hxx"
#include "lib/fmt/SystemError.hxx"
#include "io/Open.hxx"
#include "io/UniqueFileDescriptor.hxx"
#include "util/StringStrip.hxx"

std::string
LoadStringFile(const char *path)
{
	auto fd = OpenReadOnly(path);

	char buffer[1024];
	ssize_t nbytes = fd.Read(buffer, sizeof(buffer));
	if (nbytes < 0)
		throw FmtErrno("Failed to read {}", path);

	size_t length = nbytes;
	if (length >= sizeof(buffer))
		throw FmtRuntimeError("File is too large: {}", path);

	return std::string{Strip(std::string_view{buffer, length})};
}

std::string
LoadTextFile(const char *path)
{
	auto fd = OpenReadOnly(path);

	std::string result;
	char buffer[8192];

	while (true) {
		ssize_t nbytes = fd.Read(buffer, sizeof(buffer));
		if (nbytes < 0) {
			if (errno == EINTR)
				continue;

			throw FmtErrno("Failed to read {}", path);
		}

		if (nbytes == 0)
			break;

		result.append(buffer, nbytes);
	}

	return result;
}
