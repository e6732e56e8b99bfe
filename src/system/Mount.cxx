// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Mount.hxx"
#include "lib/fmt/SystemError.hxx"

#include <sys/mount.h>

void
BindMount(const char *source, const char *target)
{
	if (mount(source, target, nullptr, MS_BIND, nullptr) < 0)
		throw FmtErrno("Failed to bind-mount '{}' on '{}'",
			       source, target);
}

void
Unmount(const char *target)
{
	if (umount2(target, 0) < 0)
		throw FmtErrno("Failed to unmount '{}'", target);
}
