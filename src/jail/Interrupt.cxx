// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Interrupt.hxx"
#include "Error.hxx"
#include "system/Error.hxx"

#include <signal.h>

static volatile sig_atomic_t interrupted = 0;

static void
HandleSignal(int) noexcept
{
	interrupted = 1;
}

void
InstallInterruptHandlers()
{
	struct sigaction sa{};
	sa.sa_handler = HandleSignal;
	sigemptyset(&sa.sa_mask);

	for (int signo : {SIGINT, SIGTERM, SIGHUP})
		if (sigaction(signo, &sa, nullptr) < 0)
			throw MakeErrno("sigaction() failed");
}

bool
IsInterrupted() noexcept
{
	return interrupted != 0;
}

void
RequestInterrupt() noexcept
{
	interrupted = 1;
}

void
ClearInterrupt() noexcept
{
	interrupted = 0;
}

void
CheckInterrupted()
{
	if (IsInterrupted())
		throw Interrupted();
}
