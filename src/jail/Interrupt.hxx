// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

/**
 * Install handlers for SIGINT, SIGTERM and SIGHUP which set a flag
 * instead of terminating the process.  The flag is polled with
 * CheckInterrupted().
 *
 * Throws on error.
 */
void
InstallInterruptHandlers();

bool
IsInterrupted() noexcept;

/**
 * Set the flag as if a signal had been received.
 */
void
RequestInterrupt() noexcept;

void
ClearInterrupt() noexcept;

/**
 * Throws #Interrupted if a signal has been received.
 */
void
CheckInterrupted();
