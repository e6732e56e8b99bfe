// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

/**
 * Make the directory #source visible at #target (non-recursive bind
 * mount).
 *
 * Throws std::system_error on error.
 */
void
BindMount(const char *source, const char *target);

/**
 * Throws std::system_error on error.
 */
void
Unmount(const char *target);
