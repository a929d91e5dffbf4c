// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#pragma once

class UniqueFileDescriptor;

/**
 * Open a file for reading.
 *
 * Throws std::system_error (naming the path) on error.
 */
UniqueFileDescriptor
OpenReadOnly(const char *path, int flags=0);
