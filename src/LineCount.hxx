// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The MultiReader Project

#pragma once

#include <cstddef>
#include <span>

class Reader;

/**
 * Read the whole stream and count its lines.  A last line without a
 * line terminator is counted, too.
 *
 * Throws on I/O error.
 */
std::size_t
CountLines(Reader &reader);

/**
 * Open all files, concatenate them with a #MultiReader and count the
 * lines of the resulting stream.  If a file does not end with a
 * newline, its last line continues on the first line of the next
 * file.
 *
 * Throws on error, e.g. if one of the files cannot be opened; in
 * that case, no file has been read.
 */
std::size_t
CountLinesChained(std::span<const char *const> paths);

/**
 * Count the lines of each file on its own and return the sum.
 */
std::size_t
CountLinesSeparately(std::span<const char *const> paths);
