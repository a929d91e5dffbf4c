// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The MultiReader Project

#pragma once

#include <vector>

enum class CountMode {
	/**
	 * Concatenate all files and count the lines of the combined
	 * stream.
	 */
	CHAINED,

	/**
	 * Count each file on its own.
	 */
	SEPARATE,
};

struct CommandLineOptions {
	CountMode mode = CountMode::CHAINED;

	std::vector<const char *> files;

	bool verbose = false;
	bool quiet = false;
	bool timestamp = false;
};

/**
 * Parse the command line of "count_lines".  Prints the help text or
 * the version and exits if requested.
 *
 * Throws std::runtime_error on usage errors.
 */
void
ParseCommandLine(int argc, const char *const*argv,
		 CommandLineOptions &options);
