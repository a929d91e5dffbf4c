// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The MultiReader Project

/*
 * count_lines: count the lines of a list of files, either by reading
 * them as one concatenated stream or one by one.
 */

#include "CommandLine.hxx"
#include "LineCount.hxx"
#include "Log.hxx"
#include "LogBackend.hxx"
#include "util/Domain.hxx"

#include <fmt/core.h>

#include <stdlib.h>

static constexpr Domain count_lines_domain("count_lines");

static void
SetupLog(const CommandLineOptions &options) noexcept
{
	if (options.verbose)
		SetLogThreshold(LogLevel::DEBUG);
	else if (options.quiet)
		SetLogThreshold(LogLevel::ERROR);

	if (options.timestamp)
		EnableLogTimestamp();
}

int
main(int argc, char **argv) noexcept
try {
	CommandLineOptions options;
	ParseCommandLine(argc, argv, options);
	SetupLog(options);

	std::size_t count = 0;
	switch (options.mode) {
	case CountMode::CHAINED:
		count = CountLinesChained(options.files);
		break;

	case CountMode::SEPARATE:
		count = CountLinesSeparately(options.files);
		break;
	}

	FmtInfo(count_lines_domain, "Counted {} lines in {} files",
		count, options.files.size());

	fmt::print("Lines count: {}\n", count);
	return EXIT_SUCCESS;
} catch (...) {
	LogError(std::current_exception());
	return EXIT_FAILURE;
}
