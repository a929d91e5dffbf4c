// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The MultiReader Project

#include "config.h"
#include "CommandLine.hxx"
#include "lib/fmt/RuntimeError.hxx"
#include "util/OptionDef.hxx"
#include "util/OptionParser.hxx"

#include <fmt/core.h>

#include <string_view>

#include <stdlib.h>

enum Option {
	OPTION_VERBOSE,
	OPTION_QUIET,
	OPTION_TIMESTAMP,
	OPTION_VERSION,
	OPTION_HELP,
	OPTION_HELP2,
};

static constexpr OptionDef option_defs[] = {
	{"verbose", 'v', "verbose logging"},
	{"quiet", 'q', "log errors only"},
	{"timestamp", 't', "prefix log messages with the time"},
	{"version", 'V', "print version number"},
	{"help", 'h', "show help options"},
	{nullptr, '?', nullptr}, // hidden, standard alias for --help
};

[[noreturn]]
static void
version() noexcept
{
	fmt::print("count_lines ({} {})\n", PACKAGE, VERSION);
	exit(EXIT_SUCCESS);
}

static void
PrintOption(const OptionDef &opt) noexcept
{
	if (opt.HasShortOption())
		fmt::print("  -{} ", opt.GetShortOption());
	else
		fmt::print("     ");

	fmt::print("--{:<12} {}\n",
		   opt.GetLongOption(), opt.GetDescription());
}

[[noreturn]]
static void
help() noexcept
{
	fmt::print("Usage:\n"
		   "  count_lines [OPTION...] chained|separate FILE...\n"
		   "\n"
		   "Modes:\n"
		   "  chained     count the lines of all files concatenated\n"
		   "  separate    count the lines of each file and add them up\n"
		   "\n"
		   "Options:\n");

	for (const auto &i : option_defs)
		if (i.HasDescription())
			PrintOption(i);

	exit(EXIT_SUCCESS);
}

static CountMode
ParseCountMode(std::string_view s)
{
	if (s == "chained")
		return CountMode::CHAINED;

	if (s == "separate")
		return CountMode::SEPARATE;

	throw FmtRuntimeError("Unknown mode: \"{}\"", s);
}

void
ParseCommandLine(int argc, const char *const*argv,
		 CommandLineOptions &options)
{
	OptionParser parser(option_defs, argc, argv);
	while (auto o = parser.Next()) {
		switch (Option(o.index)) {
		case OPTION_VERBOSE:
			options.verbose = true;
			break;

		case OPTION_QUIET:
			options.quiet = true;
			break;

		case OPTION_TIMESTAMP:
			options.timestamp = true;
			break;

		case OPTION_VERSION:
			version();

		case OPTION_HELP:
		case OPTION_HELP2:
			help();
		}
	}

	if (options.verbose && options.quiet)
		throw std::runtime_error("--verbose and --quiet are mutually exclusive");

	const auto args = parser.GetRemaining();
	if (args.empty())
		throw std::runtime_error("No mode specified; see --help");

	options.mode = ParseCountMode(args.front());

	if (args.size() < 2)
		throw std::runtime_error("No files specified; see --help");

	options.files.assign(args.begin() + 1, args.end());
}
