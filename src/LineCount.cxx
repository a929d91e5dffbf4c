// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The MultiReader Project

#include "LineCount.hxx"
#include "Log.hxx"
#include "io/BufferedReader.hxx"
#include "io/FileReader.hxx"
#include "io/MultiReader.hxx"
#include "lib/fmt/RuntimeError.hxx"
#include "util/Domain.hxx"

#include <exception>
#include <ranges>

static constexpr Domain line_count_domain("line_count");

std::size_t
CountLines(Reader &reader)
{
	BufferedReader buffered(reader);

	while (buffered.ReadLine() != nullptr) {}

	return buffered.GetLineNumber();
}

std::size_t
CountLinesChained(std::span<const char *const> paths)
{
	MultiReader<FileReader> reader{paths | std::views::transform([](const char *path){
		return FileReader{path};
	})};

	FmtDebug(line_count_domain, "Reading {} files as one stream",
		 reader.GetSourceCount());

	try {
		return CountLines(reader);
	} catch (...) {
		/* a failed read leaves the cursor on the failing
		   file */
		std::throw_with_nested(FmtRuntimeError("Failed to read \"{}\"",
						       paths[reader.GetCursor()]));
	}
}

std::size_t
CountLinesSeparately(std::span<const char *const> paths)
{
	std::size_t total = 0;

	for (const char *path : paths) {
		FileReader file{path};

		std::size_t n;
		try {
			n = CountLines(file);
		} catch (...) {
			std::throw_with_nested(FmtRuntimeError("Failed to read \"{}\"",
							       path));
		}

		FmtDebug(line_count_domain, "{}: {} lines", path, n);
		total += n;
	}

	return total;
}
