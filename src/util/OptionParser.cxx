// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The MultiReader Project

#include "OptionParser.hxx"
#include "lib/fmt/RuntimeError.hxx"

#include <string_view>

inline OptionParser::Result
OptionParser::IdentifyOption(const char *s) const
{
	assert(s != nullptr);
	assert(*s == '-');

	if (s[1] == '-') {
		const std::string_view name{s + 2};
		for (const auto &i : options)
			if (i.HasLongOption() && name == i.GetLongOption())
				return {int(&i - options.data())};
	} else if (s[1] != 0 && s[2] == 0) {
		const char ch = s[1];
		for (const auto &i : options)
			if (i.HasShortOption() && ch == i.GetShortOption())
				return {int(&i - options.data())};
	}

	throw FmtRuntimeError("Unknown option: {}", s);
}

OptionParser::Result
OptionParser::Next()
{
	while (!args.empty()) {
		const char *arg = args.front();
		args = args.subspan(1);

		if (std::string_view{arg} == "--") {
			remaining.insert(remaining.end(),
					 args.begin(), args.end());
			args = {};
			break;
		}

		if (arg[0] == '-' && arg[1] != 0)
			return IdentifyOption(arg);

		remaining.push_back(arg);
	}

	return {-1};
}
