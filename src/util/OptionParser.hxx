// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The MultiReader Project

#pragma once

#include "OptionDef.hxx"

#include <span>
#include <vector>

/**
 * Command line option parser.  Options and non-option arguments may
 * be mixed; "--" ends option parsing.
 */
class OptionParser
{
	std::span<const OptionDef> options;

	std::span<const char *const> args;

	std::vector<const char *> remaining;

public:
	OptionParser(std::span<const OptionDef> _options,
		     int _argc, const char *const*_argv) noexcept
		:options(_options), args(_argv + 1, _argc - 1) {}

	struct Result {
		int index;

		constexpr operator bool() const noexcept {
			return index >= 0;
		}
	};

	/**
	 * Parses the next option, collecting non-option arguments on
	 * the way.  Returns a false #Result after the last option.
	 *
	 * Throws on error.
	 */
	Result Next();

	/**
	 * Returns the remaining non-option arguments.
	 */
	std::span<const char *const> GetRemaining() const noexcept {
		return remaining;
	}

private:
	Result IdentifyOption(const char *s) const;
};
