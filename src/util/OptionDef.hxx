// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The MultiReader Project

#pragma once

#include <cassert>

/**
 * Command line option definition.
 */
class OptionDef
{
	const char *long_option;
	char short_option;
	const char *desc;
public:
	constexpr OptionDef(const char *_long_option, const char *_desc)
		: long_option(_long_option),
		  short_option(0),
		  desc(_desc) { }

	constexpr OptionDef(const char *_long_option,
			    char _short_option, const char *_desc)
		: long_option(_long_option),
		  short_option(_short_option),
		  desc(_desc) { }

	constexpr bool HasLongOption() const { return long_option != nullptr; }
	constexpr bool HasShortOption() const { return short_option != 0; }
	constexpr bool HasDescription() const { return desc != nullptr; }

	const char *GetLongOption() const {
		assert(HasLongOption());
		return long_option;
	}

	char GetShortOption() const {
		assert(HasShortOption());
		return short_option;
	}

	const char *GetDescription() const {
		assert(HasDescription());
		return desc;
	}
};
