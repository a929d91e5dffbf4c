// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The MultiReader Project

#pragma once

#include "util/Exception.hxx"

#include <fmt/format.h>

/**
 * Formats a std::exception_ptr as the message of the exception and
 * all its nested exceptions.
 */
template<>
struct fmt::formatter<std::exception_ptr> : formatter<string_view>
{
	template<typename FormatContext>
	auto format(std::exception_ptr e, FormatContext &ctx) const {
		return formatter<string_view>::format(GetFullMessage(e), ctx);
	}
};
