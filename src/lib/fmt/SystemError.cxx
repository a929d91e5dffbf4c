// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The MultiReader Project

#include "SystemError.hxx"

#include <fmt/format.h>

std::system_error
VFmtSystemError(std::error_code code,
		fmt::string_view format_str, fmt::format_args args) noexcept
{
	return std::system_error{code, fmt::vformat(format_str, args)};
}
