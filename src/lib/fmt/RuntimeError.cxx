// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The MultiReader Project

#include "RuntimeError.hxx"

#include <fmt/format.h>

std::runtime_error
VFmtRuntimeError(fmt::string_view format_str, fmt::format_args args) noexcept
{
	return std::runtime_error{fmt::vformat(format_str, args)};
}

std::invalid_argument
VFmtInvalidArgument(fmt::string_view format_str, fmt::format_args args) noexcept
{
	return std::invalid_argument{fmt::vformat(format_str, args)};
}
