// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The MultiReader Project

#pragma once

#include "system/Error.hxx" // IWYU pragma: export

#include <fmt/core.h>

[[nodiscard]] [[gnu::pure]]
std::system_error
VFmtSystemError(std::error_code code,
		fmt::string_view format_str, fmt::format_args args) noexcept;

/**
 * Like MakeErrno(), but the message is formatted by {fmt}.
 */
[[nodiscard]] [[gnu::pure]]
inline std::system_error
VFmtErrno(int code,
	  fmt::string_view format_str, fmt::format_args args) noexcept
{
	return VFmtSystemError(std::error_code(code, ErrnoCategory()),
			       format_str, args);
}

template<typename S, typename... Args>
[[nodiscard]] [[gnu::pure]]
std::system_error
FmtErrno(int code, const S &format_str, Args&&... args) noexcept
{
	return VFmtErrno(code, format_str, fmt::make_format_args(args...));
}

template<typename S, typename... Args>
[[nodiscard]] [[gnu::pure]]
std::system_error
FmtErrno(const S &format_str, Args&&... args) noexcept
{
	return VFmtErrno(errno, format_str, fmt::make_format_args(args...));
}
