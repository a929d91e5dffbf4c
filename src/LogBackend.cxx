// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The MultiReader Project

#include "LogBackend.hxx"
#include "Log.hxx"
#include "lib/fmt/ExceptionFormatter.hxx"
#include "util/Domain.hxx"
#include "util/Exception.hxx"

#include <fmt/chrono.h>
#include <fmt/format.h>

#include <algorithm> // for std::min()
#include <ctime>
#include <iterator> // for std::back_inserter()

#include <stdio.h>

using std::string_view_literals::operator""sv;

static constexpr Domain exception_domain("exception");

static LogLevel log_threshold = LogLevel::NOTICE;

static bool enable_timestamp;

void
SetLogThreshold(LogLevel _threshold) noexcept
{
	log_threshold = _threshold;
}

void
EnableLogTimestamp() noexcept
{
	enable_timestamp = true;
}

static std::string_view
log_date() noexcept
{
	static char buf[32];
	const time_t t = time(nullptr);
	const auto *tm = std::localtime(&t);
	if (tm == nullptr)
		return {};

	const auto result = fmt::format_to_n(buf, sizeof(buf), "{:%FT%T} "sv, *tm);
	return {buf, std::min(result.size, sizeof(buf))};
}

/**
 * Strip trailing whitespace, including line terminators.
 */
static std::string_view
StripTrailingSpace(std::string_view s) noexcept
{
	while (!s.empty() && (s.back() == '\n' || s.back() == '\r' ||
			      s.back() == ' ' || s.back() == '\t'))
		s.remove_suffix(1);
	return s;
}

void
Log(LogLevel level, const Domain &domain, std::string_view msg) noexcept
{
	if (level < log_threshold)
		return;

	fmt::print(stderr, "{}{}: {}\n",
		   enable_timestamp ? log_date() : ""sv,
		   domain.GetName(),
		   StripTrailingSpace(msg));
}

void
LogVFmt(LogLevel level, const Domain &domain,
	fmt::string_view format_str, fmt::format_args args) noexcept
{
	/* don't bother formatting messages which get discarded */
	if (level < log_threshold)
		return;

	fmt::memory_buffer buffer;
	fmt::vformat_to(std::back_inserter(buffer), format_str, args);
	Log(level, domain, {buffer.data(), buffer.size()});
}

void
Log(LogLevel level, const std::exception_ptr &ep) noexcept
{
	if (level < log_threshold)
		return;

	Log(level, exception_domain, GetFullMessage(ep));
}

void
Log(LogLevel level, const std::exception_ptr &ep, const char *msg) noexcept
{
	LogFmt(level, exception_domain, "{}: {}", msg, ep);
}
