// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The MultiReader Project

#pragma once

#include "LogLevel.hxx"

/**
 * Messages below this level are discarded.  The default is
 * #LogLevel::NOTICE.
 */
void
SetLogThreshold(LogLevel _threshold) noexcept;

/**
 * Prefix each message with the local time.
 */
void
EnableLogTimestamp() noexcept;
