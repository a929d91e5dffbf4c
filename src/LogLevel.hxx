// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The MultiReader Project

#pragma once

enum class LogLevel {
	/**
	 * Debug message for developers.
	 */
	DEBUG,

	/**
	 * Unimportant informational message.
	 */
	INFO,

	/**
	 * Interesting informational message.
	 */
	NOTICE,

	/**
	 * Warning: something may be wrong.
	 */
	WARNING,

	/**
	 * An error has occurred, an operation could not finish
	 * successfully.
	 */
	ERROR,
};
