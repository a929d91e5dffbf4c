// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The MultiReader Project

#pragma once

#include "Reader.hxx"

#include <algorithm> // for std::copy_n()
#include <string_view>

/**
 * A #Reader which reads from a buffer in memory.  It does not own
 * the buffer; the caller is responsible for keeping it alive.
 */
class MemoryReader final : public Reader {
	std::span<const std::byte> src;

public:
	explicit MemoryReader(std::span<const std::byte> _src) noexcept
		:src(_src) {}

	explicit MemoryReader(std::string_view _src) noexcept
		:src(std::as_bytes(std::span{_src})) {}

	MemoryReader(const MemoryReader &other) noexcept
		:Reader(), src(other.src) {}

	std::size_t GetRemaining() const noexcept {
		return src.size();
	}

	/* virtual methods from class Reader */
	std::size_t Read(std::span<std::byte> dest) noexcept override {
		const std::size_t nbytes = std::min(dest.size(), src.size());
		std::copy_n(src.begin(), nbytes, dest.begin());
		src = src.subspan(nbytes);
		return nbytes;
	}
};
