// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The MultiReader Project

#pragma once

#include "io/Reader.hxx"

#include <array>
#include <cstddef>
#include <stdexcept>
#include <string>

/**
 * Read the stream until it ends, using the given chunk size for each
 * Read() call.
 */
template<std::size_t chunk_size=64>
static inline std::string
ReadAll(Reader &reader)
{
	std::string result;
	std::array<std::byte, chunk_size> buffer;

	while (true) {
		const std::size_t nbytes = reader.Read(buffer);
		if (nbytes == 0)
			break;

		result.append(reinterpret_cast<const char *>(buffer.data()),
			      nbytes);
	}

	return result;
}

/**
 * A #Reader which forwards to another one, but throws on the given
 * call number (counting from zero) without touching the other
 * #Reader.
 */
class FlakyReader final : public Reader {
	Reader &next;

	const unsigned fail_at;

	unsigned n_calls = 0;

public:
	FlakyReader(Reader &_next, unsigned _fail_at) noexcept
		:next(_next), fail_at(_fail_at) {}

	unsigned GetCallCount() const noexcept {
		return n_calls;
	}

	/* virtual methods from class Reader */
	std::size_t Read(std::span<std::byte> dest) override {
		if (n_calls++ == fail_at)
			throw std::runtime_error("I'm broken");

		return next.Read(dest);
	}
};
