// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The MultiReader Project

#pragma once

#include "Reader.hxx"

#include <cassert>
#include <concepts>
#include <cstddef>
#include <ranges>
#include <utility>
#include <vector>

/**
 * A #Reader which concatenates a list of other byte sources.  Each
 * source is read until it reports end-of-stream, and then the next
 * one is used; only after the last source has ended, this object
 * reports end-of-stream.
 *
 * The sources are owned by this object and are destroyed together
 * with it.  The caller must not read from them directly after
 * passing them to the constructor.
 *
 * @param S a #ByteSource, e.g. #FileReader, "Reader *" or
 * "std::unique_ptr<Reader>"
 */
template<ByteSource S>
class MultiReader final : public Reader {
	std::vector<S> sources;

	/**
	 * Index of the source which is currently being read.  If it
	 * equals sources.size(), all sources have ended.
	 */
	std::size_t cursor = 0;

public:
	MultiReader() noexcept = default;

	explicit MultiReader(std::vector<S> &&_sources) noexcept
		:sources(std::move(_sources)) {}

	/**
	 * Collect the sources from an arbitrary range.  Elements are
	 * moved if the range yields rvalues (e.g. a transform view
	 * which opens files), and copied otherwise.
	 */
	template<std::ranges::input_range R>
	requires std::constructible_from<S, std::ranges::range_reference_t<R>>
	explicit MultiReader(R &&range) {
		if constexpr (std::ranges::sized_range<R>)
			sources.reserve(std::ranges::size(range));

		for (auto &&i : range)
			sources.emplace_back(std::forward<decltype(i)>(i));
	}

	MultiReader(MultiReader &&src) noexcept
		:sources(std::move(src.sources)),
		 cursor(std::exchange(src.cursor, 0)) {}

	MultiReader &operator=(MultiReader &&src) noexcept {
		using std::swap;
		swap(sources, src.sources);
		swap(cursor, src.cursor);
		return *this;
	}

	std::size_t GetSourceCount() const noexcept {
		return sources.size();
	}

	/**
	 * Returns the index of the source which will be used by the
	 * next Read() call.
	 */
	std::size_t GetCursor() const noexcept {
		return cursor;
	}

	/**
	 * Have all sources ended?
	 */
	bool IsEOF() const noexcept {
		return cursor == sources.size();
	}

	/* virtual methods from class Reader */
	std::size_t Read(std::span<std::byte> dest) override {
		while (!IsEOF()) {
			assert(cursor < sources.size());

			/* if this throws, the cursor stays where it
			   is and the caller may retry */
			const std::size_t nbytes = ReadFrom(sources[cursor], dest);
			if (nbytes > 0 || dest.empty())
				/* an empty buffer yields 0 even if
				   the source still has data; that
				   must not be mistaken for its end */
				return nbytes;

			++cursor;
		}

		return 0;
	}
};

template<std::ranges::input_range R>
MultiReader(R &&) -> MultiReader<std::ranges::range_value_t<R>>;
