// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#pragma once

#include "util/DynamicFifoBuffer.hxx"

#include <cstddef>
#include <span>

class Reader;

/**
 * Adds a buffer to a #Reader, which allows reading the stream line
 * by line and reading fixed-size records.  This is the layer which
 * is expected to sit on top of a #MultiReader; a line which
 * straddles the boundary between two sources is returned as one
 * line.
 */
class BufferedReader {
	static constexpr std::size_t INITIAL_SIZE = 16384;
	static constexpr std::size_t MAX_SIZE = 512 * 1024;

	Reader &reader;

	DynamicFifoBuffer<char> buffer;

	bool eof = false;

	std::size_t line_number = 0;

public:
	explicit BufferedReader(Reader &_reader) noexcept
		:reader(_reader), buffer(INITIAL_SIZE) {}

	/**
	 * Read more data from the #Reader into the buffer.
	 *
	 * @param need_more true if the caller cannot make progress
	 * with the data already in the buffer
	 * @return true if data was appended, or if the caller did not
	 * need more and the buffer cannot take any more
	 */
	bool Fill(bool need_more);

	bool IsEOF() const noexcept {
		return eof;
	}

	/**
	 * Returns the buffered data without consuming it.
	 */
	[[gnu::pure]]
	std::span<std::byte> Read() const noexcept {
		return std::as_writable_bytes(buffer.Read());
	}

	void Consume(std::size_t n) noexcept {
		buffer.Consume(n);
	}

	/**
	 * Read (and consume) data from the input buffer into the
	 * given buffer.  Does not attempt to refill the buffer.
	 */
	std::size_t ReadFromBuffer(std::span<std::byte> dest) noexcept;

	/**
	 * Read data into the given buffer and consume it from our
	 * buffer.  Throws std::runtime_error if the stream ends
	 * before the buffer is filled.
	 */
	void ReadFull(std::span<std::byte> dest);

	template<typename T>
	T ReadFullT() {
		T dest;
		ReadFull(std::as_writable_bytes(std::span{&dest, 1}));
		return dest;
	}

	/**
	 * Read the next line.  The line terminator ("\n" or "\r\n")
	 * is removed; the last line of the stream does not need one.
	 *
	 * Throws std::runtime_error if a line does not fit into the
	 * maximum buffer size.
	 *
	 * @return a pointer to the null-terminated line (valid until
	 * the next call) or nullptr at the end of the stream
	 */
	char *ReadLine();

	/**
	 * Returns the number of lines returned by ReadLine() so far.
	 */
	std::size_t GetLineNumber() const noexcept {
		return line_number;
	}
};
