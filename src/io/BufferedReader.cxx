// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#include "BufferedReader.hxx"
#include "Reader.hxx"

#include <algorithm> // for std::copy_n()
#include <cassert>
#include <cstring>
#include <stdexcept>

bool
BufferedReader::Fill(bool need_more)
{
	if (eof)
		return !need_more;

	auto w = buffer.Write();
	if (w.empty()) {
		if (buffer.GetCapacity() >= MAX_SIZE)
			return !need_more;

		buffer.Grow(buffer.GetCapacity() * 2);
		w = buffer.Write();
		assert(!w.empty());
	}

	std::size_t nbytes = reader.Read(std::as_writable_bytes(w));
	if (nbytes == 0) {
		eof = true;
		return !need_more;
	}

	buffer.Append(nbytes);
	return true;
}

std::size_t
BufferedReader::ReadFromBuffer(std::span<std::byte> dest) noexcept
{
	const auto src = Read();
	std::size_t nbytes = std::min(src.size(), dest.size());
	std::copy_n(src.data(), nbytes, dest.data());
	Consume(nbytes);
	return nbytes;
}

void
BufferedReader::ReadFull(std::span<std::byte> dest)
{
	while (true) {
		std::size_t nbytes = ReadFromBuffer(dest);
		dest = dest.subspan(nbytes);
		if (dest.empty())
			break;

		if (!Fill(true))
			throw std::runtime_error("Premature end of file");
	}
}

/**
 * Cut the first complete line from the buffer, consume it and
 * null-terminate it in place.
 *
 * @return the line or nullptr if the buffer has no line terminator
 */
static char *
CutBufferedLine(DynamicFifoBuffer<char> &buffer) noexcept
{
	auto r = buffer.Read();
	char *data = r.data();
	char *newline = static_cast<char *>(std::memchr(data, '\n', r.size()));
	if (newline == nullptr)
		return nullptr;

	buffer.Consume(newline + 1 - data);

	if (newline > data && newline[-1] == '\r')
		--newline;
	*newline = 0;
	return data;
}

char *
BufferedReader::ReadLine()
{
	do {
		char *line = CutBufferedLine(buffer);
		if (line != nullptr) {
			++line_number;
			return line;
		}
	} while (Fill(true));

	if (!eof)
		throw std::runtime_error("Line is too long");

	if (buffer.empty())
		return nullptr;

	auto w = buffer.Write();
	if (w.empty()) {
		buffer.Grow(buffer.GetCapacity() + 1);
		w = buffer.Write();
		assert(!w.empty());
	}

	/* terminate the last line */
	w[0] = 0;

	char *line = buffer.Read().data();
	buffer.Clear();
	++line_number;
	return line;
}
