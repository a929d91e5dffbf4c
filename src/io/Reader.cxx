// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#include "Reader.hxx"

#include <stdexcept>

void
Reader::ReadFull(std::span<std::byte> dest)
{
	while (!dest.empty()) {
		const auto nbytes = Read(dest);
		if (nbytes == 0)
			throw std::runtime_error{"Unexpected end of file"};

		dest = dest.subspan(nbytes);
	}
}
