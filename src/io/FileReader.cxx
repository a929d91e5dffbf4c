// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#include "FileReader.hxx"
#include "Open.hxx"
#include "system/Error.hxx"

#include <cassert>

FileReader::FileReader(const char *path)
	:fd(OpenReadOnly(path))
{
}

std::size_t
FileReader::Read(std::span<std::byte> dest)
{
	assert(fd.IsDefined());

	ssize_t nbytes = fd.Read(dest);
	if (nbytes < 0)
		throw MakeErrno("Failed to read from file");

	return nbytes;
}
