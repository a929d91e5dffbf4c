// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#pragma once

#include "Reader.hxx"
#include "UniqueFileDescriptor.hxx"

#include <cstdint>

/**
 * A #Reader which reads a regular file (or anything else which can
 * be opened with open(), e.g. a pipe).  The file is closed by the
 * destructor.
 */
class FileReader final : public Reader {
	UniqueFileDescriptor fd;

public:
	/**
	 * Throws std::system_error if the file cannot be opened.
	 */
	explicit FileReader(const char *path);

	FileReader(FileReader &&other) noexcept
		:fd(std::move(other.fd)) {}

	FileReader &operator=(FileReader &&other) noexcept {
		fd = std::move(other.fd);
		return *this;
	}

	/**
	 * Returns the size of the file, or 0 if it is unknown.
	 */
	[[gnu::pure]]
	uint_least64_t GetSize() const noexcept {
		const auto size = fd.GetSize();
		return size > 0 ? uint_least64_t(size) : 0;
	}

	/* virtual methods from class Reader */
	std::size_t Read(std::span<std::byte> dest) override;
};
