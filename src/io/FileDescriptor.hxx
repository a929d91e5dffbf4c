// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#pragma once

#include <cstddef>
#include <span>
#include <utility>

#include <sys/types.h>
#include <unistd.h>

/**
 * An OO wrapper for a UNIX file descriptor.
 *
 * This class is unmanaged and trivial; for a managed version, see
 * #UniqueFileDescriptor.
 */
class FileDescriptor {
protected:
	int fd;

public:
	FileDescriptor() = default;
	explicit constexpr FileDescriptor(int _fd) noexcept:fd(_fd) {}

	constexpr bool IsDefined() const noexcept {
		return fd >= 0;
	}

	/**
	 * Returns the file descriptor.  This may only be called if
	 * IsDefined() returns true.
	 */
	constexpr int Get() const noexcept {
		return fd;
	}

	int Steal() noexcept {
		return std::exchange(fd, -1);
	}

	static constexpr FileDescriptor Undefined() noexcept {
		return FileDescriptor(-1);
	}

	/**
	 * Open a file; the flags O_NOCTTY and O_CLOEXEC are always
	 * added.
	 *
	 * @return false on error (with errno set)
	 */
	bool Open(const char *pathname, int flags, mode_t mode=0666) noexcept;

	/**
	 * Close the file descriptor.  It should not be called on an
	 * "undefined" object.  After this call, IsDefined() is
	 * guaranteed to return false.
	 */
	bool Close() noexcept {
		return ::close(Steal()) == 0;
	}

	/**
	 * Returns the size of the file in bytes, or -1 on error.
	 */
	[[gnu::pure]]
	off_t GetSize() const noexcept;

	ssize_t Read(std::span<std::byte> dest) const noexcept {
		return ::read(fd, dest.data(), dest.size());
	}
};
