// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#pragma once

#include <concepts>
#include <cstddef>
#include <span>
#include <type_traits>

/**
 * An interface that can read bytes from a stream until the stream
 * ends.
 *
 * Errors are reported by throwing an exception.  An implementation
 * which throws must not have consumed any data, i.e. the caller may
 * retry the same call.
 */
class Reader {
public:
	Reader() = default;
	Reader(const Reader &) = delete;
	Reader &operator=(const Reader &) = delete;

	virtual ~Reader() noexcept = default;

	/**
	 * Read data from the stream.
	 *
	 * @return the number of bytes read into the given buffer or 0
	 * on end-of-stream; 0 is also returned if the given buffer is
	 * empty
	 */
	virtual std::size_t Read(std::span<std::byte> dest) = 0;

	/**
	 * Like Read(), but throws an exception when there is not
	 * enough data to fill the destination buffer.
	 */
	void ReadFull(std::span<std::byte> dest);

	template<typename T>
	requires std::is_standard_layout_v<T> && std::is_trivially_copyable_v<T>
	void ReadT(T &dest) {
		ReadFull(std::as_writable_bytes(std::span{&dest, 1}));
	}
};

/**
 * A type which can be read from directly, like #Reader.
 */
template<typename T>
concept DirectByteSource = requires(T &t, std::span<std::byte> dest) {
	{ t.Read(dest) } -> std::convertible_to<std::size_t>;
};

/**
 * A pointer (or smart pointer) to a #DirectByteSource.
 */
template<typename T>
concept IndirectByteSource = requires(T &t) {
	{ *t } -> DirectByteSource;
};

/**
 * Anything a #MultiReader can collect: either a byte source by value
 * or a pointer to one.
 */
template<typename T>
concept ByteSource = DirectByteSource<T> || IndirectByteSource<T>;

template<ByteSource T>
inline std::size_t
ReadFrom(T &src, std::span<std::byte> dest)
{
	if constexpr (DirectByteSource<T>)
		return src.Read(dest);
	else
		return (*src).Read(dest);
}
