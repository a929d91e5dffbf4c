// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#pragma once

#include <algorithm>
#include <cassert>
#include <cstddef>
#include <memory>
#include <span>

/**
 * A first-in-first-out buffer on the heap which can grow: data gets
 * appended at the tail and consumed from the head.  Consumed space is
 * reclaimed by moving the remaining data to the front when more room
 * is needed at the tail.
 */
template<typename T>
class DynamicFifoBuffer {
public:
	using size_type = std::size_t;
	using Range = std::span<T>;

private:
	std::unique_ptr<T[]> data;
	size_type capacity;

	size_type head = 0, tail = 0;

public:
	explicit DynamicFifoBuffer(size_type _capacity) noexcept
		:data(new T[_capacity]), capacity(_capacity) {}

	DynamicFifoBuffer(const DynamicFifoBuffer &) = delete;
	DynamicFifoBuffer &operator=(const DynamicFifoBuffer &) = delete;

	constexpr size_type GetCapacity() const noexcept {
		return capacity;
	}

	constexpr void Clear() noexcept {
		head = tail = 0;
	}

	constexpr bool empty() const noexcept {
		return head == tail;
	}

	constexpr size_type GetAvailable() const noexcept {
		return tail - head;
	}

	/**
	 * Return a buffer range which may be read.  The buffer pointer
	 * is writable, to allow modifications while parsing.
	 */
	Range Read() const noexcept {
		return {data.get() + head, tail - head};
	}

	/**
	 * Marks a chunk as consumed.
	 */
	void Consume(size_type n) noexcept {
		assert(head + n <= tail);

		head += n;
	}

	/**
	 * Prepares writing.  Returns a buffer range which may be
	 * written; it is empty if the buffer is full.  When you are
	 * finished, call Append().
	 */
	Range Write() noexcept {
		if (empty())
			Clear();
		else if (tail == capacity)
			Shift();

		return {data.get() + tail, capacity - tail};
	}

	/**
	 * Expands the tail of the buffer, after data has been written
	 * to the buffer returned by Write().
	 */
	void Append(size_type n) noexcept {
		assert(tail + n <= capacity);

		tail += n;
	}

	void Grow(size_type new_capacity) noexcept {
		assert(new_capacity > capacity);

		std::unique_ptr<T[]> new_data(new T[new_capacity]);
		const auto r = Read();
		std::move(r.begin(), r.end(), new_data.get());

		data = std::move(new_data);
		capacity = new_capacity;
		tail -= head;
		head = 0;
	}

private:
	void Shift() noexcept {
		if (head == 0)
			return;

		const auto r = Read();
		std::move(r.begin(), r.end(), data.get());

		tail -= head;
		head = 0;
	}
};
