#pragma once

#include "jobSystem.h"
#include <cassert>
#include <cstring>
#include <new>
#include <type_traits>
#include <utility>

namespace Reef {

/**
 * @brief Fixed size array of trivially copyable elements, allocated through a JobSystemAllocator

The memory is owned by the buffer and released exactly once, either by release() or by the destructor. <br>
release() can be called any number of times. <br>
*/
template <typename T>
class Buffer {
	static_assert(std::is_trivially_copyable_v<T>);

public:
	Buffer() = default;

	/**
	 * @brief Allocate count value-initialized elements
	 */
	explicit Buffer(size_t elementCount, const Jobs::JobSystemAllocator& allocator = Jobs::getDefaultAllocator())
	    : allocator(allocator) {
		allocate(elementCount);
		for (size_t i = 0; i < elementCount; ++i) {
			new (elements + i) T {};
		}
	}

	/**
	 * @brief Allocate count elements and copy them from data
	 */
	Buffer(const T* data, size_t elementCount, const Jobs::JobSystemAllocator& allocator = Jobs::getDefaultAllocator())
	    : allocator(allocator) {
		allocate(elementCount);
		if (elementCount) {
			std::memcpy(elements, data, elementCount * sizeof(T));
		}
	}

	Buffer(const Buffer&) = delete;
	Buffer& operator=(const Buffer&) = delete;

	Buffer(Buffer&& other) noexcept
	    : allocator(std::move(other.allocator))
	    , elements(other.elements)
	    , count(other.count) {
		other.elements = nullptr;
		other.count = 0;
	}

	Buffer& operator=(Buffer&& other) noexcept {
		if (this != &other) {
			release();
			allocator = std::move(other.allocator);
			elements = other.elements;
			count = other.count;
			other.elements = nullptr;
			other.count = 0;
		}
		return *this;
	}

	~Buffer() {
		release();
	}

	void release() {
		if (elements) {
			allocator.free(elements);
			elements = nullptr;
			count = 0;
		}
	}

	bool isAllocated() const {
		return elements != nullptr;
	}

	size_t size() const {
		return count;
	}

	T* data() {
		return elements;
	}

	const T* data() const {
		return elements;
	}

	T& operator[](size_t index) {
		assert(index < count);
		return elements[index];
	}

	const T& operator[](size_t index) const {
		assert(index < count);
		return elements[index];
	}

	T* begin() {
		return elements;
	}

	T* end() {
		return elements + count;
	}

	const T* begin() const {
		return elements;
	}

	const T* end() const {
		return elements + count;
	}

private:
	void allocate(size_t n) {
		if (n == 0) {
			return;
		}
		elements = static_cast<T*>(allocator.alloc(n * sizeof(T)));
		if (! elements) {
			throw std::bad_alloc {};
		}
		count = n;
	}

	Jobs::JobSystemAllocator allocator;
	T*                       elements = nullptr;
	size_t                   count = 0;
};

} // namespace Reef
