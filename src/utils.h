#pragma once

#include <cstddef>
#include <cstdint>

namespace Reef {

namespace Jobs {

namespace detail {

inline uintptr_t alignPointer(uintptr_t value, size_t alignment) {
	return (value + (alignment - 1)) & (~(alignment - 1));
}

inline void* alignPointer(void* ptr, size_t alignment) {
	return reinterpret_cast<void*>(alignPointer(reinterpret_cast<uintptr_t>(ptr), alignment));
}

inline constexpr bool isPowerOfTwo(uint32_t v) {
	return 0 == (v & (v - 1));
}

inline constexpr uint32_t nextPowerOfTwo(uint32_t v) {
	v--;
	v |= v >> 1;
	v |= v >> 2;
	v |= v >> 4;
	v |= v >> 8;
	v |= v >> 16;
	v++;
	return v;
}

// Number of elements of the left half of a range, rounded to whole batches
inline constexpr uint32_t splitOnBatch(uint32_t count, uint32_t batchSize) {
	const uint32_t numBatches = (count + batchSize - 1) / batchSize;
	return (numBatches / 2u) * batchSize;
}

} // namespace detail

} // namespace Jobs

} // namespace Reef
