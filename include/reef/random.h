#pragma once

#include <cstddef>
#include <cstdint>
#include <cstring>

namespace Reef {

namespace Sim {

inline uint64_t mix64(uint64_t x) {
	x ^= x >> 30;
	x *= 0xbf58476d1ce4e5b9ULL;
	x ^= x >> 27;
	x *= 0x94d049bb133111ebULL;
	x ^= x >> 31;
	return x;
}

/**
 * @brief Small counter based random generator (SplitMix64)

Cheap to construct, so that every entity can build its own generator every tick from a derived seed. <br>
The sequence only depends on the seed, on every platform. <br>
*/
class Random {
public:
	explicit Random(uint64_t seed)
	    : state(seed) {
	}

	uint64_t nextU64() {
		state += 0x9e3779b97f4a7c15ULL;
		return mix64(state);
	}

	// Uniform float in [0, 1)
	float nextFloat() {
		return static_cast<float>(nextU64() >> 40) * (1.f / 16777216.f);
	}

	// Uniform float in [minValue, maxValue)
	float nextFloat(float minValue, float maxValue) {
		return minValue + (maxValue - minValue) * nextFloat();
	}

	// Uniform integer in [minValue, maxValue). Returns minValue if the range is empty
	int nextInt(int minValue, int maxValue) {
		if (maxValue <= minValue) {
			return minValue;
		}
		const uint64_t range = static_cast<uint64_t>(static_cast<int64_t>(maxValue) - minValue);
		return static_cast<int>(minValue + static_cast<int64_t>(((nextU64() >> 32) * range) >> 32));
	}

private:
	uint64_t state;
};

/**
 * @brief Seed of an entity for a given tick
 * @param index entity index
 * @param time simulation time of the tick
 * @param seedBase per tick seed supplied by the caller
 */
inline uint64_t deriveSeed(size_t index, float time, uint32_t seedBase) {
	uint32_t timeBits;
	std::memcpy(&timeBits, &time, sizeof timeBits);
	const uint64_t tickSeed = mix64((static_cast<uint64_t>(seedBase) << 32) | timeBits);
	return mix64(tickSeed ^ (static_cast<uint64_t>(index) * 0x9e3779b97f4a7c15ULL));
}

} // namespace Sim

} // namespace Reef
