#pragma once

#include <stdexcept>

namespace Reef {

/**
 * @brief Base class of the errors raised by the library. All of them are fatal to the run
 */
class Error : public std::runtime_error {
public:
	using std::runtime_error::runtime_error;
};

/**
 * @brief Two buffers that must be paired element by element have different lengths
 */
class ShapeMismatch : public Error {
public:
	using Error::Error;
};

/**
 * @brief A tick was scheduled, or its buffers released, while a previous tick was still in flight
 */
class ScheduleConflict : public Error {
public:
	using Error::Error;
};

/**
 * @brief Invalid run configuration: population size, bounds, batch size or tuning parameters
 */
class InvalidConfig : public Error {
public:
	using Error::Error;
};

} // namespace Reef
