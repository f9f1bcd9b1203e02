#pragma once

#include <cstddef> // size_t

namespace Reef {

namespace Jobs {

// Job system configuration
// Either change the settings here or define the corresponding macros in your build configuration

// Maximum number of pending jobs per thread
#ifdef RF_JS_MAX_JOBS
constexpr size_t defaultMaxJobs = (RF_JS_MAX_JOBS);
#else
constexpr size_t defaultMaxJobs = 4096;
#endif

constexpr size_t maxThreads = 64;
// Lower bound of the per-thread job pool when many threads share the job id range
constexpr size_t minJobsPerThread = 1024;
// Maximum time in microseconds an idle worker sleeps before checking the queues again
constexpr int sleep_us = 1000;

// Alignment of the Job structure
// The padding bytes are used to hold data for the associated Job function
#ifndef RF_JS_JOB_ALIGNMENT
#define RF_JS_JOB_ALIGNMENT 256
#endif

// Set to 0 to disable profiling of worker threads
#ifndef RF_JS_PROFILE
#define RF_JS_PROFILE 1
#endif

} // namespace Jobs

namespace Sim {

// Vertices per batch of the water mesh update
constexpr size_t defaultWaveBatchSize = 64;
constexpr size_t defaultFishBatchSize = 32;

// Added to every displaced vertex height
constexpr float waveHeightBias = 0.3f;

// Divides the half-extents of the spawn box when picking the target of an out of bounds fish
constexpr float boundaryTargetShrink = 1.3f;

// A fish picks a new random heading when a draw in [0, swimChangeFrequency) is <= this value
constexpr int swimChangeThreshold = 2;

} // namespace Sim

} // namespace Reef

// Logging verbosity: 0 errors only, 1 info, 2 verbose
#ifndef RF_LOG_LEVEL
#define RF_LOG_LEVEL 1
#endif
