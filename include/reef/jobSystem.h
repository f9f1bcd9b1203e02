/**
 * @file
 *
 * Job system public interface.
 */

#pragma once

#include "config.h"
#include <cstdint>
#include <functional>
#include <tuple>
#if RF_JS_PROFILE
#include <chrono>
#endif

namespace Reef {

namespace Jobs {

using JobId = uint16_t;
constexpr JobId nullJobId = 0;

struct JobSystem;

/**
 * @brief Job parameters

jobSystem and job can be used to add child jobs on the fly <br>
threadIndex can be used to fetch from or store data into per-thread buffers  <br>
*/
struct JobParams {
	JobSystem*  jobSystem;
	JobId       job;
	size_t      threadIndex;
	const void* args;
};

/**
 * @brief Job function
 */
using JobFunction = void (*)(const JobParams&);

/**
 * @brief Parallel for function, called once per batch.
 */
using ParallelForFunction = void (*)(size_t offset, size_t count, const void* functionArgs, size_t threadIndex);

/**
 * @brief Custom allocator
 */
struct JobSystemAllocator {
	std::function<void*(size_t)> alloc;
	std::function<void(void*)>   free;
};

// Pass this to createJobSystem to let the library initialize the number of worker threads
constexpr size_t defaultNumWorkerThreads = (size_t)-1;

/**
 * @return the default allocator (malloc and free)
 */
const JobSystemAllocator& getDefaultAllocator();

/**
 * @brief Create a job system with a custom allocator
 * @param numJobsPerThread maximum number of jobs that a thread can have in flight
 * @param numWorkerThreads number of worker threads. Pass defaultNumWorkerThreads as default
 * @param allocator
 * @return the new job system. The calling thread becomes its main thread
 */
JobSystem* createJobSystem(size_t numJobsPerThread, size_t numWorkerThreads, const JobSystemAllocator& allocator);

/**
 * @brief Create a job system with the default allocator
 * @param numJobsPerThread maximum number of jobs that a thread can have in flight
 * @param numWorkerThreads number of worker threads. Pass defaultNumWorkerThreads as default
 * @return the new job system. The calling thread becomes its main thread
 */
JobSystem* createJobSystem(size_t numJobsPerThread, size_t numWorkerThreads);

/**
 * @brief Stop the worker threads and destroy the job system
 */
void destroyJobSystem(JobSystem* jobSystem);

/**
 * @brief Return the number of worker threads
 * @return number of worker threads
 */
size_t getWorkerThreadCount(const JobSystem& jobSystem);

/**
 * @return main thread + worker threads
 */
size_t getThreadCount(const JobSystem& jobSystem);

/**
 * @brief Create an empty job
 * @return job identifier
 */
JobId createJob(JobSystem& jobSystem);

/**
 * @brief Create a child job executing a function with arguments
 * @tparam ...ArgType
 * @param parentJobId parent job identifier
 * @param function function associated with the job
 * @param ...args
 * @return new job identifier
 */
template <typename... ArgType>
JobId createChildJob(JobSystem& jobSystem, JobId parentJobId, JobFunction function, ArgType... args);

/**
 * @brief Start a job
 * @param jobId job identifier
 */
void startJob(JobSystem& jobSystem, JobId jobId);

/**
 * @brief Wait for a job to complete. The waiting thread executes pending jobs in the meantime
 * @param jobId job identifier
 */
void waitForJob(JobSystem& jobSystem, JobId jobId);

/**
 * @brief Helper: start a job and wait for its completion
 * @param jobId job identifier
 */
void startAndWaitForJob(JobSystem& jobSystem, JobId jobId);

/**
 * @param jobId job identifier
 * @return true if the job and all its children have been executed
 */
bool isJobFinished(const JobSystem& jobSystem, JobId jobId);

/**
 * @brief Create a job executing a parallel for loop
 * @param parentJobId parent job identifier
 * @param batchSize number of consecutive elements processed by a single call of function
 * @param function function associated with the job
 * @param elementCount element count
 * @param ...args  function arguments
 * @return the job identifier. The job must be started with startJob
 */
template <typename... ArgType>
JobId parallelFor(JobSystem& jobSystem, JobId parentJobId, size_t batchSize, ParallelForFunction function, size_t elementCount,
                  const ArgType&... args);

/**
 * @brief Utility to unpack arguments
 * @param args pointer to a buffer containing arguments
 * @return a tuple with the unpacked arguments
 */
template <typename... ArgType>
std::tuple<ArgType...> unpackJobArgs(const void* args);

struct ThreadStats {
	size_t numEnqueuedJobs;
	size_t numExecutedJobs;
	size_t numStolenJobs;
	size_t numAttemptedStealings;
#if RF_JS_PROFILE
	std::chrono::microseconds totalTime;
	std::chrono::microseconds runningTime;
#endif
};

/**
 * @param thread index
 * @return statistics about a thread. Index 0 is the main thread
 */
ThreadStats getThreadStats(const JobSystem& jobSystem, size_t threadIdx);

/**
 * @return the index of the currently active thread
 */
size_t getThisThreadIndex();

} // namespace Jobs

} // namespace Reef

#include "jobSystem.inl"
