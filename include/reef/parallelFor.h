/**
 * @file
 *
 * Parallel for driver: one tick of batched, index-independent work over a population.
 */

#pragma once

#include "jobSystem.h"
#include <cstdint>
#include <functional>

namespace Reef {

namespace Jobs {

class ParallelForDriver;

/**
 * @brief Completion handle of a scheduled tick

wait() blocks until every batch of the tick has been executed. Writes made by the batches are visible to the caller once wait() returns. <br>
A handle destroyed without calling wait() waits in its destructor. <br>
The handle is released when its tick completes, whether through wait(), ParallelForDriver::waitIdle() or the destruction of the driver. A released handle is no longer pending and may outlive its driver. <br>
*/
class CompletionHandle {
public:
	CompletionHandle() = default;
	CompletionHandle(const CompletionHandle&) = delete;
	CompletionHandle& operator=(const CompletionHandle&) = delete;
	CompletionHandle(CompletionHandle&& other) noexcept;
	CompletionHandle& operator=(CompletionHandle&& other) noexcept;
	~CompletionHandle();

	/**
	 * @brief Block until the tick has completed. Calling it again has no effect
	 */
	void wait();

	/**
	 * @return true if the tick has completed. Does not block
	 */
	bool isComplete() const;

	/**
	 * @return true if the handle refers to a tick that has not been waited for
	 */
	bool isPending() const;

private:
	friend class ParallelForDriver;
	CompletionHandle(ParallelForDriver* driver, uint64_t tick);

	ParallelForDriver* driver = nullptr;
	uint64_t           tick = 0;
};

/**
 * @brief Schedules the ticks of a single population on a job system

At most one tick is in flight at a time. Scheduling a tick while the previous one has not been waited for raises ScheduleConflict. <br>
schedule and wait must be called by the thread that created the job system. <br>
*/
class ParallelForDriver {
public:
	using Body = std::function<void(size_t index)>;

	explicit ParallelForDriver(JobSystem& jobSystem);
	ParallelForDriver(const ParallelForDriver&) = delete;
	ParallelForDriver& operator=(const ParallelForDriver&) = delete;
	~ParallelForDriver();

	/**
	 * @brief Schedule body for each index in [0, elementCount), in batches of batchSize consecutive indices
	 * @return handle to wait for the completion of the tick
	 */
	CompletionHandle schedule(size_t elementCount, size_t batchSize, Body body);

	/**
	 * @brief Schedule function once per batch of batchSize consecutive elements
	 * @param ...args trivially copyable arguments forwarded to function
	 * @return handle to wait for the completion of the tick
	 */
	template <typename... ArgType>
	CompletionHandle scheduleBatches(size_t elementCount, size_t batchSize, ParallelForFunction function, const ArgType&... args);

	/**
	 * @return true if a tick has been scheduled and not waited for yet
	 */
	bool isBusy() const;

	/**
	 * @brief Raise ScheduleConflict if a tick is in flight
	 */
	void ensureIdle() const;

	/**
	 * @brief Wait for the tick in flight, if any
	 */
	void waitIdle();

	JobSystem& getJobSystem() const {
		return jobSystem;
	}

private:
	friend class CompletionHandle;

	void             beginTick(size_t elementCount, size_t batchSize);
	CompletionHandle launch(JobId loopJob);
	void             complete(uint64_t tick);
	bool             isComplete(uint64_t tick) const;
	static void      runBody(size_t offset, size_t count, const void* args, size_t threadIndex);

	JobSystem&        jobSystem;
	Body              body;
	CompletionHandle* handle = nullptr; // handle of the tick in flight
	JobId             loopJob = nullJobId;
	uint64_t          tickCount = 0;
	bool              busy = false;
};

template <typename... ArgType>
CompletionHandle ParallelForDriver::scheduleBatches(size_t elementCount, size_t batchSize, ParallelForFunction function, const ArgType&... args) {
	beginTick(elementCount, batchSize);
	return launch(parallelFor(jobSystem, nullJobId, batchSize, function, elementCount, args...));
}

} // namespace Jobs

} // namespace Reef
