#include <reef/jobSystem.h>
#include <reef/log.h>
#include "utils.h"
#include <algorithm>
#include <atomic>
#include <chrono>
#include <cassert>
#include <condition_variable>
#include <cstdlib>
#include <cstring>
#include <limits>
#include <mutex>
#include <new>
#include <thread>
#include <vector>

namespace Reef {

namespace Jobs {

namespace {

constexpr size_t jobAlignment = RF_JS_JOB_ALIGNMENT;

#ifdef _DEBUG
constexpr size_t jobPadding = jobAlignment - sizeof(JobFunction) - sizeof(std::atomic_int_fast32_t) - sizeof(JobId) - sizeof(bool);
#else
constexpr size_t jobPadding = jobAlignment - sizeof(JobFunction) - sizeof(std::atomic_int_fast32_t) - sizeof(JobId);
#endif

struct alignas(jobAlignment) Job {
	JobFunction              func;
	std::atomic_int_fast32_t unfinished;
	JobId                    parent;
#ifdef _DEBUG
	bool started;
#endif
	char data[jobPadding];
};

constexpr size_t sizeJob = sizeof(Job);
static_assert(sizeJob == jobAlignment);
static_assert(sizeof(detail::ParallelForJobData) <= jobPadding);

using Clock = std::chrono::steady_clock;

// Written by the owner thread, read by any thread through getThreadStats
struct QueueStats {
	std::atomic_size_t  numEnqueuedJobs { 0 };
	std::atomic_size_t  numExecutedJobs { 0 };
	std::atomic_size_t  numStolenJobs { 0 };
	std::atomic_size_t  numAttemptedStealings { 0 };
	std::atomic_int64_t runningMicros { 0 };
};

void increment(std::atomic_size_t& counter) {
	counter.fetch_add(1, std::memory_order_relaxed);
}

struct JobQueue {
	JobId*            jobIds;
	size_t            jobPoolOffset;
	size_t            jobPoolCapacity;
	size_t            jobPoolMask;
	size_t            jobIndex;
	int               top;
	int               bottom;
	std::mutex        mutex;
	std::thread::id   threadId;
	size_t            index;
	QueueStats        stats;
	Clock::time_point startTime;
};

thread_local size_t tl_threadIndex = 0;

} // namespace

struct JobSystem {
	JobSystemAllocator       allocator;
	std::vector<std::thread> workerThreads;
	void*                    jobPoolMemory;
	Job*                     jobPool;
	JobId*                   jobIdPool;
	size_t                   threadCount; // main + worker threads
	size_t                   jobsPerThread;
	size_t                   jobCapacity;
	JobQueue                 queues[maxThreads];
	std::mutex               cv_m;
	std::condition_variable  semaphore;
	std::atomic_size_t       queuedJobs; // jobs pushed but not popped yet, in all queues
	bool                     isRunning;  // guarded by cv_m
};

namespace {

JobQueue& getQueue(JobId jobId, JobSystem& js) {
	assert(jobId);
	return js.queues[(jobId - 1) / js.jobsPerThread];
}

Job& getJob(Job* jobPool, JobId jobId) {
	assert(jobId);
	return jobPool[jobId - 1];
}

JobQueue& getThisThreadQueue(JobSystem& js) {
	assert(tl_threadIndex < js.threadCount);
	return js.queues[tl_threadIndex];
}

// Adds a job to the private end of the queue (LIFO)
void pushJob(JobQueue& queue, JobId jobId, JobSystem& js) {
	assert(queue.threadId == std::this_thread::get_id());
	{
		std::lock_guard lock { queue.mutex };
		assert(queue.bottom - queue.top < static_cast<int>(queue.jobPoolCapacity) && "Job queue is full");
		queue.jobIds[queue.bottom & queue.jobPoolMask] = jobId;
		++queue.bottom;
	}
	increment(queue.stats.numEnqueuedJobs);
	{
		// Increment under the lock so that a worker cannot miss the notification
		std::lock_guard lock { js.cv_m };
		++js.queuedJobs;
	}
	js.semaphore.notify_one(); // wake up one working thread
}

// Pops a job from the private end of the queue (LIFO)
JobId popJob(JobQueue& queue, JobSystem& js) {
	assert(queue.threadId == std::this_thread::get_id());
	std::lock_guard lock { queue.mutex };
	if (queue.bottom <= queue.top) {
		return nullJobId;
	}
	--queue.bottom;
	--js.queuedJobs;
	return queue.jobIds[queue.bottom & queue.jobPoolMask];
}

// Steals a job from the public end of another queue (FIFO)
JobId stealJob(JobQueue& queue, JobSystem& js) {
	std::lock_guard lock { queue.mutex };
	if (queue.bottom <= queue.top) {
		return nullJobId;
	}
	const JobId job = queue.jobIds[queue.top & queue.jobPoolMask];
	++queue.top;
	--js.queuedJobs;
	return job;
}

void finishJob(JobSystem& js, JobId jobId) {
	Job&          job = getJob(js.jobPool, jobId);
	const int32_t unfinishedJobs = --(job.unfinished);
	assert(unfinishedJobs >= 0);
	if (unfinishedJobs == 0 && job.parent) {
		finishJob(js, job.parent);
	}
}

void executeJob(JobId jobId, JobSystem& js, JobQueue& queue) {
	Job& job = getJob(js.jobPool, jobId);
	assert(job.unfinished > 0);
	const JobParams prm { &js, jobId, queue.index, job.data };
#if RF_JS_PROFILE
	const auto startTime = Clock::now();
	job.func(prm);
	const auto runningTime = std::chrono::duration_cast<std::chrono::microseconds>(Clock::now() - startTime);
	queue.stats.runningMicros.fetch_add(runningTime.count(), std::memory_order_relaxed);
#else
	job.func(prm);
#endif
	increment(queue.stats.numExecutedJobs);
	finishJob(js, jobId);
}

JobId getNextJob(JobQueue& queue, JobSystem& js) {
	JobId job = popJob(queue, js);
	if (! job) {
		// Steal from the other queues, starting from the next one
		for (size_t i = 1; i < js.threadCount && ! job; ++i) {
			JobQueue& otherQueue = js.queues[(queue.index + i) % js.threadCount];
			increment(queue.stats.numAttemptedStealings);
			job = stealJob(otherQueue, js);
		}
		if (job) {
			increment(queue.stats.numStolenJobs);
		}
	}
	return job;
}

// Function run by a worker thread
void worker(JobQueue& queue, size_t threadIndex, JobSystem& js) {
	tl_threadIndex = threadIndex;
	queue.threadId = std::this_thread::get_id();
	while (true) {
		if (JobId job = getNextJob(queue, js); job) {
			executeJob(job, js, queue);
			continue;
		}
		std::unique_lock lk { js.cv_m };
		js.semaphore.wait_for(lk, std::chrono::microseconds(sleep_us), [&js] { return ! js.isRunning || js.queuedJobs > 0; });
		if (! js.isRunning) {
			break;
		}
	}
}

void stopThreads(JobSystem& js) {
	std::unique_lock lock { js.cv_m };
	js.isRunning = false;
	js.semaphore.notify_all(); // notify working threads
	lock.unlock();

	for (auto& thread : js.workerThreads) {
		thread.join();
	}
	RF_LOG_VERBOSE("Job system: %zd worker threads stopped", js.workerThreads.size());
}

void nullFunction(const JobParams& /*prm*/) {
}

void* mallocWrap(size_t size) {
	return malloc(size);
}

void freeWrap(void* ptr) {
	free(ptr);
}

} // namespace

const JobSystemAllocator& getDefaultAllocator() {
	static const JobSystemAllocator allocator { mallocWrap, freeWrap };
	return allocator;
}

JobSystem* createJobSystem(size_t numJobsPerThread, size_t numWorkerThreads) {
	return createJobSystem(numJobsPerThread, numWorkerThreads, getDefaultAllocator());
}

JobSystem* createJobSystem(size_t numJobsPerThread, size_t numWorkerThreads, const JobSystemAllocator& allocator) {
	assert(numJobsPerThread > 0);
	assert(allocator.alloc);
	assert(allocator.free);

	if (numWorkerThreads == defaultNumWorkerThreads) {
		numWorkerThreads = std::max(1u, std::thread::hardware_concurrency()) - 1; // main thread excluded
	}

	constexpr size_t maxJobs = std::numeric_limits<JobId>::max() - 1; // jobId 0 is reserved

	numJobsPerThread = detail::nextPowerOfTwo(static_cast<uint32_t>(numJobsPerThread));
	while (numJobsPerThread > maxJobs) {
		numJobsPerThread /= 2; // keep pow of 2
	}
	assert(detail::isPowerOfTwo(static_cast<uint32_t>(numJobsPerThread)));

	const size_t requestedThreadCount = numWorkerThreads + 1; // + 1 for main thread
	size_t       threadCount = std::min(requestedThreadCount, maxThreads);

	// All job ids must fit in a JobId: shrink the per-thread pools first, then drop threads
	const size_t requestedJobsPerThread = numJobsPerThread;
	while (numJobsPerThread > minJobsPerThread && threadCount * numJobsPerThread > maxJobs) {
		numJobsPerThread /= 2;
	}
	threadCount = std::min(threadCount, maxJobs / numJobsPerThread);
	if (numJobsPerThread != requestedJobsPerThread) {
		RF_LOG_INFO("Job system: %zd jobs per thread instead of %zd", numJobsPerThread, requestedJobsPerThread);
	}
	if (threadCount != requestedThreadCount) {
		RF_LOG_INFO("Job system: %zd worker threads instead of %zd", threadCount - 1, requestedThreadCount - 1);
	}

	const size_t jobCapacity = threadCount * numJobsPerThread;
	const size_t jobPoolMemorySize = sizeof(Job) * jobCapacity + (jobAlignment - 1);
	void* const  jobPoolMemory = allocator.alloc(jobPoolMemorySize);
	JobId* const jobIdPool = static_cast<JobId*>(allocator.alloc(jobCapacity * sizeof(JobId)));
	void* const  jobSystemMemory = allocator.alloc(sizeof(JobSystem));
	if (! jobPoolMemory || ! jobIdPool || ! jobSystemMemory) {
		RF_LOG_ERROR("Job system: cannot allocate %zd jobs", jobCapacity);
		allocator.free(jobPoolMemory);
		allocator.free(jobIdPool);
		allocator.free(jobSystemMemory);
		throw std::bad_alloc {};
	}

	Job* const jobPool = static_cast<Job*>(detail::alignPointer(jobPoolMemory, alignof(Job)));
	for (size_t i = 0; i < jobCapacity; ++i) {
		new (&jobPool[i].unfinished) std::atomic_int_fast32_t { 0 };
	}

	auto js = new (jobSystemMemory) JobSystem;
	js->jobPoolMemory = jobPoolMemory;
	js->jobsPerThread = numJobsPerThread;
	js->threadCount = threadCount;
	js->jobPool = jobPool;
	js->jobIdPool = jobIdPool;
	js->jobCapacity = jobCapacity;
	js->allocator = allocator;
	js->queuedJobs = 0;
	js->isRunning = true;

	// Init worker threads and queues
	js->workerThreads.reserve(threadCount - 1);

	tl_threadIndex = 0;
	for (size_t i = 0; i < threadCount; ++i) {
		JobQueue& q = js->queues[i];
		q.jobPoolOffset = i * numJobsPerThread;
		q.jobIds = jobIdPool + i * numJobsPerThread;
		q.jobPoolCapacity = numJobsPerThread;
		q.jobPoolMask = numJobsPerThread - 1;
		q.top = 0;
		q.bottom = 0;
		q.jobIndex = 0;
		q.index = i;
		q.startTime = Clock::now();
		if (i == 0) {
			// Main thread
			q.threadId = std::this_thread::get_id();
		}
	}
	// Start the workers once every queue is initialized, as they steal from each other
	for (size_t i = 1; i < threadCount; ++i) {
		js->workerThreads.emplace_back(worker, std::ref(js->queues[i]), i, std::ref(*js));
	}

	RF_LOG_VERBOSE("Job system: %zd worker threads, %zd jobs per thread", threadCount - 1, numJobsPerThread);
	return js;
}

void destroyJobSystem(JobSystem* jobSystem) {
	if (jobSystem) {
		const JobSystemAllocator allocator = jobSystem->allocator;
		stopThreads(*jobSystem);
		allocator.free(jobSystem->jobPoolMemory);
		allocator.free(jobSystem->jobIdPool);
		jobSystem->~JobSystem();
		allocator.free(jobSystem);
	}
}

size_t getWorkerThreadCount(const JobSystem& jobSystem) {
	return jobSystem.workerThreads.size();
}

size_t getThreadCount(const JobSystem& jobSystem) {
	return jobSystem.threadCount;
}

JobId createJob(JobSystem& jobSystem) {
	return detail::createChildJobImpl(jobSystem, nullJobId, nullFunction, nullptr, 0);
}

void startJob(JobSystem& js, JobId jobId) {
#ifdef _DEBUG
	Job& job = getJob(js.jobPool, jobId);
	assert(job.started == false);
	job.started = true;
#endif

	JobQueue& queue = getQueue(jobId, js);
	pushJob(queue, jobId, js);
}

void waitForJob(JobSystem& js, JobId jobId) {
	assert(jobId);

	JobQueue& queue = getQueue(jobId, js);
	assert(queue.threadId == std::this_thread::get_id()); // only the thread that created a job can wait for it
	while (! isJobFinished(js, jobId)) {
		if (JobId nextJob = getNextJob(queue, js); nextJob) {
			executeJob(nextJob, js, queue);
		}
		else {
			std::this_thread::yield();
		}
	}
}

void startAndWaitForJob(JobSystem& jobSystem, JobId jobId) {
	startJob(jobSystem, jobId);
	waitForJob(jobSystem, jobId);
}

bool isJobFinished(const JobSystem& jobSystem, JobId jobId) {
	const Job& job = getJob(jobSystem.jobPool, jobId);
	return (job.unfinished == 0);
}

ThreadStats getThreadStats(const JobSystem& jobSystem, size_t threadIdx) {
	assert(threadIdx < jobSystem.threadCount);
	const JobQueue& queue = jobSystem.queues[threadIdx];
	ThreadStats     stats {};
	stats.numEnqueuedJobs = queue.stats.numEnqueuedJobs.load(std::memory_order_relaxed);
	stats.numExecutedJobs = queue.stats.numExecutedJobs.load(std::memory_order_relaxed);
	stats.numStolenJobs = queue.stats.numStolenJobs.load(std::memory_order_relaxed);
	stats.numAttemptedStealings = queue.stats.numAttemptedStealings.load(std::memory_order_relaxed);
#if RF_JS_PROFILE
	stats.runningTime = std::chrono::microseconds { queue.stats.runningMicros.load(std::memory_order_relaxed) };
	stats.totalTime = std::chrono::duration_cast<std::chrono::microseconds>(Clock::now() - queue.startTime);
#endif
	return stats;
}

size_t getThisThreadIndex() {
	return tl_threadIndex;
}

namespace detail {

JobId createChildJobImpl(JobSystem& js, JobId parent, JobFunction function, const void* data, size_t dataSize) {
	assert(function);
	assert(dataSize <= sizeof(Job::data));
	assert(data == nullptr || dataSize);

	JobQueue& queue = getThisThreadQueue(js);
	assert(queue.threadId == std::this_thread::get_id()); // jobs are created by the threads of the job system
	const JobId jobId = static_cast<JobId>(1 + queue.jobPoolOffset + queue.jobIndex);
	queue.jobIndex = (queue.jobIndex + 1) & queue.jobPoolMask; // ring buffer
	assert(jobId <= js.jobCapacity);
	Job& job = getJob(js.jobPool, jobId);
	assert(job.unfinished == 0 && "Job pool is full"); // catch full pool
#ifdef _DEBUG
	job.started = false;
#endif
	job.func = function;
	job.parent = parent;
	job.unfinished = 1;
	if (data) {
		std::memcpy(job.data, data, dataSize);
	}
	else {
#ifdef _DEBUG
		std::memset(job.data, 0, sizeof job.data);
#endif
	}
	if (parent) {
		Job& parentJob = getJob(js.jobPool, parent);
		assert(parentJob.unfinished > 0); // it cannot have finished already
		++parentJob.unfinished;
	}
	return jobId;
}

void parallelForImpl(const JobParams& prm) {
	ParallelForJobData data;
	std::memcpy(&data, prm.args, sizeof data); // copy to avoid misalignment
	if (data.count > data.batchSize) {
		// split in two, on a batch boundary
		JobSystem&         js = *prm.jobSystem;
		const uint32_t     leftCount = splitOnBatch(data.count, data.batchSize);
		ParallelForJobData leftData { data.function, data.batchSize, data.offset, leftCount, {} };
		std::memcpy(leftData.functionArgs, data.functionArgs, sizeof leftData.functionArgs);
		const JobId left = createChildJob(js, prm.job, parallelForImpl, leftData);
		startJob(js, left);

		const uint32_t     rightCount = data.count - leftCount;
		ParallelForJobData rightData { data.function, data.batchSize, data.offset + leftCount, rightCount, {} };
		std::memcpy(rightData.functionArgs, data.functionArgs, sizeof rightData.functionArgs);
		const JobId right = createChildJob(js, prm.job, parallelForImpl, rightData);
		startJob(js, right);
	}
	else {
		// execute the function on a single batch
		(data.function)(data.offset, data.count, data.functionArgs, prm.threadIndex);
	}
}

} // namespace detail

} // namespace Jobs

} // namespace Reef
