#include "../examples/common.h"
#include "testCommon.h"
#include <reef/buffer.h>
#include <reef/errors.h>
#include <reef/parallelFor.h>
#include <atomic>
#include <chrono>
#include <cstdlib>
#include <limits>
#include <memory>
#include <thread>
#include <vector>

#define CATCH_CONFIG_RUNNER
#include <catch2/catch.hpp>

using namespace Reef;
using namespace Reef::Jobs;

namespace {

constexpr size_t numRigidBodies = 64;

std::atomic<size_t> completeCount;

struct Particle {
	float x, y;
	float vx, vy;
};

struct Batch {
	size_t offset;
	size_t count;
	size_t numCalls;
};

void updateParticles(size_t offset, size_t count, const void* args, [[maybe_unused]] size_t threadIndex) {
	auto [particles, dt] = unpackJobArgs<Particle*, float>(args);
	particles += offset;
	for (size_t i = 0; i < count; ++i) {
		particles[i].x += particles[i].vx * dt;
		particles[i].y += particles[i].vy * dt;
	}
}

void resetParticles(Particle* particles, size_t particleCount, float dvx, float dvy) {
	float vx = 0.f;
	float vy = 0.f;
	for (size_t i = 0; i < particleCount; ++i) {
		particles[i] = { 0.f, 0.f, vx, vy };
		vx += dvx;
		vy += dvy;
	}
}

void checkParticles(const Particle* particles, size_t particleCount, float dt) {
	for (size_t i = 0; i < particleCount; ++i) {
		CHECK(particles[i].x == particles[i].vx * dt);
		CHECK(particles[i].y == particles[i].vy * dt);
	}
}

// Each batch writes its own slot, indexed by the first element of the batch
void recordBatch(size_t offset, size_t count, const void* args, [[maybe_unused]] size_t threadIndex) {
	auto [batches, batchSize] = unpackJobArgs<Batch*, size_t>(args);
	Batch& batch = batches[offset / batchSize];
	batch.offset = offset;
	batch.count = count;
	++batch.numCalls;
}

void updateRigidBody(const JobParams& prm) {
	const int bodyIndex = unpackJobArg<int>(prm.args);
	(void)bodyIndex;
	std::this_thread::sleep_for(std::chrono::microseconds(20));
	std::atomic_fetch_add<size_t>(&completeCount, 1);
}

void jobPhysics(const JobParams& prm) {
	const int numPhysicsJobs = unpackJobArg<int>(prm.args);
	for (int i = 0; i < numPhysicsJobs; ++i) {
		const JobId childJob = createChildJob(*prm.jobSystem, prm.job, updateRigidBody, i);
		startJob(*prm.jobSystem, childJob);
	}
}

} // namespace

TEST_CASE("Jobs") {
	size_t numWorkerThreads = 0;
	SECTION("Single Threaded") {
		numWorkerThreads = 0;
	}
	SECTION("Multi Threaded") {
		numWorkerThreads = multiThreadedWorkerCount();
	}

	// Custom allocator tracking memory
	std::atomic<size_t> numAllocs { 0 };
	std::atomic<size_t> numFrees { 0 };
	auto                customAlloc = [&numAllocs](size_t size) {
        ++numAllocs;
        return malloc(size);
	};
	auto customFree = [&numFrees](void* ptr) {
		++numFrees;
		free(ptr);
	};
	const JobSystemAllocator allocator { customAlloc, customFree };

	JobSystem* jobSystem = createJobSystem(defaultMaxJobs, numWorkerThreads, allocator);
	REQUIRE(getWorkerThreadCount(*jobSystem) == numWorkerThreads);
	REQUIRE(getThreadCount(*jobSystem) == numWorkerThreads + 1);
	CHECK(numAllocs.load() > 0);

	std::atomic_store<size_t>(&completeCount, 0);

	const JobId rootJob = createJob(*jobSystem);
	const JobId physicsJob = createChildJob(*jobSystem, rootJob, jobPhysics, static_cast<int>(numRigidBodies));
	startJob(*jobSystem, physicsJob);
	startAndWaitForJob(*jobSystem, rootJob);

	CHECK(isJobFinished(*jobSystem, rootJob));
	CHECK(isJobFinished(*jobSystem, physicsJob));
	CHECK(std::atomic_load(&completeCount) == numRigidBodies);

	size_t numExecutedJobs = 0;
	for (size_t i = 0; i < getThreadCount(*jobSystem); ++i) {
		numExecutedJobs += getThreadStats(*jobSystem, i).numExecutedJobs;
	}
	// root, physics and one job per rigid body
	CHECK(numExecutedJobs == numRigidBodies + 2);
	CHECK(getThisThreadIndex() == 0);

	destroyJobSystem(jobSystem);
	CHECK(numAllocs.load() == numFrees.load());
}

TEST_CASE("Parallel") {
	size_t numWorkerThreads = 0;
	SECTION("Single Threaded") {
		numWorkerThreads = 0;
	}
	SECTION("Multi Threaded") {
		numWorkerThreads = multiThreadedWorkerCount();
	}
	const auto jobSystem = makeJobSystem(numWorkerThreads);

	constexpr float  dt = 1.0f;
	constexpr size_t batchSize = 64;

	alignas(16) static Particle particles[8192];
	resetParticles(particles, std::size(particles), 0.05f, 0.025f);

	const auto  startTime = std::chrono::steady_clock::now();
	const JobId loopJob = parallelFor(*jobSystem, nullJobId, batchSize, updateParticles, std::size(particles), particles, dt);
	startAndWaitForJob(*jobSystem, loopJob);
	const auto endTime = std::chrono::steady_clock::now();
	const auto elapsedMicros = std::chrono::duration_cast<std::chrono::microseconds>(endTime - startTime).count();
	print("Parallel for. Worker threads: %zd. Elapsed time: %.4f sec", numWorkerThreads, static_cast<double>(elapsedMicros) / 1e6);

	checkParticles(particles, std::size(particles), dt);

	printStats(*jobSystem);
}

TEST_CASE("Batches") {
	size_t numWorkerThreads = 0;
	SECTION("Single Threaded") {
		numWorkerThreads = 0;
	}
	SECTION("Multi Threaded") {
		numWorkerThreads = multiThreadedWorkerCount();
	}
	const auto jobSystem = makeJobSystem(numWorkerThreads);

	ParallelForDriver driver { *jobSystem };

	for (size_t batchSize : { size_t { 1 }, size_t { 7 }, size_t { 32 }, size_t { 1000 } }) {
		for (size_t elementCount : { size_t { 0 }, size_t { 1 }, size_t { 31 }, size_t { 32 }, size_t { 999 }, size_t { 1500 } }) {
			const size_t       numBatches = (elementCount + batchSize - 1) / batchSize;
			std::vector<Batch> batches(numBatches, Batch { 0, 0, 0 });
			Batch* const       batchData = batches.data();

			driver.scheduleBatches(elementCount, batchSize, recordBatch, batchData, batchSize).wait();

			INFO("elements: " << elementCount << " batch size: " << batchSize);
			for (size_t b = 0; b < numBatches; ++b) {
				CHECK(batches[b].numCalls == 1);
				CHECK(batches[b].offset == b * batchSize);
				const size_t expectedCount = (b + 1 < numBatches) ? batchSize : elementCount - b * batchSize;
				CHECK(batches[b].count == expectedCount);
			}
		}
	}
}

TEST_CASE("Parallel for driver") {
	// Sections below run once per worker count
	const size_t numWorkerThreads = GENERATE(size_t { 0 }, multiThreadedWorkerCount());
	const auto jobSystem = makeJobSystem(numWorkerThreads);

	ParallelForDriver driver { *jobSystem };
	CHECK_FALSE(driver.isBusy());
	CHECK(&driver.getJobSystem() == jobSystem.get());

	constexpr size_t         elementCount = 10000;
	std::vector<int>         values(elementCount, 0);
	std::vector<std::size_t> threadOfElement(elementCount, 0);

	SECTION("Every index is visited once") {
		int* const    data = values.data();
		size_t* const threads = threadOfElement.data();
		auto          handle = driver.schedule(elementCount, 16, [data, threads](size_t i) {
            data[i] += static_cast<int>(i) + 1;
            threads[i] = getThisThreadIndex();
		});
		CHECK(driver.isBusy());
		CHECK(handle.isPending());
		handle.wait();
		CHECK(handle.isComplete());
		CHECK_FALSE(handle.isPending());
		CHECK_FALSE(driver.isBusy());

		for (size_t i = 0; i < elementCount; ++i) {
			REQUIRE(values[i] == static_cast<int>(i) + 1);
			REQUIRE(threadOfElement[i] <= numWorkerThreads);
		}

		// Waiting again has no effect
		handle.wait();
		CHECK_FALSE(driver.isBusy());
	}

	SECTION("The handle waits on destruction") {
		int* const data = values.data();
		{
			const auto handle = driver.schedule(elementCount, 64, [data](size_t i) { data[i] = 1; });
			(void)handle;
		}
		CHECK_FALSE(driver.isBusy());
		for (size_t i = 0; i < elementCount; ++i) {
			REQUIRE(values[i] == 1);
		}
	}

	SECTION("Consecutive ticks") {
		int* const data = values.data();
		for (int tick = 0; tick < 10; ++tick) {
			driver.schedule(elementCount, 100, [data](size_t i) { data[i] += 1; }).wait();
		}
		for (size_t i = 0; i < elementCount; ++i) {
			REQUIRE(values[i] == 10);
		}
	}

	SECTION("Empty population") {
		size_t numCalls = 0;
		driver.schedule(0, 16, [&numCalls](size_t) { ++numCalls; }).wait();
		CHECK(numCalls == 0);
		CHECK_FALSE(driver.isBusy());
	}

	SECTION("A second tick in flight is rejected") {
		int* const data = values.data();
		auto       handle = driver.schedule(elementCount, 64, [data](size_t i) { data[i] = 1; });
		REQUIRE_THROWS_AS(driver.schedule(elementCount, 64, [data](size_t i) { data[i] = 2; }), ScheduleConflict);
		REQUIRE_THROWS_AS(driver.ensureIdle(), ScheduleConflict);
		handle.wait();

		// The first tick ran untouched
		for (size_t i = 0; i < elementCount; ++i) {
			REQUIRE(values[i] == 1);
		}
		CHECK_NOTHROW(driver.ensureIdle());
		driver.schedule(elementCount, 64, [data](size_t i) { data[i] = 2; }).wait();
		CHECK(values[elementCount - 1] == 2);
	}

	SECTION("Invalid schedules") {
		REQUIRE_THROWS_AS(driver.schedule(elementCount, 0, [](size_t) {}), InvalidConfig);
		REQUIRE_THROWS_AS(driver.schedule(elementCount, 16, ParallelForDriver::Body {}), InvalidConfig);
		CHECK_FALSE(driver.isBusy());
	}

	SECTION("A moved handle keeps the tick") {
		int* const       data = values.data();
		CompletionHandle handle;
		CHECK_FALSE(handle.isPending());
		CHECK(handle.isComplete());
		handle = driver.schedule(elementCount, 64, [data](size_t i) { data[i] = 3; });
		CompletionHandle other { std::move(handle) };
		CHECK_FALSE(handle.isPending());
		CHECK(other.isPending());
		other.wait();
		CHECK(values[0] == 3);
		CHECK_FALSE(driver.isBusy());
	}

	SECTION("Waiting for the driver releases the handle") {
		int* const data = values.data();
		auto       handle = driver.schedule(elementCount, 64, [data](size_t i) { data[i] = 4; });
		driver.waitIdle();
		CHECK_FALSE(handle.isPending());
		CHECK(handle.isComplete());
		CHECK(values[elementCount - 1] == 4);

		// The released handle does not interfere with the next tick
		auto next = driver.schedule(elementCount, 64, [data](size_t i) { data[i] = 5; });
		CHECK(next.isPending());
		CHECK_FALSE(handle.isPending());
		handle.wait();
		CHECK(next.isPending());
		next.wait();
		CHECK(values[0] == 5);
	}
}

TEST_CASE("A handle outlives its driver") {
	const auto jobSystem = makeJobSystem(multiThreadedWorkerCount());

	constexpr size_t elementCount = 10000;
	std::vector<int> values(elementCount, 0);
	int* const       data = values.data();

	auto             driver = std::make_unique<ParallelForDriver>(*jobSystem);
	CompletionHandle handle = driver->schedule(elementCount, 32, [data](size_t i) { data[i] = 1; });
	CHECK(handle.isPending());

	// The driver waits for its tick and releases the handle
	driver.reset();
	CHECK_FALSE(handle.isPending());
	CHECK(handle.isComplete());
	handle.wait();
	for (size_t i = 0; i < elementCount; ++i) {
		REQUIRE(values[i] == 1);
	}

	// Moving a released handle is safe too
	CompletionHandle other { std::move(handle) };
	CHECK_FALSE(other.isPending());
}

TEST_CASE("Thread stats") {
	const auto   jobSystem = makeJobSystem(multiThreadedWorkerCount());
	const size_t threadCount = getThreadCount(*jobSystem);

	ParallelForDriver        driver { *jobSystem };
	std::vector<ThreadStats> previous(threadCount, ThreadStats {});
	std::atomic<size_t>      numCalls { 0 };

	for (int tick = 0; tick < 20; ++tick) {
		auto handle = driver.schedule(5000, 8, [&numCalls](size_t) { ++numCalls; });
		// Read the counters while the workers update them
		while (! handle.isComplete()) {
			for (size_t t = 0; t < threadCount; ++t) {
				const ThreadStats stats = getThreadStats(*jobSystem, t);
				REQUIRE(stats.numExecutedJobs >= previous[t].numExecutedJobs);
				REQUIRE(stats.numEnqueuedJobs >= previous[t].numEnqueuedJobs);
				REQUIRE(stats.numAttemptedStealings >= previous[t].numAttemptedStealings);
				REQUIRE(stats.numStolenJobs >= previous[t].numStolenJobs);
				previous[t] = stats;
			}
		}
		handle.wait();
	}
	CHECK(numCalls.load() == 20 * 5000);

	size_t numEnqueuedJobs = 0;
	size_t numExecutedJobs = 0;
	for (size_t t = 0; t < threadCount; ++t) {
		const ThreadStats stats = getThreadStats(*jobSystem, t);
		CHECK(stats.numStolenJobs <= stats.numAttemptedStealings);
		numEnqueuedJobs += stats.numEnqueuedJobs;
		numExecutedJobs += stats.numExecutedJobs;
	}
	CHECK(numExecutedJobs > 0);
	CHECK(numEnqueuedJobs == numExecutedJobs);
}

TEST_CASE("Many worker threads") {
	// More threads than full per-thread pools allow: the pools shrink instead
	constexpr size_t numWorkerThreads = 31;
	const auto       jobSystem = makeJobSystem(numWorkerThreads);
	REQUIRE(getWorkerThreadCount(*jobSystem) == numWorkerThreads);
	REQUIRE(getThreadCount(*jobSystem) == numWorkerThreads + 1);

	constexpr size_t  elementCount = 10000;
	std::vector<int>  values(elementCount, 0);
	int* const        data = values.data();
	ParallelForDriver driver { *jobSystem };
	for (int tick = 0; tick < 5; ++tick) {
		driver.schedule(elementCount, 16, [data](size_t i) { data[i] += 1; }).wait();
	}
	for (size_t i = 0; i < elementCount; ++i) {
		REQUIRE(values[i] == 5);
	}
}

TEST_CASE("Thread count limit") {
	const auto jobSystem = makeJobSystem(2 * maxThreads);
	CHECK(getThreadCount(*jobSystem) <= maxThreads);
	CHECK(getThreadCount(*jobSystem) * minJobsPerThread <= std::numeric_limits<JobId>::max() - 1);
	CHECK(getWorkerThreadCount(*jobSystem) == getThreadCount(*jobSystem) - 1);

	std::atomic<size_t> numCalls { 0 };
	ParallelForDriver   driver { *jobSystem };
	driver.schedule(1000, 4, [&numCalls](size_t) { ++numCalls; }).wait();
	CHECK(numCalls.load() == 1000);
}

TEST_CASE("Buffer") {
	size_t numAllocs = 0;
	size_t numFrees = 0;
	auto   customAlloc = [&numAllocs](size_t size) {
        ++numAllocs;
        return malloc(size);
	};
	auto customFree = [&numFrees](void* ptr) {
		++numFrees;
		free(ptr);
	};
	const JobSystemAllocator allocator { customAlloc, customFree };

	SECTION("Release is idempotent") {
		Buffer<float> buffer { 16, allocator };
		REQUIRE(buffer.isAllocated());
		REQUIRE(buffer.size() == 16);
		for (float value : buffer) {
			CHECK(value == 0.f);
		}
		buffer.release();
		buffer.release();
		CHECK_FALSE(buffer.isAllocated());
		CHECK(buffer.size() == 0);
		CHECK(numAllocs == 1);
		CHECK(numFrees == 1);
	}

	SECTION("Destructor releases") {
		{
			const float   values[] = { 1.f, 2.f, 3.f };
			Buffer<float> buffer { values, std::size(values), allocator };
			CHECK(buffer[2] == 3.f);
		}
		CHECK(numAllocs == 1);
		CHECK(numFrees == 1);
	}

	SECTION("Move transfers ownership") {
		Buffer<int> buffer { 4, allocator };
		buffer[1] = 7;
		Buffer<int> other { std::move(buffer) };
		CHECK_FALSE(buffer.isAllocated());
		CHECK(other[1] == 7);
		other.release();
		buffer.release();
		CHECK(numFrees == 1);
	}

	SECTION("Empty buffer") {
		Buffer<int> buffer { 0, allocator };
		CHECK_FALSE(buffer.isAllocated());
		CHECK(numAllocs == 0);
	}
}

int main(int argc, char* argv[]) {
	const int result = Catch::Session().run(argc, argv);
	return result;
}
