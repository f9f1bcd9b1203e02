#include <reef/errors.h>
#include <reef/log.h>
#include <reef/parallelFor.h>
#include <cassert>
#include <limits>
#include <utility>

namespace Reef {

namespace Jobs {

CompletionHandle::CompletionHandle(ParallelForDriver* driver, uint64_t tick)
    : driver(driver)
    , tick(tick) {
	driver->handle = this;
}

CompletionHandle::CompletionHandle(CompletionHandle&& other) noexcept
    : driver(std::exchange(other.driver, nullptr))
    , tick(std::exchange(other.tick, 0)) {
	if (driver) {
		driver->handle = this;
	}
}

CompletionHandle& CompletionHandle::operator=(CompletionHandle&& other) noexcept {
	if (this != &other) {
		wait();
		driver = std::exchange(other.driver, nullptr);
		tick = std::exchange(other.tick, 0);
		if (driver) {
			driver->handle = this;
		}
	}
	return *this;
}

CompletionHandle::~CompletionHandle() {
	wait();
}

void CompletionHandle::wait() {
	if (driver) {
		driver->complete(tick);
		driver = nullptr;
	}
}

bool CompletionHandle::isComplete() const {
	return ! driver || driver->isComplete(tick);
}

bool CompletionHandle::isPending() const {
	return driver != nullptr;
}

ParallelForDriver::ParallelForDriver(JobSystem& jobSystem)
    : jobSystem(jobSystem) {
}

ParallelForDriver::~ParallelForDriver() {
	waitIdle();
}

CompletionHandle ParallelForDriver::schedule(size_t elementCount, size_t batchSize, Body body) {
	beginTick(elementCount, batchSize);
	if (! body) {
		throw InvalidConfig("parallel for: empty body");
	}
	this->body = std::move(body);
	ParallelForDriver* const self = this;
	return launch(parallelFor(jobSystem, nullJobId, batchSize, runBody, elementCount, self));
}

bool ParallelForDriver::isBusy() const {
	return busy;
}

void ParallelForDriver::ensureIdle() const {
	if (busy) {
		RF_LOG_ERROR("parallel for: tick %llu is still in flight", static_cast<unsigned long long>(tickCount));
		throw ScheduleConflict("parallel for: a tick is already in flight for this population");
	}
}

void ParallelForDriver::waitIdle() {
	complete(tickCount);
}

void ParallelForDriver::beginTick(size_t elementCount, size_t batchSize) {
	ensureIdle();
	if (batchSize == 0) {
		throw InvalidConfig("parallel for: batch size must be positive");
	}
	constexpr size_t maxElements = std::numeric_limits<uint32_t>::max() / 2;
	if (elementCount > maxElements || batchSize > maxElements) {
		throw InvalidConfig("parallel for: too many elements");
	}
}

CompletionHandle ParallelForDriver::launch(JobId job) {
	loopJob = job;
	busy = true;
	++tickCount;
	startJob(jobSystem, loopJob);
	RF_LOG_VERBOSE("parallel for: tick %llu started", static_cast<unsigned long long>(tickCount));
	return CompletionHandle { this, tickCount };
}

void ParallelForDriver::complete(uint64_t tick) {
	if (! busy || tick != tickCount) {
		return;
	}
	waitForJob(jobSystem, loopJob);
	loopJob = nullJobId;
	body = nullptr;
	busy = false;
	// The handle of a completed tick no longer refers to the driver
	if (handle) {
		handle->driver = nullptr;
		handle = nullptr;
	}
}

bool ParallelForDriver::isComplete(uint64_t tick) const {
	if (! busy || tick != tickCount) {
		return true;
	}
	return isJobFinished(jobSystem, loopJob);
}

void ParallelForDriver::runBody(size_t offset, size_t count, const void* args, size_t /*threadIndex*/) {
	auto [driver] = unpackJobArgs<ParallelForDriver*>(args);
	assert(driver->body);
	const Body& body = driver->body;
	for (size_t i = offset; i < offset + count; ++i) {
		body(i);
	}
}

} // namespace Jobs

} // namespace Reef
