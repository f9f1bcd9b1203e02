// This example simulates a school of fish swimming inside a spawn box, updating all the fish in parallel every frame

#include <reef/errors.h>
#include <reef/fish.h>

#include "common.h"

#include <chrono>
#include <memory>

using namespace Reef;
using namespace Reef::Jobs;
using namespace Reef::Sim;

namespace {

constexpr size_t numFrames = 600;
constexpr float  dt = 1.f / 60.f; // seconds

size_t countOutside(const FishSchool& school) {
	const glm::vec3 center = school.getSpawnCenter();
	const glm::vec3 halfBounds = school.getSettings().spawnBounds * 0.5f;
	size_t          count = 0;
	for (size_t i = 0; i < school.size(); ++i) {
		const glm::vec3& p = school.getTransforms().getPosition(i);
		if (p.x > center.x + halfBounds.x || p.x < center.x - halfBounds.x || p.z > center.z + halfBounds.z || p.z < center.z - halfBounds.z) {
			++count;
		}
	}
	return count;
}

void run(JobSystem& jobSystem) {
	FishSettings settings;
	settings.fishCount = 10000;
	settings.center = glm::vec3 { 0.f, -2.f, 0.f };
	settings.spawnBounds = glm::vec3 { 40.f, 5.f, 40.f };
	settings.spawnHeight = 1.f;
	settings.swimChangeFrequency = 400;
	settings.swimSpeed = 4.f;
	settings.turnSpeed = 2.5f;

	FishSchool school { jobSystem, settings };

	const auto startTime = std::chrono::steady_clock::now();
	for (size_t f = 0; f < numFrames; ++f) {
		// A different seed every frame
		school.beginTick(dt, static_cast<float>(f) * dt, static_cast<uint32_t>(f * 7919u + 1u));
		school.endTick();
		if (f % 100 == 0) {
			print("Frame %zd: %zd fish outside the spawn box", f, countOutside(school));
		}
	}
	const auto endTime = std::chrono::steady_clock::now();
	const auto elapsedMicros = std::chrono::duration_cast<std::chrono::microseconds>(endTime - startTime).count();
	print("Elapsed time: %.4f sec", static_cast<double>(elapsedMicros) / 1e6);

	const glm::vec3& p = school.getTransforms().getPosition(0);
	print("Fish 0: %.3f %.3f %.3f", p.x, p.y, p.z);
	school.release();
}

} // namespace

int main(int /*argc*/, char* /*argv*/[]) {
	const std::unique_ptr<JobSystem, decltype(&destroyJobSystem)> jobSystem { createJobSystem(defaultMaxJobs, defaultNumWorkerThreads),
		                                                                   destroyJobSystem };
	print("Worker threads: %zd", getWorkerThreadCount(*jobSystem));

	try {
		run(*jobSystem);
	}
	catch (const Error& error) {
		RF_LOG_ERROR("%s", error.what());
		return 1;
	}

	print("");
	printStats(*jobSystem);
	return 0;
}
