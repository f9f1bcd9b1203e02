// This example animates a water grid, first on a single thread, then with a parallel for over the job system

#include <reef/errors.h>
#include <reef/waves.h>

#include "common.h"

#include <chrono>
#include <memory>

using namespace Reef;
using namespace Reef::Jobs;
using namespace Reef::Sim;

namespace {

constexpr size_t numFrames = 120;
constexpr float  dt = 1.f / 60.f; // seconds

const WaveSettings waveSettings { 0.15f, 0.8f, 0.6f, defaultWaveBatchSize };

void run_st(const Mesh& sourceMesh) {
	print("Singlethreaded");

	Mesh             mesh = sourceMesh;
	const auto       startTime = std::chrono::steady_clock::now();
	const WaveParams baseParams { waveSettings.scale, waveSettings.offsetSpeed, waveSettings.height, 0.f };
	for (size_t f = 0; f < numFrames; ++f) {
		WaveParams params = baseParams;
		params.time = static_cast<float>(f) * dt;
		// Gate with the normals of the flat grid, as the water surface does
		updateWaveVertices(mesh.vertices.data(), sourceMesh.normals.data(), 0, mesh.vertices.size(), params);
		recalculateNormals(mesh);
	}
	const auto endTime = std::chrono::steady_clock::now();
	const auto elapsedMicros = std::chrono::duration_cast<std::chrono::microseconds>(endTime - startTime).count();
	print("Elapsed time: %.4f sec", static_cast<double>(elapsedMicros) / 1e6);
}

void run_mt(const Mesh& sourceMesh) {
	print("Multithreaded");

	const std::unique_ptr<JobSystem, decltype(&destroyJobSystem)> jobSystem { createJobSystem(defaultMaxJobs, defaultNumWorkerThreads),
		                                                                   destroyJobSystem };
	print("Worker threads: %zd", getWorkerThreadCount(*jobSystem));

	Mesh mesh = sourceMesh;
	{
		WaterSurface water { *jobSystem, mesh, waveSettings };
		const auto   startTime = std::chrono::steady_clock::now();
		for (size_t f = 0; f < numFrames; ++f) {
			water.beginTick(static_cast<float>(f) * dt);
			water.endTick();
		}
		const auto endTime = std::chrono::steady_clock::now();
		const auto elapsedMicros = std::chrono::duration_cast<std::chrono::microseconds>(endTime - startTime).count();
		print("Elapsed time: %.4f sec", static_cast<double>(elapsedMicros) / 1e6);

		const glm::vec3& v = mesh.vertices[mesh.vertices.size() / 2];
		print("Center vertex: %.3f %.3f %.3f", v.x, v.y, v.z);
		print("");
		printStats(*jobSystem);

		water.release();
	}
}

} // namespace

int main(int /*argc*/, char* /*argv*/[]) {
	try {
		const Mesh mesh = createWaterGrid(255, 255, 0.25f);
		print("Water grid: %zd vertices", mesh.vertices.size());

		run_st(mesh);
		run_mt(mesh);
	}
	catch (const Error& error) {
		RF_LOG_ERROR("%s", error.what());
		return 1;
	}
	return 0;
}
