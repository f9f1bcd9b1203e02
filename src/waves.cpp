#include <reef/errors.h>
#include <reef/log.h>
#include <reef/waves.h>
#include <glm/gtc/noise.hpp>
#include <algorithm>
#include <cmath>

namespace Reef {

namespace Sim {

namespace {

bool isFinite(const WaveParams& params) {
	return std::isfinite(params.scale) && std::isfinite(params.offsetSpeed) && std::isfinite(params.height) && std::isfinite(params.time);
}

} // namespace

float sampleWaveNoise(float x, float y) {
	return glm::simplex(glm::vec2 { x, y });
}

void updateWaveVertices(glm::vec3* vertices, const glm::vec3* normals, size_t offset, size_t count, const WaveParams& params) {
	const float offset2D = params.offsetSpeed * params.time;
	for (size_t i = offset; i < offset + count; ++i) {
		// Only the vertices facing up move, the base of the water stays in place
		if (normals[i].z > 0.f) {
			glm::vec3&  vertex = vertices[i];
			const float noiseValue = sampleWaveNoise(vertex.x * params.scale + offset2D, vertex.y * params.scale + offset2D);
			vertex.z = noiseValue * params.height + waveHeightBias;
		}
	}
}

WaveUpdater::WaveUpdater(Jobs::JobSystem& jobSystem, size_t batchSize)
    : driver(jobSystem)
    , batchSize(batchSize) {
	if (batchSize == 0) {
		throw InvalidConfig("wave updater: batch size must be positive");
	}
}

Jobs::CompletionHandle WaveUpdater::schedule(VertexBuffer& vertices, const NormalBuffer& normals, const WaveParams& params) {
	driver.ensureIdle(); // tickData is read by the tick in flight
	if (vertices.size() != normals.size()) {
		RF_LOG_ERROR("wave updater: %zd vertices, %zd normals", vertices.size(), normals.size());
		throw ShapeMismatch("wave updater: vertex and normal buffers have different lengths");
	}
	if (! isFinite(params)) {
		throw InvalidConfig("wave updater: wave parameters must be finite");
	}
	tickData = { vertices.data(), normals.data(), params };
	const TickData* const data = &tickData;
	return driver.scheduleBatches(vertices.size(), batchSize, updateBatch, data);
}

void WaveUpdater::update(VertexBuffer& vertices, const NormalBuffer& normals, const WaveParams& params) {
	schedule(vertices, normals, params).wait();
}

void WaveUpdater::updateBatch(size_t offset, size_t count, const void* args, size_t /*threadIndex*/) {
	auto [data] = Jobs::unpackJobArgs<const TickData*>(args);
	updateWaveVertices(data->vertices, data->normals, offset, count, data->params);
}

WaterSurface::WaterSurface(Jobs::JobSystem& jobSystem, Mesh& mesh, const WaveSettings& settings)
    : mesh(mesh)
    , settings(settings)
    , updater(jobSystem, settings.batchSize) {
	if (mesh.vertices.size() != mesh.normals.size()) {
		RF_LOG_ERROR("water surface: %zd vertices, %zd normals", mesh.vertices.size(), mesh.normals.size());
		throw ShapeMismatch("water surface: the mesh has a different number of vertices and normals");
	}
	if (mesh.vertices.empty()) {
		throw InvalidConfig("water surface: the mesh has no vertices");
	}
	if (! isFinite(WaveParams { settings.scale, settings.offsetSpeed, settings.height, 0.f })) {
		throw InvalidConfig("water surface: wave settings must be finite");
	}
	vertices = VertexBuffer { mesh.vertices.data(), mesh.vertices.size() };
	normals = NormalBuffer { mesh.normals.data(), mesh.normals.size() };
	RF_LOG_INFO("Water surface: %zd vertices", vertices.size());
}

WaterSurface::~WaterSurface() {
	handle.wait();
}

void WaterSurface::beginTick(float time) {
	if (handle.isPending()) {
		throw ScheduleConflict("water surface: the previous tick has not ended");
	}
	if (! vertices.isAllocated()) {
		throw ScheduleConflict("water surface: buffers have been released");
	}
	handle = updater.schedule(vertices, normals, WaveParams { settings.scale, settings.offsetSpeed, settings.height, time });
}

void WaterSurface::endTick() {
	handle.wait();
	if (! vertices.isAllocated()) {
		throw ScheduleConflict("water surface: buffers have been released");
	}
	if (mesh.vertices.size() != vertices.size()) {
		throw ShapeMismatch("water surface: the mesh has been resized");
	}
	std::copy(vertices.begin(), vertices.end(), mesh.vertices.begin());
	recalculateNormals(mesh);
}

void WaterSurface::tick(float time) {
	beginTick(time);
	endTick();
}

void WaterSurface::release() {
	if (handle.isPending()) {
		throw ScheduleConflict("water surface: cannot release the buffers while a tick is in flight");
	}
	vertices.release();
	normals.release();
}

} // namespace Sim

} // namespace Reef
