/**
 * @file
 *
 * Noise driven animation of a water mesh.
 */

#pragma once

#include "buffer.h"
#include "config.h"
#include "mesh.h"
#include "parallelFor.h"
#include <glm/glm.hpp>

namespace Reef {

namespace Sim {

using VertexBuffer = Buffer<glm::vec3>;
using NormalBuffer = Buffer<glm::vec3>;

/**
 * @brief Wave parameters of a single tick
 */
struct WaveParams {
	float scale;
	float offsetSpeed;
	float height;
	float time;
};

/**
 * @brief Run configuration of a water surface
 */
struct WaveSettings {
	float  scale = 0.1f;
	float  offsetSpeed = 1.f;
	float  height = 0.5f;
	size_t batchSize = defaultWaveBatchSize;
};

/**
 * @brief 2D simplex noise, in [-1, 1]
 */
float sampleWaveNoise(float x, float y);

/**
 * @brief Displace the height of the vertices in [offset, offset + count) whose normal faces up
 *
 * z = noise(x * scale + offsetSpeed * time, y * scale + offsetSpeed * time) * height + waveHeightBias <br>
 * The other vertices are left untouched.
 */
void updateWaveVertices(glm::vec3* vertices, const glm::vec3* normals, size_t offset, size_t count, const WaveParams& params);

/**
 * @brief Updates a vertex buffer in parallel, one tick at a time
 */
class WaveUpdater {
public:
	explicit WaveUpdater(Jobs::JobSystem& jobSystem, size_t batchSize = defaultWaveBatchSize);

	/**
	 * @brief Schedule the update of the vertices. The buffers must not be accessed until the handle has been waited for
	 * @throw ShapeMismatch if vertices and normals have different lengths
	 * @throw ScheduleConflict if the previous tick has not been waited for
	 * @throw InvalidConfig if a parameter is not finite
	 */
	Jobs::CompletionHandle schedule(VertexBuffer& vertices, const NormalBuffer& normals, const WaveParams& params);

	/**
	 * @brief Schedule the update of the vertices and wait for it
	 */
	void update(VertexBuffer& vertices, const NormalBuffer& normals, const WaveParams& params);

	bool isBusy() const {
		return driver.isBusy();
	}

private:
	struct TickData {
		glm::vec3*       vertices;
		const glm::vec3* normals;
		WaveParams       params;
	};

	static void updateBatch(size_t offset, size_t count, const void* args, size_t threadIndex);

	Jobs::ParallelForDriver driver;
	TickData                tickData {};
	size_t                  batchSize;
};

/**
 * @brief Animated water mesh

Owns a copy of the vertices and normals of the mesh taken at construction. <br>
Each tick updates the vertex copy in parallel, then writes it back to the mesh and recalculates the mesh normals. <br>
Only the normals copied at construction select which vertices move. <br>
*/
class WaterSurface {
public:
	/**
	 * @throw ShapeMismatch if the mesh has a different number of vertices and normals
	 * @throw InvalidConfig if the settings are not valid
	 */
	WaterSurface(Jobs::JobSystem& jobSystem, Mesh& mesh, const WaveSettings& settings);
	~WaterSurface();

	WaterSurface(const WaterSurface&) = delete;
	WaterSurface& operator=(const WaterSurface&) = delete;

	// Schedule the wave update for the given time
	void beginTick(float time);
	// Wait for the update, write the vertices back to the mesh and recalculate its normals
	void endTick();
	void tick(float time);

	/**
	 * @brief Release the buffers. Can be called more than once
	 * @throw ScheduleConflict if a tick is in flight
	 */
	void release();

	bool isTickInFlight() const {
		return handle.isPending();
	}

	const VertexBuffer& getVertices() const {
		return vertices;
	}

	const NormalBuffer& getNormals() const {
		return normals;
	}

	const WaveSettings& getSettings() const {
		return settings;
	}

private:
	Mesh&                  mesh;
	WaveSettings           settings;
	VertexBuffer           vertices;
	NormalBuffer           normals;
	WaveUpdater            updater;
	Jobs::CompletionHandle handle;
};

} // namespace Sim

} // namespace Reef
