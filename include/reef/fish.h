/**
 * @file
 *
 * Fish school: forward swimming, random heading changes and reflection at the border of the spawn box.
 *
 * The fish live in a y up, left handed world: the forward axis of a fish is its local +z.
 */

#pragma once

#include "buffer.h"
#include "config.h"
#include "parallelFor.h"
#include <glm/glm.hpp>
#include <glm/gtc/quaternion.hpp>
#include <cstdint>

namespace Reef {

namespace Sim {

/**
 * @brief Read/write access to the transform of a single fish
 */
struct TransformAccess {
	glm::vec3& position;
	glm::quat& rotation;

	glm::vec3 forward() const {
		return rotation * glm::vec3 { 0.f, 0.f, 1.f };
	}
};

/**
 * @brief Positions and rotations of a fixed number of transforms, addressed by index
 */
class TransformAccessArray {
public:
	TransformAccessArray() = default;
	// count transforms at the origin with identity rotation
	explicit TransformAccessArray(size_t count, const Jobs::JobSystemAllocator& allocator = Jobs::getDefaultAllocator());

	size_t size() const {
		return positions.size();
	}

	TransformAccess operator[](size_t index) {
		return { positions[index], rotations[index] };
	}

	const glm::vec3& getPosition(size_t index) const {
		return positions[index];
	}

	const glm::quat& getRotation(size_t index) const {
		return rotations[index];
	}

	glm::vec3* getPositions() {
		return positions.data();
	}

	glm::quat* getRotations() {
		return rotations.data();
	}

	void release();

private:
	Buffer<glm::vec3> positions;
	Buffer<glm::quat> rotations;
};

using VelocityBuffer = Buffer<glm::vec3>;

/**
 * @brief Fish parameters of a single tick
 */
struct FishParams {
	float     deltaTime;
	float     time;
	float     swimSpeed;
	float     turnSpeed;
	int       swimChangeFrequency;
	glm::vec3 spawnCenter;
	glm::vec3 spawnBounds;
	uint32_t  randomSeedBase;
};

/**
 * @brief Run configuration of a fish school
 */
struct FishSettings {
	size_t    fishCount = 100;
	glm::vec3 center { 0.f };
	glm::vec3 spawnBounds { 20.f, 4.f, 20.f };
	float     spawnHeight = 0.f;
	int       swimChangeFrequency = 500;
	float     swimSpeed = 4.f;
	float     turnSpeed = 2.f;
	size_t    batchSize = defaultFishBatchSize;
	uint64_t  spawnSeed = 1;
};

/**
 * @brief Rotation whose forward axis points along direction, with the world y axis up
 * @return false if direction is zero, not finite or vertical. rotation is not modified in that case
 */
bool lookRotation(const glm::vec3& direction, glm::quat& rotation);

/**
 * @brief Update a single fish
 * @param index index of the fish, used to derive its random seed
 * @param transform position and rotation of the fish
 * @param velocity velocity of the fish, kept between ticks
 */
void updateFish(size_t index, TransformAccess transform, glm::vec3& velocity, const FishParams& params);

/**
 * @brief Updates all the fish of a population in parallel, one tick at a time
 */
class FishUpdater {
public:
	explicit FishUpdater(Jobs::JobSystem& jobSystem, size_t batchSize = defaultFishBatchSize);

	/**
	 * @brief Schedule the update of every fish. The buffers must not be accessed until the handle has been waited for
	 * @throw ShapeMismatch if transforms and velocities have different lengths
	 * @throw ScheduleConflict if the previous tick has not been waited for
	 * @throw InvalidConfig if the parameters are not valid
	 */
	Jobs::CompletionHandle schedule(TransformAccessArray& transforms, VelocityBuffer& velocities, const FishParams& params);

	/**
	 * @brief Schedule the update of every fish and wait for it
	 */
	void update(TransformAccessArray& transforms, VelocityBuffer& velocities, const FishParams& params);

	bool isBusy() const {
		return driver.isBusy();
	}

private:
	struct TickData {
		glm::vec3* positions;
		glm::quat* rotations;
		glm::vec3* velocities;
		FishParams params;
	};

	static void updateBatch(size_t offset, size_t count, const void* args, size_t threadIndex);

	Jobs::ParallelForDriver driver;
	TickData                tickData {};
	size_t                  batchSize;
};

/**
 * @brief A population of fish swimming in the spawn box

The velocities and transforms are allocated at construction, reused every tick and released once by release() or by the destructor. <br>
The spawn box is centered on center + spawnHeight along y. <br>
*/
class FishSchool {
public:
	/**
	 * @brief Spawn settings.fishCount fish at random points of the spawn box, with identity rotation and zero velocity
	 * @throw InvalidConfig if the settings are not valid
	 */
	FishSchool(Jobs::JobSystem& jobSystem, const FishSettings& settings);
	~FishSchool();

	FishSchool(const FishSchool&) = delete;
	FishSchool& operator=(const FishSchool&) = delete;

	// Schedule the update of the school. seedBase should change every tick
	void beginTick(float deltaTime, float time, uint32_t seedBase);
	// Wait for the update
	void endTick();
	void tick(float deltaTime, float time, uint32_t seedBase);

	/**
	 * @brief Release the velocities and transforms. Can be called more than once
	 * @throw ScheduleConflict if a tick is in flight
	 */
	void release();

	FishParams makeParams(float deltaTime, float time, uint32_t seedBase) const;

	bool isTickInFlight() const {
		return handle.isPending();
	}

	size_t size() const {
		return transforms.size();
	}

	glm::vec3 getSpawnCenter() const {
		return settings.center + glm::vec3 { 0.f, settings.spawnHeight, 0.f };
	}

	const FishSettings& getSettings() const {
		return settings;
	}

	const TransformAccessArray& getTransforms() const {
		return transforms;
	}

	const VelocityBuffer& getVelocities() const {
		return velocities;
	}

private:
	FishSettings           settings;
	TransformAccessArray   transforms;
	VelocityBuffer         velocities;
	FishUpdater            updater;
	Jobs::CompletionHandle handle;
};

} // namespace Sim

} // namespace Reef
