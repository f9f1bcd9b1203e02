#include <reef/errors.h>
#include <reef/fish.h>
#include <reef/log.h>
#include <reef/random.h>
#include <cmath>

namespace Reef {

namespace Sim {

namespace {

const glm::vec3 worldUp { 0.f, 1.f, 0.f };

bool isFinite(const glm::vec3& v) {
	return std::isfinite(v.x) && std::isfinite(v.y) && std::isfinite(v.z);
}

bool isValidBounds(const glm::vec3& bounds) {
	return isFinite(bounds) && bounds.x >= 0.f && bounds.y >= 0.f && bounds.z >= 0.f;
}

void validate(const FishParams& params) {
	if (! std::isfinite(params.deltaTime) || ! std::isfinite(params.time) || ! std::isfinite(params.swimSpeed) || ! std::isfinite(params.turnSpeed)) {
		throw InvalidConfig("fish: time and speeds must be finite");
	}
	if (params.swimChangeFrequency <= 0) {
		throw InvalidConfig("fish: swim change frequency must be positive");
	}
	if (! isFinite(params.spawnCenter) || ! isValidBounds(params.spawnBounds)) {
		throw InvalidConfig("fish: spawn bounds must be finite and not negative");
	}
}

void validate(const FishSettings& settings) {
	if (settings.fishCount == 0) {
		throw InvalidConfig("fish school: the population must not be empty");
	}
	if (settings.batchSize == 0) {
		throw InvalidConfig("fish school: batch size must be positive");
	}
	if (! isFinite(settings.center) || ! std::isfinite(settings.spawnHeight) || ! isValidBounds(settings.spawnBounds)) {
		throw InvalidConfig("fish school: spawn bounds must be finite and not negative");
	}
	if (settings.swimChangeFrequency <= 0) {
		throw InvalidConfig("fish school: swim change frequency must be positive");
	}
	if (! std::isfinite(settings.swimSpeed) || ! std::isfinite(settings.turnSpeed) || settings.swimSpeed < 0.f || settings.turnSpeed < 0.f) {
		throw InvalidConfig("fish school: speeds must be finite and not negative");
	}
}

// Rotate toward direction by a fraction t of the angle. No-op if direction has no valid look rotation
void turnTowards(glm::quat& rotation, const glm::vec3& direction, float t) {
	glm::quat target;
	if (lookRotation(direction, target)) {
		rotation = glm::slerp(rotation, target, glm::clamp(t, 0.f, 1.f));
	}
}

bool isOutside(const glm::vec3& position, const glm::vec3& center, const glm::vec3& halfBounds) {
	return position.x > center.x + halfBounds.x || position.x < center.x - halfBounds.x || position.z > center.z + halfBounds.z ||
	       position.z < center.z - halfBounds.z;
}

} // namespace

TransformAccessArray::TransformAccessArray(size_t count, const Jobs::JobSystemAllocator& allocator)
    : positions(count, allocator)
    , rotations(count, allocator) {
	for (glm::quat& rotation : rotations) {
		rotation = glm::quat { 1.f, 0.f, 0.f, 0.f };
	}
}

void TransformAccessArray::release() {
	positions.release();
	rotations.release();
}

bool lookRotation(const glm::vec3& direction, glm::quat& rotation) {
	if (! isFinite(direction)) {
		return false;
	}
	const float len2 = glm::dot(direction, direction);
	if (len2 < 1e-12f) {
		return false;
	}
	const glm::vec3 forward = direction / std::sqrt(len2);
	const glm::vec3 right = glm::cross(worldUp, forward);
	if (glm::dot(right, right) < 1e-12f) {
		return false; // vertical
	}
	rotation = glm::quatLookAtLH(forward, worldUp);
	return true;
}

void updateFish(size_t index, TransformAccess transform, glm::vec3& velocity, const FishParams& params) {
	Random random { deriveSeed(index, params.time, params.randomSeedBase) };

	// Swim forward at a random fraction of the swim speed
	transform.position += transform.forward() * params.swimSpeed * params.deltaTime * random.nextFloat(0.3f, 1.f);

	const float turn = params.turnSpeed * params.deltaTime;
	if (velocity != glm::vec3 { 0.f }) {
		turnTowards(transform.rotation, velocity, turn);
	}

	const glm::vec3  halfBounds = params.spawnBounds * 0.5f;
	const glm::vec3& center = params.spawnCenter;
	const glm::vec3& position = transform.position;
	if (isOutside(position, center, halfBounds)) {
		// Head back to a random point well inside the box
		const glm::vec3 target { center.x + random.nextFloat(-halfBounds.x, halfBounds.x) / boundaryTargetShrink, center.y,
			                     center.z + random.nextFloat(-halfBounds.z, halfBounds.z) / boundaryTargetShrink };
		const glm::vec3 toTarget = target - position;
		if (glm::dot(toTarget, toTarget) > 1e-12f) {
			velocity = glm::normalize(toTarget);
			turnTowards(transform.rotation, velocity, turn * 2.f);
		}
		return;
	}

	if (random.nextInt(0, params.swimChangeFrequency) <= swimChangeThreshold) {
		velocity = glm::vec3 { random.nextFloat(-1.f, 1.f), 0.f, random.nextFloat(-1.f, 1.f) };
	}
}

FishUpdater::FishUpdater(Jobs::JobSystem& jobSystem, size_t batchSize)
    : driver(jobSystem)
    , batchSize(batchSize) {
	if (batchSize == 0) {
		throw InvalidConfig("fish updater: batch size must be positive");
	}
}

Jobs::CompletionHandle FishUpdater::schedule(TransformAccessArray& transforms, VelocityBuffer& velocities, const FishParams& params) {
	driver.ensureIdle(); // tickData is read by the tick in flight
	if (transforms.size() != velocities.size()) {
		RF_LOG_ERROR("fish updater: %zd transforms, %zd velocities", transforms.size(), velocities.size());
		throw ShapeMismatch("fish updater: transform and velocity buffers have different lengths");
	}
	validate(params);
	tickData = { transforms.getPositions(), transforms.getRotations(), velocities.data(), params };
	const TickData* const data = &tickData;
	return driver.scheduleBatches(transforms.size(), batchSize, updateBatch, data);
}

void FishUpdater::update(TransformAccessArray& transforms, VelocityBuffer& velocities, const FishParams& params) {
	schedule(transforms, velocities, params).wait();
}

void FishUpdater::updateBatch(size_t offset, size_t count, const void* args, size_t /*threadIndex*/) {
	auto [data] = Jobs::unpackJobArgs<const TickData*>(args);
	for (size_t i = offset; i < offset + count; ++i) {
		updateFish(i, TransformAccess { data->positions[i], data->rotations[i] }, data->velocities[i], data->params);
	}
}

FishSchool::FishSchool(Jobs::JobSystem& jobSystem, const FishSettings& settings)
    : settings(settings)
    , updater(jobSystem, settings.batchSize) {
	validate(settings);

	transforms = TransformAccessArray { settings.fishCount };
	velocities = VelocityBuffer { settings.fishCount };

	// Random spawn point within the spawn box, at the height of its center
	Random          random { settings.spawnSeed };
	const glm::vec3 spawnCenter = getSpawnCenter();
	const glm::vec3 halfBounds = settings.spawnBounds * 0.5f;
	for (size_t i = 0; i < settings.fishCount; ++i) {
		const float distanceX = random.nextFloat(-halfBounds.x, halfBounds.x);
		const float distanceZ = random.nextFloat(-halfBounds.z, halfBounds.z);
		transforms[i].position = spawnCenter + glm::vec3 { distanceX, 0.f, distanceZ };
	}
	RF_LOG_INFO("Fish school: %zd fish", settings.fishCount);
}

FishSchool::~FishSchool() {
	handle.wait();
}

FishParams FishSchool::makeParams(float deltaTime, float time, uint32_t seedBase) const {
	return FishParams { deltaTime,
		                time,
		                settings.swimSpeed,
		                settings.turnSpeed,
		                settings.swimChangeFrequency,
		                getSpawnCenter(),
		                settings.spawnBounds,
		                seedBase };
}

void FishSchool::beginTick(float deltaTime, float time, uint32_t seedBase) {
	if (handle.isPending()) {
		throw ScheduleConflict("fish school: the previous tick has not ended");
	}
	if (! velocities.isAllocated()) {
		throw ScheduleConflict("fish school: buffers have been released");
	}
	handle = updater.schedule(transforms, velocities, makeParams(deltaTime, time, seedBase));
}

void FishSchool::endTick() {
	handle.wait();
}

void FishSchool::tick(float deltaTime, float time, uint32_t seedBase) {
	beginTick(deltaTime, time, seedBase);
	endTick();
}

void FishSchool::release() {
	if (handle.isPending()) {
		throw ScheduleConflict("fish school: cannot release the buffers while a tick is in flight");
	}
	velocities.release();
	transforms.release();
}

} // namespace Sim

} // namespace Reef
