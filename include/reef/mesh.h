#pragma once

#include <glm/glm.hpp>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace Reef {

namespace Sim {

/**
 * @brief CPU side triangle mesh. z is the up axis
 */
struct Mesh {
	std::vector<glm::vec3> vertices;
	std::vector<glm::vec3> normals;
	std::vector<uint32_t>  indices; // three per triangle
};

/**
 * @brief Create a flat grid of cellsX by cellsY cells centered on the origin, facing up
 */
Mesh createWaterGrid(size_t cellsX, size_t cellsY, float cellSize);

/**
 * @brief Recompute area weighted vertex normals from the triangles. Vertices without triangles face up
 */
void recalculateNormals(Mesh& mesh);

} // namespace Sim

} // namespace Reef
