#include <reef/errors.h>
#include <reef/mesh.h>
#include <cmath>

namespace Reef {

namespace Sim {

Mesh createWaterGrid(size_t cellsX, size_t cellsY, float cellSize) {
	if (cellsX == 0 || cellsY == 0 || ! (cellSize > 0.f)) {
		throw InvalidConfig("water grid: cell counts and cell size must be positive");
	}

	Mesh         mesh;
	const size_t columns = cellsX + 1;
	const size_t rows = cellsY + 1;
	const float  halfWidth = 0.5f * cellSize * static_cast<float>(cellsX);
	const float  halfDepth = 0.5f * cellSize * static_cast<float>(cellsY);
	mesh.vertices.reserve(columns * rows);
	mesh.normals.reserve(columns * rows);
	for (size_t y = 0; y < rows; ++y) {
		for (size_t x = 0; x < columns; ++x) {
			mesh.vertices.emplace_back(static_cast<float>(x) * cellSize - halfWidth, static_cast<float>(y) * cellSize - halfDepth, 0.f);
			mesh.normals.emplace_back(0.f, 0.f, 1.f);
		}
	}

	// Counter clockwise seen from above
	mesh.indices.reserve(cellsX * cellsY * 6);
	for (size_t y = 0; y < cellsY; ++y) {
		for (size_t x = 0; x < cellsX; ++x) {
			const auto i0 = static_cast<uint32_t>(y * columns + x);
			const auto i1 = i0 + 1;
			const auto i2 = static_cast<uint32_t>(i0 + columns);
			const auto i3 = i2 + 1;
			mesh.indices.insert(mesh.indices.end(), { i0, i1, i3, i0, i3, i2 });
		}
	}
	return mesh;
}

void recalculateNormals(Mesh& mesh) {
	mesh.normals.assign(mesh.vertices.size(), glm::vec3 { 0.f });
	for (size_t t = 0; t + 2 < mesh.indices.size(); t += 3) {
		const uint32_t i0 = mesh.indices[t];
		const uint32_t i1 = mesh.indices[t + 1];
		const uint32_t i2 = mesh.indices[t + 2];
		if (i0 >= mesh.vertices.size() || i1 >= mesh.vertices.size() || i2 >= mesh.vertices.size()) {
			throw ShapeMismatch("recalculate normals: triangle index out of range");
		}
		// Not normalized: the length is twice the triangle area
		const glm::vec3 faceNormal = glm::cross(mesh.vertices[i1] - mesh.vertices[i0], mesh.vertices[i2] - mesh.vertices[i0]);
		mesh.normals[i0] += faceNormal;
		mesh.normals[i1] += faceNormal;
		mesh.normals[i2] += faceNormal;
	}
	for (glm::vec3& normal : mesh.normals) {
		const float len2 = glm::dot(normal, normal);
		normal = len2 > 1e-12f ? normal / std::sqrt(len2) : glm::vec3 { 0.f, 0.f, 1.f };
	}
}

} // namespace Sim

} // namespace Reef
