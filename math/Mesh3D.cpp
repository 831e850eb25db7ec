#include "Mesh3D.hpp"

void Mesh3D::addTriangle(const glm::vec3 &a, const glm::vec3 &b, const glm::vec3 &c, const glm::vec3 &color) {
    uint32_t id = static_cast<uint32_t>(triangles.size());
    triangles.emplace_back(a, b, c, color, id);
}
