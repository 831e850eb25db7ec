#pragma once

#include "Triangle.hpp"
#include <vector>
#include <cstddef>
#include <glm/glm.hpp>

// Ordered triangle list. The order is the draw order once PainterSorter ran.
class Mesh3D {
public:
    Mesh3D() = default;

    // Appends a triangle; its id is the current triangle count.
    void addTriangle(const glm::vec3 &a, const glm::vec3 &b, const glm::vec3 &c, const glm::vec3 &color);

    std::vector<Triangle>& getTriangles() { return triangles; }
    const std::vector<Triangle>& getTriangles() const { return triangles; }
    size_t size() const { return triangles.size(); }
    bool empty() const { return triangles.empty(); }

private:
    std::vector<Triangle> triangles;
};
