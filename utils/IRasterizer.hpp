#pragma once

#include "Vertex.hpp"
#include <vector>
#include <glm/glm.hpp>

// Receives the sorted vertex stream of a frame. Triangles are drawn in
// stream order, without depth testing or face culling.
class IRasterizer {
public:
    virtual ~IRasterizer() = default;

    // vertices holds 3 entries per triangle in draw order.
    virtual void drawTriangles(const std::vector<Vertex> &vertices, const glm::mat4 &modelView, const glm::mat4 &projection) = 0;
};
