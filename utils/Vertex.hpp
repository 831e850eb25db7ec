#pragma once

#include <glm/glm.hpp>

// Element of the flattened vertex stream; also the GPU vertex buffer layout
// (location 0 = position, location 1 = color).
struct Vertex {
    glm::vec3 position;
    glm::vec3 color;
};
