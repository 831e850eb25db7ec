#pragma once

#include "../math/Mesh3D.hpp"
#include <glm/glm.hpp>

// The static house model: a 1 x 0.6 x 1 box resting on y = 0, centered on
// x/z, capped by a four-sided pyramid roof with its apex at (0, 1, 0).
class HouseMesh {
public:
    static const glm::vec3 FRONT_COLOR;
    static const glm::vec3 BACK_COLOR;
    static const glm::vec3 LEFT_COLOR;
    static const glm::vec3 RIGHT_COLOR;
    static const glm::vec3 TOP_COLOR;
    static const glm::vec3 BOTTOM_COLOR;
    static const glm::vec3 ROOF_COLOR;

    static constexpr size_t TRIANGLE_COUNT = 16;

    // Builds a new 16 triangle mesh: two triangles per box face, then the
    // four roof faces. Every call returns a fresh copy.
    static Mesh3D build();
};
