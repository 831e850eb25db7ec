#pragma once

#include <glm/glm.hpp>
#include <cstdint>

// Flat-colored model-space triangle. Vertices never change after construction;
// depth is scratch space rewritten by PainterSorter every frame.
struct Triangle {
public:
    glm::vec3 v[3];
    glm::vec3 color;
    float depth;
    uint32_t id; // insertion index inside its mesh, used to break depth ties

    Triangle(const glm::vec3 &a, const glm::vec3 &b, const glm::vec3 &c, const glm::vec3 &color, uint32_t id)
        : v{a, b, c}, color(color), depth(0.0f), id(id) {}
};
