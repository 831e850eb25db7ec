#pragma once
#include <glm/glm.hpp>

// 4x4 matrix helpers used by the painter pipeline.
// Matrices are column-major: element (column c, row r) lives at m[c][r],
// which is index c*4+r of glm::value_ptr(m). Points are transformed as M * p.
class Math {
public:
    static glm::mat4 identity();
    // a * b, so multiply(T, R) applies R first and then T
    static glm::mat4 multiply(const glm::mat4 &a, const glm::mat4 &b);
    static glm::mat4 translate(float tx, float ty, float tz);
    // right-handed rotation about +Y, angle in radians
    static glm::mat4 rotateY(float angle);
    // OpenGL-style projection (clip z in [-w, w]).
    // Requires 0 < near < far and aspect > 0; not checked.
    static glm::mat4 perspective(float fovY, float aspect, float near, float far);
    // Applies the matrix to (x, y, z, 1) and drops w, no perspective divide.
    static glm::vec3 transformPoint(const glm::mat4 &matrix, const glm::vec3 &point);
};
