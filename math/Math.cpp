#include "Math.hpp"
#include <glm/gtc/matrix_transform.hpp>

glm::mat4 Math::identity() {
    return glm::mat4(1.0f);
}

glm::mat4 Math::multiply(const glm::mat4 &a, const glm::mat4 &b) {
    return a * b;
}

glm::mat4 Math::translate(float tx, float ty, float tz) {
    glm::mat4 m(1.0f);
    m[3][0] = tx;
    m[3][1] = ty;
    m[3][2] = tz;
    return m;
}

glm::mat4 Math::rotateY(float angle) {
    float c = glm::cos(angle);
    float s = glm::sin(angle);

    glm::mat4 m(1.0f);
    m[0][0] = c;
    m[0][2] = -s;
    m[2][0] = s;
    m[2][2] = c;
    return m;
}

glm::mat4 Math::perspective(float fovY, float aspect, float near, float far) {
    // RH/NO regardless of GLM_FORCE_DEPTH_ZERO_TO_ONE
    return glm::perspectiveRH_NO(fovY, aspect, near, far);
}

glm::vec3 Math::transformPoint(const glm::mat4 &matrix, const glm::vec3 &point) {
    glm::vec4 p = matrix * glm::vec4(point, 1.0f);
    return glm::vec3(p);
}
