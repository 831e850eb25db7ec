#include "HouseMesh.hpp"

const glm::vec3 HouseMesh::FRONT_COLOR  = glm::vec3(0.90f, 0.80f, 0.70f);
const glm::vec3 HouseMesh::BACK_COLOR   = glm::vec3(0.85f, 0.75f, 0.65f);
const glm::vec3 HouseMesh::LEFT_COLOR   = glm::vec3(0.88f, 0.78f, 0.68f);
const glm::vec3 HouseMesh::RIGHT_COLOR  = glm::vec3(0.88f, 0.78f, 0.68f);
const glm::vec3 HouseMesh::TOP_COLOR    = glm::vec3(0.95f, 0.90f, 0.80f);
const glm::vec3 HouseMesh::BOTTOM_COLOR = glm::vec3(0.40f, 0.30f, 0.25f);
const glm::vec3 HouseMesh::ROOF_COLOR   = glm::vec3(0.80f, 0.10f, 0.10f);

Mesh3D HouseMesh::build() {
    // Box corners
    glm::vec3 corners[8] = {
        {-0.5f, 0.0f,  0.5f}, // 0 front-bottom-left
        { 0.5f, 0.0f,  0.5f}, // 1 front-bottom-right
        { 0.5f, 0.6f,  0.5f}, // 2 front-top-right
        {-0.5f, 0.6f,  0.5f}, // 3 front-top-left
        {-0.5f, 0.0f, -0.5f}, // 4 back-bottom-left
        { 0.5f, 0.0f, -0.5f}, // 5 back-bottom-right
        { 0.5f, 0.6f, -0.5f}, // 6 back-top-right
        {-0.5f, 0.6f, -0.5f}  // 7 back-top-left
    };
    glm::vec3 apex(0.0f, 1.0f, 0.0f);

    struct Face {
        int a, b, c, d;
        glm::vec3 color;
    };

    // each quad is split along its a-c diagonal: (a, b, c) and (a, c, d)
    Face faces[6] = {
        {0, 1, 2, 3, FRONT_COLOR},  // front (+Z)
        {1, 5, 6, 2, RIGHT_COLOR},  // right (+X)
        {5, 4, 7, 6, BACK_COLOR},   // back (-Z)
        {4, 0, 3, 7, LEFT_COLOR},   // left (-X)
        {4, 5, 1, 0, BOTTOM_COLOR}, // bottom (y = 0)
        {3, 2, 6, 7, TOP_COLOR}     // ceiling under the roof
    };

    Mesh3D mesh;
    for (const Face &f : faces) {
        mesh.addTriangle(corners[f.a], corners[f.b], corners[f.c], f.color);
        mesh.addTriangle(corners[f.a], corners[f.c], corners[f.d], f.color);
    }

    // Roof
    mesh.addTriangle(corners[3], corners[2], apex, ROOF_COLOR); // front
    mesh.addTriangle(corners[2], corners[6], apex, ROOF_COLOR); // right
    mesh.addTriangle(corners[6], corners[7], apex, ROOF_COLOR); // back
    mesh.addTriangle(corners[7], corners[3], apex, ROOF_COLOR); // left

    return mesh;
}
