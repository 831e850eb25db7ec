#pragma once

#include "../math/Mesh3D.hpp"
#include "IRasterizer.hpp"
#include "Vertex.hpp"
#include <vector>
#include <glm/glm.hpp>
#include <glm/gtc/constants.hpp>

// Camera and animation parameters of a frame.
struct FrameConfig {
    float angularSpeed = 0.5f; // radians per second about +Y
    glm::vec3 cameraOffset = glm::vec3(0.0f, -0.2f, -3.0f);
    float fieldOfView = glm::quarter_pi<float>(); // radians, vertical
    float nearPlane = 0.1f;
    float farPlane = 100.0f;
};

// Values produced by the last tick.
struct FrameState {
    float rotationY = 0.0f;
    glm::mat4 modelView = glm::mat4(1.0f);
    glm::mat4 projection = glm::mat4(1.0f);
    size_t vertexCount = 0;
};

// Owns the house mesh and runs the per-frame painter pipeline:
// transforms, depth keys, back-to-front sort, flatten, draw.
class FrameDriver {
public:
    FrameDriver();
    explicit FrameDriver(const FrameConfig &config);

    // Renders the frame at elapsedSeconds. aspect is width / height of the
    // drawable and must be positive.
    void tick(double elapsedSeconds, float aspect, IRasterizer &rasterizer);

    // Rotation is a function of elapsed time only, never accumulated.
    float rotationFor(double elapsedSeconds) const;

    glm::mat4 modelViewFor(float rotationY) const;
    glm::mat4 projectionFor(float aspect) const;

    // Three vertices per triangle, in the mesh's current order.
    static void flatten(const Mesh3D &mesh, std::vector<Vertex> &out);
    static std::vector<Vertex> flatten(const Mesh3D &mesh);

    void setConfig(const FrameConfig &config);
    const FrameConfig& getConfig() const;
    const Mesh3D& getMesh() const;
    const FrameState& getState() const;

private:
    FrameConfig config;
    Mesh3D mesh;
    FrameState state;
    std::vector<Vertex> vertexStream; // reused between frames
};
