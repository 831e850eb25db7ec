#include "FrameDriver.hpp"
#include "HouseMesh.hpp"
#include "../math/Math.hpp"
#include "../math/PainterSorter.hpp"

FrameDriver::FrameDriver() : FrameDriver(FrameConfig{}) {
}

FrameDriver::FrameDriver(const FrameConfig &config)
    : config(config), mesh(HouseMesh::build()) {
    vertexStream.reserve(mesh.size() * 3);
}

void FrameDriver::tick(double elapsedSeconds, float aspect, IRasterizer &rasterizer) {
    state.rotationY = rotationFor(elapsedSeconds);
    state.modelView = modelViewFor(state.rotationY);
    state.projection = projectionFor(aspect);

    PainterSorter::computeDepths(mesh, state.modelView);
    PainterSorter::sortBackToFront(mesh);

    flatten(mesh, vertexStream);
    state.vertexCount = vertexStream.size();

    rasterizer.drawTriangles(vertexStream, state.modelView, state.projection);
}

float FrameDriver::rotationFor(double elapsedSeconds) const {
    return static_cast<float>(elapsedSeconds * static_cast<double>(config.angularSpeed));
}

glm::mat4 FrameDriver::modelViewFor(float rotationY) const {
    // rotate about the house's own vertical axis, then push it away from the camera
    glm::mat4 translation = Math::translate(config.cameraOffset.x, config.cameraOffset.y, config.cameraOffset.z);
    return Math::multiply(translation, Math::rotateY(rotationY));
}

glm::mat4 FrameDriver::projectionFor(float aspect) const {
    return Math::perspective(config.fieldOfView, aspect, config.nearPlane, config.farPlane);
}

void FrameDriver::flatten(const Mesh3D &mesh, std::vector<Vertex> &out) {
    out.clear();
    out.reserve(mesh.size() * 3);
    for (const Triangle &tri : mesh.getTriangles()) {
        for (int i = 0; i < 3; ++i) {
            out.push_back(Vertex{tri.v[i], tri.color});
        }
    }
}

std::vector<Vertex> FrameDriver::flatten(const Mesh3D &mesh) {
    std::vector<Vertex> out;
    flatten(mesh, out);
    return out;
}

void FrameDriver::setConfig(const FrameConfig &config) {
    this->config = config;
}

const FrameConfig& FrameDriver::getConfig() const {
    return config;
}

const Mesh3D& FrameDriver::getMesh() const {
    return mesh;
}

const FrameState& FrameDriver::getState() const {
    return state;
}
