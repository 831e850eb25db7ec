#pragma once

#include "VulkanApp.hpp"
#include "../utils/IRasterizer.hpp"
#include <array>

// Push constant block shared with shaders/house.vert.
struct HousePushConstants {
    glm::mat4 modelView;
    glm::mat4 projection;
};

// Records the painter-sorted vertex stream into the main render pass.
// The pipeline has no depth test and no culling, so triangles land on
// screen strictly in stream order.
class HouseRenderer : public IRasterizer {
public:
    explicit HouseRenderer(VulkanApp* app_ = nullptr);
    ~HouseRenderer();

    void init(VulkanApp* app_);
    void cleanup();

    // Draw calls are only accepted between beginFrame and endFrame.
    void beginFrame(VkCommandBuffer cmd, uint32_t frameIndex);
    void endFrame();

    void drawTriangles(const std::vector<Vertex> &vertices, const glm::mat4 &modelView, const glm::mat4 &projection) override;

    size_t getLastVertexCount() const { return lastVertexCount; }

private:
    struct FrameBuffer {
        Buffer buffer;
        void* mapped = nullptr;
    };

    VulkanApp* app = nullptr;
    VkPipeline pipeline = VK_NULL_HANDLE;
    VkPipelineLayout pipelineLayout = VK_NULL_HANDLE;

    // one host-visible buffer per frame in flight, so the CPU never
    // overwrites vertices the GPU is still reading
    std::array<FrameBuffer, VulkanApp::MAX_FRAMES_IN_FLIGHT> frames{};

    VkCommandBuffer activeCommandBuffer = VK_NULL_HANDLE;
    uint32_t activeFrame = 0;
    size_t lastVertexCount = 0;

    void createPipeline();
    void ensureCapacity(FrameBuffer &frame, VkDeviceSize bytes);
    void releaseFrame(FrameBuffer &frame);
};
