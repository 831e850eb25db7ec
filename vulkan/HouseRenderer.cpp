#include "HouseRenderer.hpp"
#include <cstddef>
#include <cstring>

namespace {
constexpr VkDeviceSize MIN_VERTEX_BUFFER_BYTES = 64 * sizeof(Vertex);
}

HouseRenderer::HouseRenderer(VulkanApp* app_) : app(app_) {}
HouseRenderer::~HouseRenderer() { cleanup(); }

void HouseRenderer::init(VulkanApp* app_) {
    if (app_) app = app_;
    if (!app) {
        throw std::runtime_error("HouseRenderer::init without an application");
    }
    createPipeline();
}

void HouseRenderer::createPipeline() {
    VkShaderModule vertShader = app->createShaderModule(FileReader::readFile("shaders/house.vert.spv"));
    VkShaderModule fragShader = app->createShaderModule(FileReader::readFile("shaders/house.frag.spv"));

    VkPushConstantRange pushRange{};
    pushRange.stageFlags = VK_SHADER_STAGE_VERTEX_BIT;
    pushRange.offset = 0;
    pushRange.size = sizeof(HousePushConstants);

    VkVertexInputBindingDescription binding{ 0, sizeof(Vertex), VK_VERTEX_INPUT_RATE_VERTEX };

    try {
        auto result = app->createGraphicsPipeline(
            {
                ShaderStage(vertShader, VK_SHADER_STAGE_VERTEX_BIT).info,
                ShaderStage(fragShader, VK_SHADER_STAGE_FRAGMENT_BIT).info
            },
            binding,
            {
                VkVertexInputAttributeDescription{ 0, 0, VK_FORMAT_R32G32B32_SFLOAT, offsetof(Vertex, position) },
                VkVertexInputAttributeDescription{ 1, 0, VK_FORMAT_R32G32B32_SFLOAT, offsetof(Vertex, color) }
            },
            &pushRange,
            VK_CULL_MODE_NONE
        );
        pipeline = result.first;
        pipelineLayout = result.second;
    } catch (const std::exception &) {
        vkDestroyShaderModule(app->getDevice(), fragShader, nullptr);
        vkDestroyShaderModule(app->getDevice(), vertShader, nullptr);
        throw;
    }

    vkDestroyShaderModule(app->getDevice(), fragShader, nullptr);
    vkDestroyShaderModule(app->getDevice(), vertShader, nullptr);
}

void HouseRenderer::ensureCapacity(FrameBuffer &frame, VkDeviceSize bytes) {
    if (frame.buffer.buffer != VK_NULL_HANDLE && frame.buffer.size >= bytes) {
        return;
    }
    VkDeviceSize newSize = std::max(MIN_VERTEX_BUFFER_BYTES, frame.buffer.size);
    while (newSize < bytes) newSize *= 2;

    // the fence for this frame slot has been waited on, so the old buffer is idle
    releaseFrame(frame);
    frame.buffer = app->createBuffer(newSize,
        VK_BUFFER_USAGE_VERTEX_BUFFER_BIT,
        VK_MEMORY_PROPERTY_HOST_VISIBLE_BIT | VK_MEMORY_PROPERTY_HOST_COHERENT_BIT);
    if (vkMapMemory(app->getDevice(), frame.buffer.memory, 0, newSize, 0, &frame.mapped) != VK_SUCCESS) {
        app->destroyBuffer(frame.buffer);
        frame.mapped = nullptr;
        throw std::runtime_error("failed to map house vertex buffer");
    }
}

void HouseRenderer::releaseFrame(FrameBuffer &frame) {
    if (frame.mapped) {
        vkUnmapMemory(app->getDevice(), frame.buffer.memory);
        frame.mapped = nullptr;
    }
    if (frame.buffer.buffer != VK_NULL_HANDLE) {
        app->destroyBuffer(frame.buffer);
    }
}

void HouseRenderer::beginFrame(VkCommandBuffer cmd, uint32_t frameIndex) {
    if (frameIndex >= frames.size()) {
        throw std::out_of_range("frame index " + std::to_string(frameIndex));
    }
    activeCommandBuffer = cmd;
    activeFrame = frameIndex;
}

void HouseRenderer::endFrame() {
    activeCommandBuffer = VK_NULL_HANDLE;
}

void HouseRenderer::drawTriangles(const std::vector<Vertex> &vertices, const glm::mat4 &modelView, const glm::mat4 &projection) {
    if (activeCommandBuffer == VK_NULL_HANDLE) {
        throw std::runtime_error("HouseRenderer::drawTriangles outside beginFrame/endFrame");
    }
    lastVertexCount = vertices.size();
    if (vertices.empty()) return;

    FrameBuffer &frame = frames[activeFrame];
    VkDeviceSize bytes = sizeof(Vertex) * vertices.size();
    ensureCapacity(frame, bytes);
    std::memcpy(frame.mapped, vertices.data(), static_cast<size_t>(bytes));

    HousePushConstants pc{ modelView, projection };

    vkCmdBindPipeline(activeCommandBuffer, VK_PIPELINE_BIND_POINT_GRAPHICS, pipeline);
    vkCmdPushConstants(activeCommandBuffer, pipelineLayout, VK_SHADER_STAGE_VERTEX_BIT, 0, sizeof(HousePushConstants), &pc);
    VkBuffer vertexBuffers[] = { frame.buffer.buffer };
    VkDeviceSize offsets[] = { 0 };
    vkCmdBindVertexBuffers(activeCommandBuffer, 0, 1, vertexBuffers, offsets);
    vkCmdDraw(activeCommandBuffer, static_cast<uint32_t>(vertices.size()), 1, 0, 0);
}

void HouseRenderer::cleanup() {
    if (!app) return;
    VkDevice device = app->getDevice();
    if (device == VK_NULL_HANDLE) return;
    for (auto &frame : frames) {
        releaseFrame(frame);
    }
    if (pipeline != VK_NULL_HANDLE) {
        vkDestroyPipeline(device, pipeline, nullptr);
        pipeline = VK_NULL_HANDLE;
    }
    if (pipelineLayout != VK_NULL_HANDLE) {
        vkDestroyPipelineLayout(device, pipelineLayout, nullptr);
        pipelineLayout = VK_NULL_HANDLE;
    }
}
