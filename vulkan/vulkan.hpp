#pragma once

#include <vulkan/vulkan.h>
#define GLFW_INCLUDE_VULKAN
#include <GLFW/glfw3.h>
#include <cstring>
#include <cstdint>
#include <iostream>
#include <vector>
#include <optional>
#include <set>
#include <array>
#include <algorithm>
#include <stdexcept>

#include <glm/glm.hpp>

#include "FileReader.hpp"

const uint32_t WIDTH = 800;
const uint32_t HEIGHT = 600;

#ifdef NDEBUG
const bool enableValidationLayers = false;
#else
const bool enableValidationLayers = true;
#endif

class VulkanApp;

struct Buffer {
    VkBuffer buffer = VK_NULL_HANDLE;
    VkDeviceMemory memory = VK_NULL_HANDLE;
    VkDeviceSize size = 0;
};

// Small helper to create shader stage infos
struct ShaderStage {
    VkPipelineShaderStageCreateInfo info{};
    ShaderStage() = default;
    ShaderStage(VkShaderModule module, VkShaderStageFlagBits stage) {
        info.sType = VK_STRUCTURE_TYPE_PIPELINE_SHADER_STAGE_CREATE_INFO;
        info.stage = stage;
        info.module = module;
        info.pName = "main";
    }
};

struct QueueFamilyIndices {
    std::optional<uint32_t> graphicsFamily;
    std::optional<uint32_t> presentFamily;
    bool isComplete() const {
        return graphicsFamily.has_value() && presentFamily.has_value();
    }
};

#include "VulkanApp.hpp"
