#pragma once

#include "vulkan.hpp"
#include <utility>
#include <initializer_list>

// GLFW window + Vulkan device + swapchain + ImGui, with a per-frame hook
// structure for derived applications (setup/update/draw/renderImGui/clean).
//
// The render pass has a single color attachment and no depth attachment:
// visibility is decided entirely by the order in which geometry is drawn.
class VulkanApp {
public:
    static constexpr uint32_t MAX_FRAMES_IN_FLIGHT = 2;

    virtual ~VulkanApp() = default;

    void run();
    // request the app to close the main window
    void requestClose();

    virtual void setup() = 0;
    virtual void update(float deltaTime) = 0;
    // Called inside the main render pass with viewport and scissor already set.
    virtual void draw(VkCommandBuffer commandBuffer) = 0;
    virtual void clean() = 0;

    VkShaderModule createShaderModule(const std::vector<char>& code);
    // Pipeline for the main render pass with dynamic viewport/scissor and no
    // depth/stencil state. Caller owns both returned handles.
    std::pair<VkPipeline, VkPipelineLayout> createGraphicsPipeline(
        std::initializer_list<VkPipelineShaderStageCreateInfo> stages,
        VkVertexInputBindingDescription bindingDescription,
        std::initializer_list<VkVertexInputAttributeDescription> attributeDescriptions,
        const VkPushConstantRange* pushConstantRange = nullptr,
        VkCullModeFlags cullMode = VK_CULL_MODE_NONE,
        VkPolygonMode polygonMode = VK_POLYGON_MODE_FILL);

    uint32_t findMemoryType(uint32_t typeFilter, VkMemoryPropertyFlags properties);
    Buffer createBuffer(VkDeviceSize size, VkBufferUsageFlags usage, VkMemoryPropertyFlags properties);
    void destroyBuffer(Buffer &buffer);

    VkDevice getDevice() const { return device; }
    VkExtent2D getSwapchainExtent() const { return swapchainExtent; }
    uint32_t getCurrentFrame() const { return currentFrame; }
    int getWidth() const;
    int getHeight() const;

    void setVSyncEnabled(bool enabled);
    void setClearColor(const glm::vec3 &color) { clearColor = color; }

protected:
    // Allow derived classes to build ImGui UI per-frame
    virtual void renderImGui();

    GLFWwindow* getWindow() const { return window; }
    void toggleFullscreen();

    bool isFullscreen = false;
    float imguiFps = 0.0f;

private:
    GLFWwindow* window = nullptr;

    VkInstance instance = VK_NULL_HANDLE;
    VkDebugUtilsMessengerEXT debugMessenger = VK_NULL_HANDLE;
    VkSurfaceKHR surface = VK_NULL_HANDLE;
    VkPhysicalDevice physicalDevice = VK_NULL_HANDLE;
    VkDevice device = VK_NULL_HANDLE;
    VkQueue graphicsQueue = VK_NULL_HANDLE;
    VkQueue presentQueue = VK_NULL_HANDLE;

    VkSwapchainKHR swapchain = VK_NULL_HANDLE;
    std::vector<VkImage> swapchainImages;
    VkFormat swapchainImageFormat = VK_FORMAT_UNDEFINED;
    VkExtent2D swapchainExtent{0, 0};
    std::vector<VkImageView> swapchainImageViews;
    std::vector<VkFramebuffer> swapchainFramebuffers;
    VkRenderPass renderPass = VK_NULL_HANDLE;

    VkCommandPool commandPool = VK_NULL_HANDLE;
    std::vector<VkCommandBuffer> commandBuffers;          // per frame in flight

    std::vector<VkSemaphore> imageAvailableSemaphores;    // per frame in flight
    std::vector<VkSemaphore> renderFinishedSemaphores;    // per swapchain image
    std::vector<VkFence> inFlightFences;                  // per frame in flight
    std::vector<VkFence> imagesInFlight;                  // per swapchain image, not owned
    uint32_t currentFrame = 0;

    VkDescriptorPool imguiDescriptorPool = VK_NULL_HANDLE;

    glm::vec3 clearColor = glm::vec3(0.0f);
    bool framebufferResized = false;
    bool vsyncEnabled = true;
    bool vsyncChanged = false;
    int windowedPosX = 100;
    int windowedPosY = 100;
    int windowedWidth = WIDTH;
    int windowedHeight = HEIGHT;
    double lastFrameTime = 0.0;

    void initWindow();
    void initVulkan();
    void mainLoop();
    void drawFrame();
    void cleanup();

    void createInstance();
    bool checkValidationLayerSupport();
    void setupDebugMessenger();
    void createSurface();
    QueueFamilyIndices findQueueFamilies(VkPhysicalDevice device);
    bool checkDeviceExtensionSupport(VkPhysicalDevice device);
    bool isDeviceSuitable(VkPhysicalDevice device);
    void pickPhysicalDevice();
    void createLogicalDevice();

    VkSurfaceFormatKHR chooseSwapSurfaceFormat(const std::vector<VkSurfaceFormatKHR>& availableFormats);
    VkPresentModeKHR chooseSwapPresentMode(const std::vector<VkPresentModeKHR>& availablePresentModes);
    VkExtent2D chooseSwapExtent(const VkSurfaceCapabilitiesKHR& capabilities);
    void createSwapchain();
    void createImageViews();
    void createRenderPass();
    void createFramebuffers();
    void createCommandPool();
    void createCommandBuffers();
    void createSyncObjects();
    void createRenderFinishedSemaphores();
    void destroyRenderFinishedSemaphores();
    void cleanupSwapchain();
    void recreateSwapchain();
    static void framebufferResizeCallback(GLFWwindow* window, int width, int height);

    void initImGui();
    void initImGuiVulkanBackend();
    void cleanupImGui();
};
