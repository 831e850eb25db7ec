#include "vulkan/VulkanApp.hpp"
#include "vulkan/HouseRenderer.hpp"

#include <imgui.h>
#include "events/EventManager.hpp"
#include "events/KeyboardPublisher.hpp"
#include "events/AppEvents.hpp"
#include "utils/FrameDriver.hpp"
#include "utils/AnimationClock.hpp"
#include "widgets/WidgetManager.hpp"
#include "widgets/SettingsWidget.hpp"
#include "widgets/DrawOrderWidget.hpp"
#include <glm/gtc/constants.hpp>
#include <memory>
#include <cstdlib>

class PainterHouseApp : public VulkanApp, public IEventHandler {
    Settings settings;
    FrameDriver driver;
    AnimationClock clock;
    EventManager eventManager;
    KeyboardPublisher keyboardPublisher;
    WidgetManager widgetManager;
    HouseRenderer houseRenderer;
    bool imguiShowDemo = false;

public:
    PainterHouseApp() : houseRenderer(this) {}

    void setup() override {
        eventManager.subscribe(this);

        houseRenderer.init(this);

        widgetManager.addWidget(std::make_shared<SettingsWidget>(settings));
        widgetManager.addWidget(std::make_shared<DrawOrderWidget>(driver));

        applySettings();
        std::cerr << "[PainterHouseApp] house mesh: " << driver.getMesh().size() << " triangles" << std::endl;
    }

    // IEventHandler: window and animation control
    void onEvent(const EventPtr &event) override {
        if (!event) return;
        if (std::dynamic_pointer_cast<CloseWindowEvent>(event)) {
            requestClose();
            return;
        }
        if (std::dynamic_pointer_cast<ToggleFullscreenEvent>(event)) {
            toggleFullscreen();
            return;
        }
        if (std::dynamic_pointer_cast<PauseAnimationEvent>(event)) {
            settings.paused = !settings.paused;
            return;
        }
        if (std::dynamic_pointer_cast<ResetAnimationEvent>(event)) {
            clock.reset();
            return;
        }
    }

    void renderImGui() override {
        if (ImGui::BeginMainMenuBar()) {
            if (ImGui::BeginMenu("File")) {
                if (ImGui::MenuItem("Exit", "Esc")) requestClose();
                ImGui::EndMenu();
            }
            if (ImGui::BeginMenu("View")) {
                ImGui::MenuItem("Show Demo", NULL, &imguiShowDemo);
                if (ImGui::MenuItem("Fullscreen", "F11", isFullscreen)) {
                    toggleFullscreen();
                }
                ImGui::MenuItem("Pause rotation", "Space", &settings.paused);
                if (ImGui::MenuItem("Reset rotation", "R")) clock.reset();
                ImGui::EndMenu();
            }
            widgetManager.renderMenu();
            ImGui::EndMainMenuBar();

            // top-left overlay under the menu bar
            {
                ImGuiWindowFlags flags = ImGuiWindowFlags_NoDecoration | ImGuiWindowFlags_AlwaysAutoResize | ImGuiWindowFlags_NoFocusOnAppearing | ImGuiWindowFlags_NoNav;
                ImGui::SetNextWindowBgAlpha(0.35f);
                float padding = 10.0f;
                float y = ImGui::GetFrameHeight() + 6.0f;
                ImGui::SetNextWindowPos(ImVec2(padding, y), ImGuiCond_Always);
                if (ImGui::Begin("##stats_overlay", nullptr, flags)) {
                    ImGui::Text("FPS: %.1f", imguiFps);
                    ImGui::Text("Triangles: %zu", driver.getState().vertexCount / 3);
                    ImGui::Text("Angle: %.2f rad%s", driver.getState().rotationY, clock.isPaused() ? " (paused)" : "");
                }
                ImGui::End();
            }
        }

        if (imguiShowDemo) ImGui::ShowDemoWindow(&imguiShowDemo);

        widgetManager.renderAll();
    }

    void update(float deltaTime) override {
        eventManager.processQueued();
        keyboardPublisher.update(getWindow(), &eventManager);

        clock.setPaused(settings.paused);
        clock.advance(deltaTime);

        applySettings();
    }

    void draw(VkCommandBuffer commandBuffer) override {
        int height = getHeight();
        if (height <= 0) return;
        float aspect = (float)getWidth() / (float)height;

        houseRenderer.beginFrame(commandBuffer, getCurrentFrame());
        driver.tick(clock.elapsed(), aspect, houseRenderer);
        houseRenderer.endFrame();
    }

    void clean() override {
        eventManager.unsubscribe(this);
        houseRenderer.cleanup();
    }

private:
    void applySettings() {
        FrameConfig config;
        config.angularSpeed = settings.angularSpeed;
        config.cameraOffset = settings.cameraOffset;
        config.fieldOfView = glm::radians(settings.fieldOfViewDeg);
        config.nearPlane = settings.nearPlane;
        config.farPlane = settings.farPlane;
        driver.setConfig(config);

        setVSyncEnabled(settings.vsyncEnabled);
        setClearColor(settings.clearColor);
    }
};

int main() {
    PainterHouseApp app;

    try {
        app.run();
    } catch (const std::exception& e) {
        std::cerr << e.what() << std::endl;
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
