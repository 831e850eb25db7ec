#include "SettingsWidget.hpp"
#include <imgui.h>

SettingsWidget::SettingsWidget(Settings& settingsRef) : Widget("Settings", true), settings(settingsRef) {
}

void SettingsWidget::render() {
    if (!ImGui::Begin(title.c_str(), &isOpen)) {
        ImGui::End();
        return;
    }

    ImGui::Text("Animation");
    ImGui::Separator();
    ImGui::Checkbox("Paused", &settings.paused);
    if (ImGui::IsItemHovered()) ImGui::SetTooltip("Freeze the rotation (SPACE)");
    ImGui::SliderFloat("Angular Speed (rad/s)", &settings.angularSpeed, 0.0f, 4.0f, "%.2f");

    ImGui::Separator();
    ImGui::Text("Camera");
    ImGui::Separator();
    ImGui::SliderFloat("Field of View (deg)", &settings.fieldOfViewDeg, 10.0f, 120.0f, "%.0f");
    ImGui::DragFloat3("Offset", &settings.cameraOffset.x, 0.01f, -20.0f, 20.0f, "%.2f");
    if (ImGui::IsItemHovered()) ImGui::SetTooltip("Translation applied after the spin; keep z negative to stay in front of the camera");
    // keep 0 < near < far
    ImGui::DragFloat("Near Plane", &settings.nearPlane, 0.01f, 0.01f, settings.farPlane - 0.01f, "%.2f");
    ImGui::DragFloat("Far Plane", &settings.farPlane, 1.0f, settings.nearPlane + 0.01f, 1000.0f, "%.1f");

    ImGui::Separator();
    ImGui::Text("Presentation");
    ImGui::Separator();
    ImGui::ColorEdit3("Background", &settings.clearColor.x);
    ImGui::Checkbox("V-Sync (MAILBOX/FIFO)", &settings.vsyncEnabled);
    if (ImGui::IsItemHovered()) ImGui::SetTooltip("When disabled, uses IMMEDIATE mode for uncapped FPS (may cause tearing)");

    ImGui::Separator();
    if (ImGui::Button("Reset to Defaults")) {
        settings.resetToDefaults();
    }

    ImGui::End();
}
