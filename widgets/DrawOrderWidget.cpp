#include "DrawOrderWidget.hpp"
#include <imgui.h>
#include <glm/gtc/constants.hpp>
#include <cmath>

DrawOrderWidget::DrawOrderWidget(const FrameDriver& driver) : Widget("Draw Order"), driver(driver) {
}

void DrawOrderWidget::render() {
    if (!ImGui::Begin(title.c_str(), &isOpen)) {
        ImGui::End();
        return;
    }

    const FrameState& state = driver.getState();
    float turn = std::fmod(state.rotationY, glm::two_pi<float>());
    ImGui::Text("Rotation: %.3f rad (%.1f deg)", turn, glm::degrees(turn));
    ImGui::Text("Vertices submitted: %zu", state.vertexCount);
    ImGui::Separator();

    if (ImGui::BeginTable("##order", 4, ImGuiTableFlags_Borders | ImGuiTableFlags_RowBg)) {
        ImGui::TableSetupColumn("Slot");
        ImGui::TableSetupColumn("Id");
        ImGui::TableSetupColumn("Depth");
        ImGui::TableSetupColumn("Color");
        ImGui::TableHeadersRow();

        int slot = 0;
        for (const Triangle& tri : driver.getMesh().getTriangles()) {
            ImGui::TableNextRow();
            ImGui::TableSetColumnIndex(0);
            ImGui::Text("%d", slot++);
            ImGui::TableSetColumnIndex(1);
            ImGui::Text("%u", tri.id);
            ImGui::TableSetColumnIndex(2);
            ImGui::Text("%.4f", tri.depth);
            ImGui::TableSetColumnIndex(3);
            ImGui::PushID(static_cast<int>(tri.id));
            ImGui::ColorButton("##c", ImVec4(tri.color.r, tri.color.g, tri.color.b, 1.0f), ImGuiColorEditFlags_NoTooltip, ImVec2(24, 12));
            ImGui::PopID();
        }
        ImGui::EndTable();
    }

    ImGui::End();
}
