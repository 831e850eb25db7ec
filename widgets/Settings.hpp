#pragma once

#include <glm/glm.hpp>

// Runtime tunables, edited live from SettingsWidget.
class Settings {
public:
    Settings() { resetToDefaults(); }

    void resetToDefaults() {
        angularSpeed = 0.5f;
        fieldOfViewDeg = 45.0f;
        nearPlane = 0.1f;
        farPlane = 100.0f;
        cameraOffset = glm::vec3(0.0f, -0.2f, -3.0f);
        clearColor = glm::vec3(0.1f, 0.1f, 0.15f);
        vsyncEnabled = true;
        paused = false;
    }

    // Animation
    float angularSpeed;   // radians per second
    bool paused;

    // Camera
    float fieldOfViewDeg;
    float nearPlane;
    float farPlane;
    glm::vec3 cameraOffset; // translation applied after the spin

    // Presentation
    glm::vec3 clearColor;
    bool vsyncEnabled;
};
