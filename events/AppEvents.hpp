#pragma once

#include "Event.hpp"
#include <string>

// ESC: close the main window and leave the render loop
class CloseWindowEvent : public Event {
public:
    std::string name() const override { return "CloseWindowEvent"; }
};

// F11: switch between windowed and fullscreen on the primary monitor
class ToggleFullscreenEvent : public Event {
public:
    std::string name() const override { return "ToggleFullscreenEvent"; }
};

// SPACE: freeze or resume the house rotation
class PauseAnimationEvent : public Event {
public:
    std::string name() const override { return "PauseAnimationEvent"; }
};

// R: restart the rotation from angle 0
class ResetAnimationEvent : public Event {
public:
    std::string name() const override { return "ResetAnimationEvent"; }
};
