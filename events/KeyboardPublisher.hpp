#pragma once

#include <GLFW/glfw3.h>

class EventManager;

// Polls GLFW key state once per frame and queues application events on the
// key-down edge:
//   ESC   -> CloseWindowEvent
//   F11   -> ToggleFullscreenEvent
//   SPACE -> PauseAnimationEvent
//   R     -> ResetAnimationEvent
class KeyboardPublisher {
public:
    KeyboardPublisher() = default;

    void update(GLFWwindow* window, EventManager* em);

private:
    // returns true only on the frame the key goes down
    static bool pressedNow(GLFWwindow* window, int key, bool &previous);

    bool escPrev = false;
    bool f11Prev = false;
    bool spacePrev = false;
    bool resetPrev = false;
};
