#include "KeyboardPublisher.hpp"
#include "EventManager.hpp"
#include "AppEvents.hpp"

bool KeyboardPublisher::pressedNow(GLFWwindow* window, int key, bool &previous) {
    bool now = (glfwGetKey(window, key) == GLFW_PRESS);
    bool edge = now && !previous;
    previous = now;
    return edge;
}

void KeyboardPublisher::update(GLFWwindow* window, EventManager* em) {
    if (!window || !em) return;

    if (pressedNow(window, GLFW_KEY_ESCAPE, escPrev)) {
        em->queue(make_event<CloseWindowEvent>());
    }
    if (pressedNow(window, GLFW_KEY_F11, f11Prev)) {
        em->queue(make_event<ToggleFullscreenEvent>());
    }
    if (pressedNow(window, GLFW_KEY_SPACE, spacePrev)) {
        em->queue(make_event<PauseAnimationEvent>());
    }
    if (pressedNow(window, GLFW_KEY_R, resetPrev)) {
        em->queue(make_event<ResetAnimationEvent>());
    }
}
