#include "AnimationClock.hpp"

void AnimationClock::advance(double deltaSeconds) {
    if (paused || deltaSeconds <= 0.0) return;
    elapsedSeconds += deltaSeconds;
}

double AnimationClock::elapsed() const {
    return elapsedSeconds;
}

void AnimationClock::setPaused(bool p) {
    paused = p;
}

void AnimationClock::togglePaused() {
    paused = !paused;
}

bool AnimationClock::isPaused() const {
    return paused;
}

void AnimationClock::reset() {
    elapsedSeconds = 0.0;
}
