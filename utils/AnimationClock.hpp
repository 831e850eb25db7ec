#pragma once

// Elapsed animation time. Paused time is not counted, so resuming continues
// from the same pose instead of jumping.
class AnimationClock {
public:
    AnimationClock() = default;

    // Adds deltaSeconds unless paused. Negative deltas are ignored.
    void advance(double deltaSeconds);
    double elapsed() const;

    void setPaused(bool paused);
    void togglePaused();
    bool isPaused() const;

    void reset();

private:
    double elapsedSeconds = 0.0;
    bool paused = false;
};
