#pragma once

#include "Widget.hpp"
#include "../utils/FrameDriver.hpp"

// Lists the triangles of the last frame in draw order with their depth keys.
class DrawOrderWidget : public Widget {
public:
    explicit DrawOrderWidget(const FrameDriver& driver);

    void render() override;

private:
    const FrameDriver& driver;
};
