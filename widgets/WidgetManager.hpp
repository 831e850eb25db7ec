#pragma once

#include "Widget.hpp"
#include <vector>
#include <memory>

// Owns the tool windows and their entries in the main menu bar.
class WidgetManager {
public:
    WidgetManager() = default;

    void addWidget(std::shared_ptr<Widget> widget);

    void renderAll();
    // "Windows" menu with one checkable item per widget
    void renderMenu();

private:
    std::vector<std::shared_ptr<Widget>> widgets;
};
