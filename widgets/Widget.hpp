#pragma once

#include <string>

// Base class for ImGui tool windows listed in the "Windows" menu.
class Widget {
public:
    explicit Widget(const std::string& title, bool startOpen = false);
    virtual ~Widget() = default;

    // Draws the window; only called while visible.
    virtual void render() = 0;

    bool isVisible() const;
    void setVisible(bool visible);
    void toggle();

    const std::string& getTitle() const;

protected:
    std::string title;
    bool isOpen;
};
