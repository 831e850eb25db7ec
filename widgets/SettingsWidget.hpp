#pragma once

#include "Widget.hpp"
#include "Settings.hpp"

class SettingsWidget : public Widget {
public:
    explicit SettingsWidget(Settings& settings);

    void render() override;

private:
    Settings& settings;
};
