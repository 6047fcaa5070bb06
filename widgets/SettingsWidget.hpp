#pragma once

#include "Widget.hpp"

class Game;

// Live tuning of the fur technique and input settings
class SettingsWidget : public Widget {
public:
    explicit SettingsWidget(Game& game);

    void render() override;

private:
    Game& game;
};
