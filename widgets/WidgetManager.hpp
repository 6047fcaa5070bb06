#pragma once

#include "Widget.hpp"
#include <memory>
#include <vector>

// Owns the tool windows, draws the visible ones and lists all of them in a menu
class WidgetManager {
public:
    void addWidget(std::unique_ptr<Widget> widget);

    void renderAll();
    // Must be called between BeginMainMenuBar and EndMainMenuBar
    void renderMenu();

    Widget* getWidget(const std::string& title) const;
    size_t size() const { return widgets.size(); }

private:
    std::vector<std::unique_ptr<Widget>> widgets;
};
