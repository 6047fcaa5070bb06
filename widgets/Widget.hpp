#pragma once

#include <string>

// Base class for the tool windows listed under the "Windows" menu
class Widget {
public:
    explicit Widget(const std::string& title, bool open = false);
    virtual ~Widget() = default;

    // Called every frame while visible, between ImGui::NewFrame and ImGui::Render
    virtual void render() = 0;

    bool isVisible() const { return isOpen; }
    void setVisible(bool visible) { isOpen = visible; }
    void toggle() { isOpen = !isOpen; }

    const std::string& getTitle() const { return title; }

protected:
    std::string title;
    bool isOpen;
};
