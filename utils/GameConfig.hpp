#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace Json { class Value; }

// Window and input preferences persisted between runs as JSON
struct GameConfig {
    static constexpr uint32_t DEFAULT_WIDTH = 1920;
    static constexpr uint32_t DEFAULT_HEIGHT = 1080;
    static constexpr float DEFAULT_MOUSE_SENSITIVITY = 0.1f;

    bool fullscreen = false;
    std::optional<std::string> monitor;
    float mouseSensitivity = DEFAULT_MOUSE_SENSITIVITY; // radians per pointer unit
    uint32_t width = DEFAULT_WIDTH;
    uint32_t height = DEFAULT_HEIGHT;

    // Missing or unreadable file gives the defaults; bad fields fall back one by one
    static GameConfig load(const std::string& path);
    // Throws std::runtime_error when the file cannot be written
    void save(const std::string& path) const;

    static GameConfig fromJson(const Json::Value& root);
    Json::Value toJson() const;
};
