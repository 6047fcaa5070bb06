#include "GameConfig.hpp"
#include <json/json.h>
#include <fstream>
#include <iostream>
#include <memory>
#include <stdexcept>

namespace {

uint32_t readExtent(const Json::Value& root, const char* key, uint32_t fallback) {
    const Json::Value& value = root[key];
    if (!value.isIntegral()) return fallback;
    Json::Int64 n = value.asInt64();
    if (n <= 0 || n > static_cast<Json::Int64>(UINT32_MAX)) return fallback;
    return static_cast<uint32_t>(n);
}

}

GameConfig GameConfig::fromJson(const Json::Value& root) {
    GameConfig config;
    if (!root.isObject()) return config;

    if (root["fullscreen"].isBool()) {
        config.fullscreen = root["fullscreen"].asBool();
    }
    if (root["monitor"].isString()) {
        config.monitor = root["monitor"].asString();
    }
    if (root["mouse_sensitivity"].isNumeric()) {
        config.mouseSensitivity = root["mouse_sensitivity"].asFloat();
    }
    config.width = readExtent(root, "width", DEFAULT_WIDTH);
    config.height = readExtent(root, "height", DEFAULT_HEIGHT);
    return config;
}

Json::Value GameConfig::toJson() const {
    Json::Value root(Json::objectValue);
    root["fullscreen"] = fullscreen;
    root["monitor"] = monitor ? Json::Value(*monitor) : Json::Value(Json::nullValue);
    root["mouse_sensitivity"] = mouseSensitivity;
    root["width"] = width;
    root["height"] = height;
    return root;
}

GameConfig GameConfig::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        std::cerr << "[GameConfig] " << path << " not found, using defaults" << std::endl;
        return GameConfig();
    }

    Json::CharReaderBuilder builder;
    Json::Value root;
    std::string errors;
    if (!Json::parseFromStream(builder, file, &root, &errors)) {
        std::cerr << "[GameConfig] failed to parse " << path << ": " << errors << std::endl;
        return GameConfig();
    }
    return fromJson(root);
}

void GameConfig::save(const std::string& path) const {
    std::ofstream file(path, std::ios::trunc);
    if (!file.is_open()) {
        throw std::runtime_error("failed to open config file for writing: " + path);
    }

    Json::StreamWriterBuilder builder;
    builder["indentation"] = "  ";
    std::unique_ptr<Json::StreamWriter> writer(builder.newStreamWriter());
    writer->write(toJson(), &file);
    file << "\n";
    if (!file) {
        throw std::runtime_error("failed to write config file: " + path);
    }
}
