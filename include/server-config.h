#pragma once

#include <nlohmann/json.hpp>

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

constexpr const char* kLoopbackHost = "127.0.0.1";

struct ServerConfig {
    // Tried in order. Empty means "let the OS pick".
    std::vector<int> ports;

    // Body sent to the browser. Unset means the built-in page.
    std::optional<std::string> response;

    // Per-connection read/write bound. Unset keeps the HTTP library defaults.
    std::optional<std::chrono::milliseconds> io_timeout;

    size_t workers = 4;

    bool capture_fragment = false;

    void validate() const;
};

void from_json(const nlohmann::json& j, ServerConfig& config);
void to_json(nlohmann::json& j, const ServerConfig& config);

ServerConfig serverConfigFromJson(const nlohmann::json& j);

ServerConfig loadServerConfig(const std::filesystem::path& path);
