#include "server-config.h"
#include "errors.h"
#include "utils.h"

#include <fstream>

static constexpr size_t kMaxWorkers = 64;

void ServerConfig::validate() const {
    for (int port : ports) {
        if (!isValidPort(port)) {
            throw ConfigError("port " + std::to_string(port) + " is outside 1..65535");
        }
    }
    if (workers == 0 || workers > kMaxWorkers) {
        throw ConfigError("workers must be in 1.." + std::to_string(kMaxWorkers));
    }
    if (io_timeout && io_timeout->count() <= 0) {
        throw ConfigError("timeout must be positive");
    }
}

void from_json(const nlohmann::json& j, ServerConfig& config) {
    if (j.is_null()) {
        config = ServerConfig{};
        return;
    }
    if (!j.is_object()) {
        throw ConfigError("server config must be a JSON object");
    }

    ServerConfig parsed;
    try {
        if (j.contains("ports") && !j["ports"].is_null()) {
            const auto& ports = j["ports"];
            if (!ports.is_array()) {
                throw ConfigError("'ports' must be an array of integers");
            }
            for (const auto& p : ports) {
                if (!p.is_number_integer()) {
                    throw ConfigError("'ports' must be an array of integers");
                }
                long long value = p.get<long long>();
                if (!isValidPort(value)) {
                    throw ConfigError("port " + std::to_string(value) + " is outside 1..65535");
                }
                parsed.ports.push_back(static_cast<int>(value));
            }
        }
        if (j.contains("response") && !j["response"].is_null()) {
            parsed.response = j["response"].get<std::string>();
        }
        if (j.contains("timeoutMs") && !j["timeoutMs"].is_null()) {
            parsed.io_timeout = std::chrono::milliseconds(j["timeoutMs"].get<long long>());
        }
        if (j.contains("workers")) {
            parsed.workers = j["workers"].get<size_t>();
        }
        if (j.contains("captureFragment")) {
            parsed.capture_fragment = j["captureFragment"].get<bool>();
        }
    }
    catch (const nlohmann::json::exception& e) {
        throw ConfigError(std::string("invalid server config: ") + e.what());
    }

    parsed.validate();
    config = std::move(parsed);
}

void to_json(nlohmann::json& j, const ServerConfig& config) {
    j = nlohmann::json{
        {"ports", config.ports},
        {"workers", config.workers},
        {"captureFragment", config.capture_fragment}
    };
    j["response"] = config.response ? nlohmann::json(*config.response) : nlohmann::json(nullptr);
    j["timeoutMs"] = config.io_timeout ? nlohmann::json(config.io_timeout->count()) : nlohmann::json(nullptr);
}

ServerConfig serverConfigFromJson(const nlohmann::json& j) {
    ServerConfig config;
    from_json(j, config);
    return config;
}

ServerConfig loadServerConfig(const std::filesystem::path& path) {
    std::ifstream config_file(path);
    if (!config_file) {
        throw ConfigError("cannot open config file: " + path.string());
    }
    nlohmann::json config_json;
    try {
        config_file >> config_json;
    }
    catch (const nlohmann::json::parse_error& e) {
        throw ConfigError("config file " + path.string() + " is not valid JSON: " + e.what());
    }
    return serverConfigFromJson(config_json);
}
