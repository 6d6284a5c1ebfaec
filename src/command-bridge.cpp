#include "command-bridge.h"
#include "errors.h"
#include "logger.h"
#include "utils.h"

static nlohmann::json errorJson(const std::string& kind, const std::string& message, const std::vector<int>& ports = {}) {
    nlohmann::json error{
        {"kind", kind},
        {"message", message}
    };
    if (!ports.empty()) {
        error["ports"] = ports;
    }
    return error;
}

// Snippets and parse errors may carry raw request bytes.
static std::string dumpJson(const nlohmann::json& j) {
    return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

CommandBridge::CommandBridge(SessionRegistry& registry)
    : _registry(registry)
{
}

nlohmann::json CommandBridge::invoke(const std::string& command, const nlohmann::json& args) {
    if (!args.is_null() && !args.is_object()) {
        throw ConfigError("command arguments must be a JSON object");
    }

    if (command == "start") {
        ServerConfig config;
        if (args.is_object() && args.contains("config")) {
            config = serverConfigFromJson(args["config"]);
        }
        int port = _registry.start(config);
        return nlohmann::json{ {"port", port} };
    }

    if (command == "cancel") {
        if (!args.is_object() || !args.contains("port") || !args["port"].is_number_integer()) {
            throw ConfigError("cancel requires an integer 'port' argument");
        }
        long long port = args["port"].get<long long>();
        if (!isValidPort(port)) {
            throw ConfigError("port " + std::to_string(port) + " is outside 1..65535");
        }
        _registry.cancel(static_cast<int>(port));
        return nlohmann::json{ {"cancelled", port} };
    }

    throw ConfigError("unknown command '" + command + "'");
}

std::string CommandBridge::handleLine(const std::string& line) {
    nlohmann::json response;
    nlohmann::json request;
    try {
        request = nlohmann::json::parse(line);
    }
    catch (const nlohmann::json::parse_error& e) {
        response["id"] = nullptr;
        response["error"] = errorJson("ProtocolError", e.what());
        return dumpJson(response);
    }

    response["id"] = request.is_object() && request.contains("id") ? request["id"] : nlohmann::json(nullptr);
    if (!request.is_object() || !request.contains("cmd") || !request["cmd"].is_string()) {
        response["error"] = errorJson("ProtocolError", "request must be an object with a string 'cmd'");
        return dumpJson(response);
    }

    std::string command = request["cmd"].get<std::string>();
    nlohmann::json args = request.contains("args") ? request["args"] : nlohmann::json(nullptr);
    try {
        response["result"] = invoke(command, args);
    }
    catch (const SessionError& e) {
        response["error"] = errorJson(to_cstr(e.kind()), e.what(), e.ports());
    }
    catch (const ConfigError& e) {
        response["error"] = errorJson("ConfigError", e.what());
    }
    catch (const std::logic_error& e) {
        response["error"] = errorJson("ProtocolError", e.what());
    }
    LOG_DEBUG("CommandBridge", "%s -> %s", command, dumpJson(response));
    return dumpJson(response);
}

nlohmann::json CommandBridge::eventToJson(const RedirectEvent& event) {
    nlohmann::json j{
        {"event", to_cstr(kindOf(event))},
        {"port", portOf(event)}
    };
    if (auto captured = std::get_if<CapturedRedirect>(&event)) {
        j["payload"] = captured->url;
        j["params"] = captured->params;
    }
    else if (auto invalid = std::get_if<InvalidRedirect>(&event)) {
        j["payload"] = invalid->reason;
        j["snippet"] = invalid->snippet;
    }
    else if (auto failure = std::get_if<ListenerFailure>(&event)) {
        j["payload"] = failure->reason;
    }
    return j;
}

std::string CommandBridge::eventLine(const RedirectEvent& event) {
    return dumpJson(eventToJson(event));
}
