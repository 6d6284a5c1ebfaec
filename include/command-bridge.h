#pragma once

#include "redirect-event.h"
#include "session-registry.h"

#include <nlohmann/json.hpp>

#include <string>

// JSON front door for hosts that drive the registry through messages
// instead of C++ calls.
//
//   start   {"config": {...}}   -> {"port": N}
//   cancel  {"port": N}         -> {"cancelled": N}
class CommandBridge {
public:
    explicit CommandBridge(SessionRegistry& registry);

    // Throws ConfigError for unknown commands and bad arguments, and
    // whatever the registry throws.
    nlohmann::json invoke(const std::string& command, const nlohmann::json& args);

    // {"id": .., "cmd": .., "args": {..}} -> {"id": .., "result": ..} or
    // {"id": .., "error": {"kind": .., "message": .., "ports": [..]}}.
    // Never throws for bad input.
    std::string handleLine(const std::string& line);

    static nlohmann::json eventToJson(const RedirectEvent& event);

    // One line of the event stream, invalid UTF-8 replaced.
    static std::string eventLine(const RedirectEvent& event);

private:
    SessionRegistry& _registry;
};
