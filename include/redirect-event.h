#pragma once

#include <string>
#include <unordered_map>
#include <variant>

using QueryParams = std::unordered_map<std::string, std::string>;

struct CapturedRedirect {
    int port = 0;
    std::string url;
    std::string target;
    QueryParams params;
};

struct InvalidRedirect {
    int port = 0;
    std::string reason;
    std::string snippet;
};

struct ListenerFailure {
    int port = 0;
    std::string reason;
};

using RedirectEvent = std::variant<CapturedRedirect, InvalidRedirect, ListenerFailure>;

enum class RedirectEventKind {
    Captured,
    Invalid,
    ListenerFailed
};

RedirectEventKind kindOf(const RedirectEvent& event) noexcept;

int portOf(const RedirectEvent& event) noexcept;

// Event names as seen by the host application.
const char* to_cstr(RedirectEventKind kind);
