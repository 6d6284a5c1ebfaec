#pragma once

#include <stdexcept>
#include <string>
#include <vector>

enum class SessionErrorKind {
    BindError,
    NotRunning
};

const char* to_cstr(SessionErrorKind kind);

// Session-scoped failure reported synchronously to the caller of
// SessionRegistry::start/cancel. Carries the offending port(s).
class SessionError : public std::runtime_error {
public:
    SessionError(SessionErrorKind kind, std::vector<int> ports, const std::string& message);

    SessionErrorKind kind() const noexcept { return _kind; }
    const std::vector<int>& ports() const noexcept { return _ports; }

private:
    SessionErrorKind _kind;
    std::vector<int> _ports;
};

// No candidate port could be bound. Empty ports() means the ephemeral
// request itself failed.
class BindError : public SessionError {
public:
    explicit BindError(std::vector<int> candidates, const std::string& detail = "");
};

class NotRunning : public SessionError {
public:
    explicit NotRunning(int port);

    int port() const noexcept { return ports().front(); }
};

class ConfigError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};
