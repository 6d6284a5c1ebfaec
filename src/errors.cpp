#include "errors.h"
#include "utils.h"

const char* to_cstr(SessionErrorKind kind) {
    switch (kind)
    {
    case SessionErrorKind::BindError: return "BindError";
    case SessionErrorKind::NotRunning: return "NotRunning";
    default: return "Unknown";
    }
}

SessionError::SessionError(SessionErrorKind kind, std::vector<int> ports, const std::string& message)
    : std::runtime_error(message), _kind(kind), _ports(std::move(ports))
{
}

static std::string describeBindFailure(const std::vector<int>& candidates, const std::string& detail) {
    std::string message = candidates.empty()
        ? "could not bind an ephemeral port"
        : "could not bind any of the candidate ports [" + joinPorts(candidates) + "]";
    if (!detail.empty()) {
        message += ": " + detail;
    }
    return message;
}

BindError::BindError(std::vector<int> candidates, const std::string& detail)
    : SessionError(SessionErrorKind::BindError, candidates, describeBindFailure(candidates, detail))
{
}

NotRunning::NotRunning(int port)
    : SessionError(SessionErrorKind::NotRunning, { port }, "no oauth server is running on port " + std::to_string(port))
{
}
