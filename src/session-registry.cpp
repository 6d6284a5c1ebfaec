#include "session-registry.h"
#include "errors.h"
#include "logger.h"

#include <stdexcept>

SessionRegistry::SessionRegistry(EventHub& events)
    : _events(events)
{
}

SessionRegistry::~SessionRegistry() {
    shutdown();
}

int SessionRegistry::start(const ServerConfig& config) {
    reapRetired();
    config.validate();

    auto session = std::make_shared<Session>();
    session->server = std::make_unique<LocalHttpServer>(config, _events);
    std::weak_ptr<Session> weak = session;
    session->server->setOnFatal([this, weak](const std::string& reason) {
        onListenerFailed(weak, reason);
        });

    std::unique_lock lock(_mutex);
    if (_closed) {
        throw std::logic_error("session registry is shut down");
    }

    // Bind under the lock: the map and the set of bound ports change together.
    int port = session->server->startListening();
    session->port = port;

    auto [it, inserted] = _sessions.emplace(port, session);
    if (!inserted) {
        lock.unlock();
        LOG_ERROR("SessionRegistry", "Port %d bound while still registered to another session", port);
        session->server->stopListening();
        throw BindError({ port }, "port is owned by an active session");
    }

    LOG_INFO("SessionRegistry", "Session started on port %d (%zu active)", port, _sessions.size());
    return port;
}

void SessionRegistry::cancel(int port) {
    std::shared_ptr<Session> session;
    bool owner = false;
    {
        std::unique_lock lock(_mutex);
        auto it = _sessions.find(port);
        if (it == _sessions.end()) {
            LOG_WARNING("SessionRegistry", "cancel called but no session on port %d", port);
            throw NotRunning(port);
        }
        session = it->second;
        if (session->state == SessionState::Active) {
            session->state = SessionState::Stopping;
            owner = true;
        }
        else {
            LOG_DEBUG("SessionRegistry", "Session on port %d is %s, waiting for it to stop",
                port, to_cstr(session->state));
            _cv.wait(lock, [&] {
                return session->state == SessionState::Stopped;
                });
        }
    }

    if (owner) {
        stopSession(session);
    }
    reapRetired();
}

void SessionRegistry::shutdown() {
    std::vector<std::shared_ptr<Session>> owned;
    {
        std::lock_guard lock(_mutex);
        if (!_closed) {
            LOG_INFO("SessionRegistry", "Shutting down %zu sessions", _sessions.size());
        }
        _closed = true;
        for (auto& [port, session] : _sessions) {
            if (session->state == SessionState::Active) {
                session->state = SessionState::Stopping;
                owned.push_back(session);
            }
        }
    }

    for (auto& session : owned) {
        stopSession(session);
    }

    {
        std::unique_lock lock(_mutex);
        _cv.wait(lock, [&] {
            return _sessions.empty();
            });
    }
    reapRetired();
}

bool SessionRegistry::isActive(int port) const {
    std::lock_guard lock(_mutex);
    auto it = _sessions.find(port);
    return it != _sessions.end() && it->second->state == SessionState::Active;
}

std::vector<int> SessionRegistry::activePorts() const {
    std::lock_guard lock(_mutex);
    std::vector<int> ports;
    ports.reserve(_sessions.size());
    for (auto& [port, session] : _sessions) {
        ports.push_back(port);
    }
    return ports;
}

size_t SessionRegistry::size() const {
    std::lock_guard lock(_mutex);
    return _sessions.size();
}

void SessionRegistry::stopSession(const std::shared_ptr<Session>& session) {
    session->server->stopListening();
    {
        std::lock_guard lock(_mutex);
        session->state = SessionState::Stopped;
        auto it = _sessions.find(session->port);
        if (it != _sessions.end() && it->second == session) {
            _sessions.erase(it);
        }
    }
    _cv.notify_all();
    LOG_INFO("SessionRegistry", "Session on port %d stopped", session->port);
}

// Runs on the failing listener's own thread, so it must not join it. The
// session is parked in _retired and joined by the next reapRetired().
void SessionRegistry::onListenerFailed(const std::weak_ptr<Session>& weak, const std::string& reason) {
    auto session = weak.lock();
    if (!session) {
        return;
    }
    {
        std::lock_guard lock(_mutex);
        if (session->state != SessionState::Active) {
            return;
        }
        session->state = SessionState::Stopped;
        auto it = _sessions.find(session->port);
        if (it != _sessions.end() && it->second == session) {
            _sessions.erase(it);
        }
        _retired.push_back(session);
    }
    _cv.notify_all();
    LOG_ERROR("SessionRegistry", "Session on port %d lost its listener: %s", session->port, reason);
}

void SessionRegistry::reapRetired() {
    std::vector<std::shared_ptr<Session>> retired;
    {
        std::lock_guard lock(_mutex);
        retired.swap(_retired);
    }
    // Join before the last reference goes away, the listener thread may still
    // hold one while it returns.
    for (auto& session : retired) {
        session->server->stopListening();
    }
}
