#pragma once

#include "event-hub.h"
#include "http-server.h"
#include "server-config.h"
#include "utils.h"

#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

// Owns every running OAuth redirect listener of the process, keyed by port.
// A port is registered exactly while this process has a listener bound on it.
// Constructed by the composition root; the destructor cancels what is left.
class SessionRegistry {
public:
    explicit SessionRegistry(EventHub& events);
    ~SessionRegistry();

    SessionRegistry(const SessionRegistry&) = delete;
    SessionRegistry& operator=(const SessionRegistry&) = delete;

    // Throws ConfigError, BindError, or std::logic_error after shutdown().
    int start(const ServerConfig& config = {});

    // Throws NotRunning. A cancel racing another cancel of the same port
    // waits for the first one and succeeds too.
    void cancel(int port);

    void shutdown();

    bool isActive(int port) const;
    std::vector<int> activePorts() const;
    size_t size() const;

private:
    struct Session {
        int port = 0;
        SessionState state = SessionState::Active;
        std::unique_ptr<LocalHttpServer> server;
    };

    void stopSession(const std::shared_ptr<Session>& session);
    void onListenerFailed(const std::weak_ptr<Session>& weak, const std::string& reason);
    void reapRetired();

    EventHub& _events;

    mutable std::mutex _mutex;
    std::condition_variable _cv;
    std::map<int, std::shared_ptr<Session>> _sessions;
    std::vector<std::shared_ptr<Session>> _retired;
    bool _closed = false;
};
