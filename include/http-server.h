#pragma once

#include "capture-sequencer.h"
#include "event-hub.h"
#include "server-config.h"

#include <httplib.h>

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

// One bound loopback listener: binds per ServerConfig, runs the httplib
// accept loop on its own thread, answers every request with the configured
// page and turns each connection into exactly one redirect event.
class LocalHttpServer {
public:
    LocalHttpServer(ServerConfig config, EventHub& events);
    ~LocalHttpServer();

    LocalHttpServer(const LocalHttpServer&) = delete;
    LocalHttpServer& operator=(const LocalHttpServer&) = delete;

    // Binds and starts accepting. Returns once the accept loop is running.
    // Throws BindError, in which case nothing stays bound.
    int startListening();

    // Stops accepting, closes the socket and waits for connections already
    // accepted to be answered. Idempotent.
    void stopListening();

    // Called once from the listener thread if the socket dies on its own.
    void setOnFatal(std::function<void(const std::string&)> cb);

    int getPort() const;
    bool isRunning() const;

private:
    void installHandlers();
    void handleRequest(const httplib::Request& req, httplib::Response& res);
    void handleHttpError(const httplib::Request& req, httplib::Response& res);
    void submit(RedirectEvent event);
    void listenLoop();

    const ServerConfig _config;
    const std::string _body;
    EventHub& _events;

    httplib::Server _svr;
    std::unique_ptr<CaptureSequencer> _sequencer;

    std::function<void(const std::string&)> _on_fatal;

    std::unique_ptr<std::thread> _listener_thread;
    std::mutex _mtx;
    std::atomic<bool> _running{ false };
    std::atomic<bool> _stopping{ false };
    int _port = 0;
};
