#include "http-server.h"
#include "http-responder.h"
#include "port-selector.h"
#include "redirect-parser.h"
#include "logger.h"
#include "utils.h"

#include <algorithm>
#include <chrono>
#include <stdexcept>

LocalHttpServer::LocalHttpServer(ServerConfig config, EventHub& events)
    : _config(std::move(config)), _body(buildResponseBody(_config)), _events(events)
{
    _config.validate();
    installHandlers();
}

LocalHttpServer::~LocalHttpServer() {
    stopListening();
}

void LocalHttpServer::installHandlers() {
    applyListenerSocketOptions(_svr);

    // One request per connection, one outcome per connection.
    _svr.set_keep_alive_max_count(1);
    if (_config.io_timeout) {
        _svr.set_read_timeout(*_config.io_timeout);
        _svr.set_write_timeout(*_config.io_timeout);
        // Also bounds the wait for the first request; httplib counts it in
        // whole seconds.
        auto idle = std::chrono::ceil<std::chrono::seconds>(*_config.io_timeout);
        _svr.set_keep_alive_timeout(static_cast<time_t>(std::max<std::chrono::seconds::rep>(1, idle.count())));
    }

    _svr.new_task_queue = [this] {
        return new SequencedTaskQueue(*_sequencer, _config.workers);
    };

    httplib::Server::Handler handler = [this](const httplib::Request& req, httplib::Response& res) {
        handleRequest(req, res);
    };
    _svr.Get(".*", handler);
    _svr.Post(".*", handler);
    _svr.Put(".*", handler);
    _svr.Patch(".*", handler);
    _svr.Delete(".*", handler);
    _svr.Options(".*", handler);

    httplib::Server::HandlerWithResponse on_error = [this](const httplib::Request& req, httplib::Response& res) {
        handleHttpError(req, res);
        return httplib::Server::HandlerResponse::Handled;
    };
    _svr.set_error_handler(on_error);

    _svr.set_exception_handler([this](const httplib::Request& req, httplib::Response& res, std::exception_ptr ep) {
        std::string what = "unknown error";
        try {
            if (ep) {
                std::rethrow_exception(ep);
            }
        }
        catch (const std::exception& e) {
            what = e.what();
        }
        catch (...) {
            what = "non-standard exception";
        }
        LOG_ERROR("LocalHttpServer", "Request handling on port %d threw: %s", _port, what);
        writeRedirectResponse(res, _body);
        submit(InvalidRedirect{ _port, "connection error: " + what, makeSnippet(req.method + " " + req.target) });
        });
}

void LocalHttpServer::handleRequest(const httplib::Request& req, httplib::Response& res) {
    RedirectOutcome outcome = parseRedirect(redirectRequestFrom(req), _port, _config.capture_fragment);
    writeRedirectResponse(res, _body);

    if (auto captured = std::get_if<CapturedRedirect>(&outcome)) {
        LOG_INFO("LocalHttpServer", "Captured redirect on port %d with %zu parameters",
            _port, captured->params.size());
        submit(std::move(*captured));
    }
    else {
        auto& invalid = std::get<InvalidRedirect>(outcome);
        LOG_WARNING("LocalHttpServer", "Invalid redirect on port %d: %s", _port, invalid.reason);
        submit(std::move(invalid));
    }
}

// Requests httplib refuses before routing (bad request line, unknown method,
// oversized target) still get the normal page and an invalid event.
void LocalHttpServer::handleHttpError(const httplib::Request& req, httplib::Response& res) {
    std::string reason;
    switch (res.status) {
    case 400: reason = "malformed HTTP request"; break;
    case 404:
    case 405: reason = "unsupported method '" + req.method + "'"; break;
    case 413: reason = "request too large"; break;
    case 414: reason = "request URI too long"; break;
    default:  reason = "HTTP error " + std::to_string(res.status); break;
    }
    LOG_WARNING("LocalHttpServer", "Invalid redirect on port %d: %s", _port, reason);

    writeRedirectResponse(res, _body);
    submit(InvalidRedirect{ _port, std::move(reason), makeSnippet(req.method + " " + req.target) });
}

void LocalHttpServer::submit(RedirectEvent event) {
    auto ticket = CaptureSequencer::currentTicket();
    if (ticket && _sequencer) {
        _sequencer->record(*ticket, std::move(event));
    }
    else {
        _events.publish(std::move(event));
    }
}

void LocalHttpServer::setOnFatal(std::function<void(const std::string&)> cb) {
    _on_fatal = std::move(cb);
}

int LocalHttpServer::startListening() {
    std::lock_guard lock(_mtx);
    if (_running.load(std::memory_order_acquire)) {
        LOG_WARNING("LocalHttpServer", "startListening called but server already running on port %d", _port);
        return _port;
    }
    if (_listener_thread || _stopping.load()) {
        throw std::logic_error("a stopped LocalHttpServer cannot be restarted");
    }

    _port = bindFirstAvailable(_svr, kLoopbackHost, _config.ports);
    _sequencer = std::make_unique<CaptureSequencer>(_port, _events);

    LOG_INFO("LocalHttpServer", "Starting listening on http://%s:%d", kLoopbackHost, _port);
    _running.store(true, std::memory_order_release);
    _listener_thread = std::make_unique<std::thread>(&LocalHttpServer::listenLoop, this);
    _svr.wait_until_ready();
    return _port;
}

void LocalHttpServer::listenLoop() {
    ScopedThreadName name("Listener:" + std::to_string(_port));
    bool clean = _svr.listen_after_bind();
    _running.store(false, std::memory_order_release);

    if (!clean && !_stopping.load(std::memory_order_acquire)) {
        std::string reason = "listening socket on port " + std::to_string(_port) + " failed unexpectedly";
        LOG_ERROR("LocalHttpServer", "%s", reason);
        _events.publish(ListenerFailure{ _port, reason });
        if (_on_fatal) {
            _on_fatal(reason);
        }
    }
}

void LocalHttpServer::stopListening() {
    std::lock_guard lock(_mtx);
    if (!_listener_thread) {
        return;
    }
    _stopping.store(true, std::memory_order_release);
    LOG_INFO("LocalHttpServer", "Stopping server on port %d", _port);
    _svr.stop();
    if (_listener_thread->joinable()) {
        _listener_thread->join();
    }
    _listener_thread.reset();
    _running.store(false, std::memory_order_release);
}

int LocalHttpServer::getPort() const {
    return _port;
}

bool LocalHttpServer::isRunning() const {
    return _running.load(std::memory_order_acquire);
}
