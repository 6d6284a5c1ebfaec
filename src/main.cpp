#include "command-bridge.h"
#include "errors.h"
#include "event-hub.h"
#include "logger.h"
#include "session-registry.h"
#include "utils.h"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>
#include <thread>

#include <signal.h>

static std::atomic<bool> g_should_exit{ false };
static std::mutex g_out_mutex;

void on_sigint(int)
{
    g_should_exit.store(true);
}

// No SA_RESTART: a blocking read on stdin returns so the bridge loop can exit.
static void installSignalHandlers() {
    struct sigaction sa {};
    sa.sa_handler = on_sigint;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);
}

static void printLine(std::ostream& out, const std::string& line) {
    std::lock_guard lock(g_out_mutex);
    out << line << std::endl;
}

struct CliOptions {
    std::string mode;
    ServerConfig config;
    bool once = false;
    bool verbose = false;
    std::string log_file;
};

static std::string readFile(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw ConfigError("cannot open file: " + path);
    }
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

static void printUsage(const char* argv0) {
    std::cout << "Usage:\n"
        << "  " << argv0 << " --serve [--ports 8000,8001] [--config <file.json>] [--response-file <page.html>]\n"
        << "        [--timeout-ms <ms>] [--workers <n>] [--capture-fragment] [--once] [--log-file <path>] [--verbose]\n"
        << "  " << argv0 << " --bridge [--log-file <path>] [--verbose]\n";
}

static CliOptions parseArgs(int argc, char* argv[]) {
    CliOptions opts;
    opts.mode = argv[1];

    // --config is applied first so that the other flags override it.
    for (int i = 2; i + 1 < argc; ++i) {
        if (std::string(argv[i]) == "--config") {
            opts.config = loadServerConfig(argv[i + 1]);
        }
    }

    for (int i = 2; i < argc; ++i) {
        std::string arg = argv[i];
        auto value = [&]() -> std::string {
            if (i + 1 >= argc) {
                throw ConfigError("missing value for " + arg);
            }
            return argv[++i];
        };

        if (arg == "--config") {
            ++i;
        }
        else if (arg == "--ports") {
            opts.config.ports = parsePortList(value());
        }
        else if (arg == "--response-file") {
            opts.config.response = readFile(value());
        }
        else if (arg == "--timeout-ms") {
            std::string ms = value();
            try {
                opts.config.io_timeout = std::chrono::milliseconds(std::stoll(ms));
            }
            catch (const std::logic_error&) {
                throw ConfigError("invalid timeout '" + ms + "'");
            }
        }
        else if (arg == "--workers") {
            std::string n = value();
            try {
                opts.config.workers = static_cast<size_t>(std::stoul(n));
            }
            catch (const std::logic_error&) {
                throw ConfigError("invalid worker count '" + n + "'");
            }
        }
        else if (arg == "--capture-fragment") {
            opts.config.capture_fragment = true;
        }
        else if (arg == "--once") {
            opts.once = true;
        }
        else if (arg == "--log-file") {
            opts.log_file = value();
        }
        else if (arg == "--verbose") {
            opts.verbose = true;
        }
        else {
            throw ConfigError("unknown option " + arg);
        }
    }
    opts.config.validate();
    return opts;
}

static int runServe(const CliOptions& opts) {
    EventHub events;
    SessionRegistry registry(events);

    std::atomic<bool> captured{ false };
    auto url_sub = events.onUrl([&](const CapturedRedirect& redirect) {
        std::string line = "Received OAuth URL: " + redirect.url;
        for (auto& [key, value] : redirect.params) {
            line += "\n  " + key + " = " + value;
        }
        printLine(std::cout, line);
        captured.store(true);
        });
    auto invalid_sub = events.onInvalidUrl([](const InvalidRedirect& invalid) {
        printLine(std::cerr, "Received invalid OAuth URL: " + invalid.reason);
        });
    auto failure_sub = events.onListenerFailure([](const ListenerFailure& failure) {
        printLine(std::cerr, "OAuth server failed: " + failure.reason);
        g_should_exit.store(true);
        });

    int port = 0;
    try {
        port = registry.start(opts.config);
    }
    catch (const BindError& e) {
        std::cerr << "Error starting OAuth server: " << e.what() << "\n";
        return 1;
    }

    printLine(std::cout, "OAuth server started on port " + std::to_string(port));
    printLine(std::cout, "Redirect URI: http://" + std::string(kLoopbackHost) + ":" + std::to_string(port) + "/");

    while (!g_should_exit.load()) {
        if (opts.once && captured.load()) {
            break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    try {
        registry.cancel(port);
        printLine(std::cout, "Stopped server on port " + std::to_string(port));
    }
    catch (const NotRunning& e) {
        printLine(std::cerr, std::string("Error stopping server: ") + e.what());
    }
    events.finish();
    return 0;
}

static int runBridge() {
    EventHub events;
    SessionRegistry registry(events);
    CommandBridge bridge(registry);

    auto event_sub = events.subscribe([](const RedirectEvent& event) {
        printLine(std::cout, CommandBridge::eventLine(event));
        });

    std::string line;
    while (!g_should_exit.load() && std::getline(std::cin, line)) {
        if (line.empty()) {
            continue;
        }
        printLine(std::cout, bridge.handleLine(line));
    }

    LOG_INFO("Main", "Bridge input closed, shutting down");
    registry.shutdown();
    events.finish();
    return 0;
}

int main(int argc, char* argv[]) {
    installSignalHandlers();

    ThreadNamer::setThreadName("main");
    Logger::get().setConsoleLogging(false);
    Logger::get().setGlobalLogLevel(LogLevel::INF);

    if (argc < 2) {
        printUsage(argv[0]);
        return 1;
    }

    CliOptions opts;
    try {
        opts = parseArgs(argc, argv);
    }
    catch (const ConfigError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        printUsage(argv[0]);
        return 1;
    }

    if (opts.verbose) {
        Logger::get().setGlobalLogLevel(LogLevel::DBG);
        Logger::get().setConsoleLogging(true);
    }
    if (!opts.log_file.empty() && !Logger::get().addLogFile("general", opts.log_file)) {
        std::cerr << "Warning: cannot open log file " << opts.log_file << "\n";
    }

    if (opts.mode == "--serve") {
        return runServe(opts);
    }
    if (opts.mode == "--bridge") {
        return runBridge();
    }

    printUsage(argv[0]);
    return 1;
}
