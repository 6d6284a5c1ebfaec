#pragma once

#include <string>
#include <mutex>
#include <map>
#include <memory>
#include <thread>
#include <sstream>
#include <iostream>
#include <iomanip>
#include <fstream>
#include <type_traits>

enum class LogLevel {
    DBG,
    INF,
    WRN,
    ERR
};

class ThreadNamer {
public:
    static void setThreadName(const std::string& name);
    static std::string getThreadName();
    static void forgetThread();
    static size_t namedThreadCount();

private:
    static std::mutex _mutex;
    static std::map<std::thread::id, std::string> _thread_names;
};

// Names the calling thread until the end of the scope. Pool and listener
// threads use it so their entries do not outlive the work.
class ScopedThreadName {
public:
    explicit ScopedThreadName(const std::string& name) { ThreadNamer::setThreadName(name); }
    ~ScopedThreadName() { ThreadNamer::forgetThread(); }

    ScopedThreadName(const ScopedThreadName&) = delete;
    ScopedThreadName& operator=(const ScopedThreadName&) = delete;
};

class Logger {
public:
    static Logger& get();

    bool addLogFile(const std::string& name, const std::string& filename);
    void removeLogFile(const std::string& name);
    void setConsoleLogging(bool enable);

    void setGlobalLogLevel(LogLevel level);
    void setLogLevelFor(const std::string& logName, LogLevel level);

    void log(LogLevel level, const std::string& component, const std::string& message);

    template<typename... Args>
    void log(LogLevel level, const std::string& component, const std::string& format, Args&&... args) {
        if (level < _global_level) return;

        int needed = snprintf(nullptr, 0, format.c_str(), convertArg(std::forward<Args>(args))...);
        if (needed < 0) {
            output(formatMessage(level, component, format), level);
            return;
        }
        size_t size = static_cast<size_t>(needed) + 1;
        std::unique_ptr<char[]> buf(new char[size]);
        snprintf(buf.get(), size, format.c_str(), convertArg(std::forward<Args>(args))...);
        std::string message(buf.get(), buf.get() + size - 1);

        std::string formatted = formatMessage(level, component, message);
        output(formatted, level);
    }

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

private:
    Logger() = default;
    ~Logger();

    std::string formatMessage(LogLevel level, const std::string& component, const std::string& message);
    std::string levelToString(LogLevel level);
    std::string getTimestamp();

    void output(const std::string& formatted, LogLevel level);

    template<typename T>
    auto convertArg(T&& arg) -> decltype(auto) {
        if constexpr (std::is_same_v<std::decay_t<T>, std::string>) {
            return arg.c_str();
        }
        else {
            return std::forward<T>(arg);
        }
    }

    struct LogDestination {
        std::ofstream stream;
        LogLevel level;
    };

    std::mutex _mutex;
    std::map<std::string, LogDestination> _logs;
    bool _console_enabled = false;
    LogLevel _global_level = LogLevel::DBG;
};

#if OAUTH_LOOPBACK_LOGGING_ENABLED
#define LOG_DEBUG(component, ...)           Logger::get().log(LogLevel::DBG, component, __VA_ARGS__)
#define LOG_INFO(component, ...)            Logger::get().log(LogLevel::INF, component, __VA_ARGS__)
#define LOG_WARNING(component, ...)         Logger::get().log(LogLevel::WRN, component, __VA_ARGS__)
#define LOG_ERROR(component, ...)           Logger::get().log(LogLevel::ERR, component, __VA_ARGS__)
#else
#define LOG_DEBUG(...)
#define LOG_INFO(...)
#define LOG_WARNING(...)
#define LOG_ERROR(...)
#endif
