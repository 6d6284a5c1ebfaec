#include "utils.h"
#include "errors.h"

#include <cerrno>
#include <cstdlib>

const char* to_cstr(SessionState state) {
    switch (state)
    {
    case SessionState::Active: return "Active";
    case SessionState::Stopping: return "Stopping";
    case SessionState::Stopped: return "Stopped";
    default: return "Unknown";
    }
}

std::string_view to_string(SessionState state) {
    return to_cstr(state);
}

std::string joinPorts(const std::vector<int>& ports) {
    std::string out;
    for (size_t i = 0; i < ports.size(); ++i) {
        if (i > 0) {
            out += ", ";
        }
        out += std::to_string(ports[i]);
    }
    return out;
}

bool isValidPort(long long port) noexcept {
    return port >= 1 && port <= 65535;
}

std::vector<int> parsePortList(std::string_view text) {
    std::vector<int> ports;
    if (text.empty()) {
        return ports;
    }
    size_t start = 0;
    while (start <= text.size()) {
        size_t comma = text.find(',', start);
        if (comma == std::string_view::npos) {
            comma = text.size();
        }
        std::string item(text.substr(start, comma - start));
        if (item.empty()) {
            throw ConfigError("empty entry in port list '" + std::string(text) + "'");
        }
        char* end = nullptr;
        errno = 0;
        long long value = std::strtoll(item.c_str(), &end, 10);
        if (errno != 0 || end == item.c_str() || *end != '\0' || !isValidPort(value)) {
            throw ConfigError("invalid port '" + item + "'");
        }
        ports.push_back(static_cast<int>(value));
        start = comma + 1;
    }
    return ports;
}

bool isValidUtf8(std::string_view text) noexcept {
    size_t i = 0;
    while (i < text.size()) {
        auto c = static_cast<unsigned char>(text[i]);
        size_t extra = 0;
        uint32_t cp = 0;
        if (c < 0x80) {
            ++i;
            continue;
        }
        else if ((c & 0xE0) == 0xC0) {
            extra = 1;
            cp = c & 0x1F;
        }
        else if ((c & 0xF0) == 0xE0) {
            extra = 2;
            cp = c & 0x0F;
        }
        else if ((c & 0xF8) == 0xF0) {
            extra = 3;
            cp = c & 0x07;
        }
        else {
            return false;
        }
        if (i + extra >= text.size()) {
            return false;
        }
        for (size_t k = 1; k <= extra; ++k) {
            auto cc = static_cast<unsigned char>(text[i + k]);
            if ((cc & 0xC0) != 0x80) {
                return false;
            }
            cp = (cp << 6) | (cc & 0x3F);
        }
        // overlong forms, surrogates, out of range
        if ((extra == 1 && cp < 0x80) || (extra == 2 && cp < 0x800) || (extra == 3 && cp < 0x10000)
            || (cp >= 0xD800 && cp <= 0xDFFF) || cp > 0x10FFFF) {
            return false;
        }
        i += extra + 1;
    }
    return true;
}

std::string makeSnippet(std::string_view text, size_t max_length) {
    size_t eol = text.find_first_of("\r\n");
    std::string_view line = text.substr(0, eol);
    if (line.size() <= max_length) {
        return std::string(line);
    }
    return std::string(line.substr(0, max_length)) + "...";
}
