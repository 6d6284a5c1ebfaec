#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

enum class SessionState : uint8_t {
    Active = 0,
    Stopping = 1,
    Stopped = 2
};

const char* to_cstr(SessionState state);

std::string_view to_string(SessionState state);

std::string joinPorts(const std::vector<int>& ports);

// "8000,8001" -> {8000, 8001}. Throws ConfigError on anything that is not a
// comma separated list of ports in 1..65535.
std::vector<int> parsePortList(std::string_view text);

bool isValidPort(long long port) noexcept;

bool isValidUtf8(std::string_view text) noexcept;

// First line of a request, truncated, for diagnostics.
std::string makeSnippet(std::string_view text, size_t max_length = 256);
