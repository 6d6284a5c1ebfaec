#pragma once

#include "server-config.h"

#include <httplib.h>

#include <string>

extern const char* const kDefaultResponseHtml;

// Re-requests /cb with the full browser URL when the page URL has a
// fragment, so that fragment payloads reach the server.
extern const char* const kFragmentRelayScript;

constexpr const char* kFullUrlHeader = "Full-Url";

// With capture_fragment the relay script goes right after <head>, or in
// front of the body when the page has no head.
std::string buildResponseBody(const ServerConfig& config);

// Same response whatever the outcome, the browser never learns whether the
// capture succeeded. The server closes the connection after one request.
void writeRedirectResponse(httplib::Response& res, const std::string& body);
