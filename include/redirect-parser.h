#pragma once

#include "redirect-event.h"

#include <httplib.h>

#include <optional>
#include <string>
#include <string_view>
#include <variant>

// The parts of one HTTP request the validator looks at. params holds the
// query as decoded by httplib, in request order.
struct RedirectRequest {
    std::string method;
    std::string target;
    std::string host;
    httplib::Params params;
    std::optional<std::string> full_url;
};

RedirectRequest redirectRequestFrom(const httplib::Request& req);

using RedirectOutcome = std::variant<CapturedRedirect, InvalidRedirect>;

RedirectOutcome parseRedirect(const RedirectRequest& request, int port, bool capture_fragment);

// Offset of the first '%' not followed by two hex digits, if any. httplib
// keeps such escapes verbatim instead of rejecting them.
std::optional<size_t> findMalformedEscape(std::string_view raw);
