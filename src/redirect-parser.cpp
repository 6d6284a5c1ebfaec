#include "redirect-parser.h"
#include "http-responder.h"
#include "server-config.h"
#include "utils.h"

#include <cctype>

RedirectRequest redirectRequestFrom(const httplib::Request& req) {
    RedirectRequest request{ req.method, req.target, req.get_header_value("Host"), req.params, std::nullopt };
    if (req.has_header(kFullUrlHeader)) {
        request.full_url = req.get_header_value(kFullUrlHeader);
    }
    return request;
}

std::optional<size_t> findMalformedEscape(std::string_view raw) {
    for (size_t i = 0; i < raw.size(); ++i) {
        if (raw[i] != '%') {
            continue;
        }
        if (i + 2 >= raw.size()
            || !std::isxdigit(static_cast<unsigned char>(raw[i + 1]))
            || !std::isxdigit(static_cast<unsigned char>(raw[i + 2]))) {
            return i;
        }
        i += 2;
    }
    return std::nullopt;
}

static InvalidRedirect rejected(int port, const RedirectRequest& request, std::string reason) {
    std::string line = request.method + " " + request.target;
    if (request.full_url) {
        line += " (Full-Url: " + *request.full_url + ")";
    }
    return InvalidRedirect{ port, std::move(reason), makeSnippet(line) };
}

// Returns an error description, or an empty string when the raw part is
// well-formed and every decoded pair is UTF-8. Keys already present win.
static std::string collectParams(std::string_view raw, const httplib::Params& decoded, QueryParams& params) {
    if (auto offset = findMalformedEscape(raw)) {
        return "malformed query string: bad percent-escape at offset " + std::to_string(*offset);
    }
    for (auto& [key, value] : decoded) {
        if (!isValidUtf8(key) || !isValidUtf8(value)) {
            return "query string is not valid UTF-8";
        }
        params.emplace(key, value);
    }
    return {};
}

// The relay only fires when the browser saw a fragment; the query part of
// that URL was already reported by the landing request.
static RedirectOutcome parseRelayedUrl(const RedirectRequest& request, int port) {
    const std::string& url = *request.full_url;
    if (!isValidUtf8(url)) {
        return rejected(port, request, "Full-Url header is not valid UTF-8");
    }
    size_t scheme_end = url.find("://");
    if (scheme_end == std::string::npos || scheme_end == 0) {
        return rejected(port, request, "malformed Full-Url header");
    }

    size_t hash = url.find('#');
    if (hash == std::string::npos || hash + 1 == url.size()) {
        return rejected(port, request, "relayed URL carries no fragment");
    }
    size_t question = url.find('?');
    if (question != std::string::npos && question > hash) {
        question = std::string::npos;
    }

    std::string query = question == std::string::npos ? std::string{} : url.substr(question + 1, hash - question - 1);
    std::string fragment = url.substr(hash + 1);

    httplib::Params query_params;
    httplib::Params fragment_params;
    httplib::detail::parse_query_text(query, query_params);
    httplib::detail::parse_query_text(fragment, fragment_params);

    QueryParams params;
    std::string error = collectParams(query, query_params, params);
    if (error.empty()) {
        error = collectParams(fragment, fragment_params, params);
    }
    if (!error.empty()) {
        return rejected(port, request, error);
    }

    size_t path_start = url.find_first_of("/?#", scheme_end + 3);
    std::string target = path_start == std::string::npos ? "/" : url.substr(path_start);
    return CapturedRedirect{ port, url, std::move(target), std::move(params) };
}

RedirectOutcome parseRedirect(const RedirectRequest& request, int port, bool capture_fragment) {
    if (request.method.empty()) {
        return rejected(port, request, "malformed request line");
    }
    if (request.method != "GET") {
        return rejected(port, request, "unsupported method '" + request.method + "'");
    }
    if (capture_fragment && request.full_url) {
        return parseRelayedUrl(request, port);
    }
    if (request.target.empty() || request.target.front() != '/') {
        return rejected(port, request, "malformed request target");
    }

    size_t question = request.target.find('?');
    if (question == std::string::npos || question + 1 == request.target.size()) {
        return rejected(port, request, "missing query string");
    }
    std::string_view query = std::string_view(request.target).substr(question + 1);

    QueryParams params;
    std::string error = collectParams(query, request.params, params);
    if (!error.empty()) {
        return rejected(port, request, error);
    }

    std::string authority = request.host.empty()
        ? std::string(kLoopbackHost) + ":" + std::to_string(port)
        : request.host;
    return CapturedRedirect{ port, "http://" + authority + request.target, request.target, std::move(params) };
}
