#include "http-responder.h"

#include <algorithm>
#include <cctype>

const char* const kDefaultResponseHtml =
    "<!DOCTYPE html>\n"
    "<html>\n"
    "<head><meta charset=\"utf-8\"><title>Authorization complete</title></head>\n"
    "<body><p>Authorization received. You may close this window and return to the application.</p></body>\n"
    "</html>\n";

const char* const kFragmentRelayScript =
    "<script>if(window.location.hash){fetch(\"/cb\",{headers:{\"Full-Url\":window.location.href}})}</script>";

// Position right after the opening <head ...> tag, or npos.
static size_t afterHeadTag(const std::string& body) {
    std::string lower(body);
    std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
        });
    for (size_t pos = lower.find("<head"); pos != std::string::npos; pos = lower.find("<head", pos + 5)) {
        char next = pos + 5 < lower.size() ? lower[pos + 5] : '\0';
        if (next == '>' || std::isspace(static_cast<unsigned char>(next))) {
            size_t close = lower.find('>', pos);
            return close == std::string::npos ? std::string::npos : close + 1;
        }
    }
    return std::string::npos;
}

std::string buildResponseBody(const ServerConfig& config) {
    std::string body = config.response ? *config.response : std::string(kDefaultResponseHtml);
    if (!config.capture_fragment) {
        return body;
    }
    size_t pos = afterHeadTag(body);
    if (pos == std::string::npos) {
        return std::string(kFragmentRelayScript) + body;
    }
    body.insert(pos, kFragmentRelayScript);
    return body;
}

void writeRedirectResponse(httplib::Response& res, const std::string& body) {
    res.status = 200;
    res.set_content(body, "text/html");
}
