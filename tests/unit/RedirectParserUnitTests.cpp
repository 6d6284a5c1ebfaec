#include <gtest/gtest.h>
#include "redirect-parser.h"

#include <optional>
#include <string>

namespace {

// Fills params the way httplib does for an incoming request.
RedirectRequest request(const std::string& method, const std::string& target, const std::string& host,
    std::optional<std::string> full_url = std::nullopt) {
    RedirectRequest request{ method, target, host, {}, std::move(full_url) };
    size_t question = target.find('?');
    if (question != std::string::npos) {
        httplib::detail::parse_query_text(target.substr(question + 1), request.params);
    }
    return request;
}

RedirectRequest get(const std::string& target, const std::string& host = "127.0.0.1:8000") {
    return request("GET", target, host);
}

}

TEST(RedirectParserUnitTest, CapturesCodeAndState) {
    auto outcome = parseRedirect(get("/?code=abc&state=xyz"), 8000, false);
    ASSERT_TRUE(std::holds_alternative<CapturedRedirect>(outcome));

    auto& captured = std::get<CapturedRedirect>(outcome);
    EXPECT_EQ(captured.port, 8000);
    EXPECT_EQ(captured.url, "http://127.0.0.1:8000/?code=abc&state=xyz");
    EXPECT_EQ(captured.target, "/?code=abc&state=xyz");
    ASSERT_EQ(captured.params.size(), 2u);
    EXPECT_EQ(captured.params.at("code"), "abc");
    EXPECT_EQ(captured.params.at("state"), "xyz");
}

TEST(RedirectParserUnitTest, AcceptsAnyPath) {
    auto outcome = parseRedirect(get("/oauth/callback?code=1"), 8000, false);
    ASSERT_TRUE(std::holds_alternative<CapturedRedirect>(outcome));
    EXPECT_EQ(std::get<CapturedRedirect>(outcome).url, "http://127.0.0.1:8000/oauth/callback?code=1");
}

TEST(RedirectParserUnitTest, FallsBackToLoopbackAuthorityWithoutHost) {
    auto outcome = parseRedirect(get("/?code=1", ""), 4321, false);
    ASSERT_TRUE(std::holds_alternative<CapturedRedirect>(outcome));
    EXPECT_EQ(std::get<CapturedRedirect>(outcome).url, "http://127.0.0.1:4321/?code=1");
}

TEST(RedirectParserUnitTest, KeepsHostHeaderVerbatim) {
    auto outcome = parseRedirect(get("/?code=1", "localhost:9000"), 9000, false);
    ASSERT_TRUE(std::holds_alternative<CapturedRedirect>(outcome));
    EXPECT_EQ(std::get<CapturedRedirect>(outcome).url, "http://localhost:9000/?code=1");
}

TEST(RedirectParserUnitTest, DecodesParameters) {
    auto outcome = parseRedirect(get("/?msg=hello+world&path=%2Fa%2Fb&e=caf%C3%A9"), 8000, false);
    ASSERT_TRUE(std::holds_alternative<CapturedRedirect>(outcome));
    auto& params = std::get<CapturedRedirect>(outcome).params;
    EXPECT_EQ(params.at("msg"), "hello world");
    EXPECT_EQ(params.at("path"), "/a/b");
    EXPECT_EQ(params.at("e"), "caf\xC3\xA9");
}

TEST(RedirectParserUnitTest, RejectsNonGetMethods) {
    for (const char* method : { "POST", "PUT", "DELETE", "PATCH", "OPTIONS" }) {
        auto outcome = parseRedirect(request(method, "/?code=abc", "127.0.0.1:8000"), 8000, false);
        ASSERT_TRUE(std::holds_alternative<InvalidRedirect>(outcome)) << method;
        auto& invalid = std::get<InvalidRedirect>(outcome);
        EXPECT_EQ(invalid.port, 8000);
        EXPECT_EQ(invalid.reason, std::string("unsupported method '") + method + "'");
        EXPECT_EQ(invalid.snippet, std::string(method) + " /?code=abc");
    }
}

TEST(RedirectParserUnitTest, RejectsEmptyMethod) {
    auto outcome = parseRedirect(request("", "/?code=1", ""), 8000, false);
    ASSERT_TRUE(std::holds_alternative<InvalidRedirect>(outcome));
    EXPECT_EQ(std::get<InvalidRedirect>(outcome).reason, "malformed request line");
}

TEST(RedirectParserUnitTest, RejectsMissingQuery) {
    for (const char* target : { "/", "/callback", "/?" }) {
        auto outcome = parseRedirect(get(target), 8000, false);
        ASSERT_TRUE(std::holds_alternative<InvalidRedirect>(outcome)) << target;
        EXPECT_EQ(std::get<InvalidRedirect>(outcome).reason, "missing query string");
    }
}

TEST(RedirectParserUnitTest, RejectsAbsoluteFormTarget) {
    auto outcome = parseRedirect(get("http://evil/?code=1"), 8000, false);
    ASSERT_TRUE(std::holds_alternative<InvalidRedirect>(outcome));
    EXPECT_EQ(std::get<InvalidRedirect>(outcome).reason, "malformed request target");
}

TEST(RedirectParserUnitTest, AcceptsQueryWithoutNamedParameters) {
    for (const char* target : { "/?&&", "/?=x" }) {
        auto outcome = parseRedirect(get(target), 8000, false);
        ASSERT_TRUE(std::holds_alternative<CapturedRedirect>(outcome)) << target;
        EXPECT_TRUE(std::get<CapturedRedirect>(outcome).params.empty()) << target;
    }
}

TEST(RedirectParserUnitTest, FirstOccurrenceOfKeyWins) {
    auto outcome = parseRedirect(get("/?a=1&b&a=2"), 8000, false);
    ASSERT_TRUE(std::holds_alternative<CapturedRedirect>(outcome));
    auto& params = std::get<CapturedRedirect>(outcome).params;
    EXPECT_EQ(params, (QueryParams{ {"a", "1"}, {"b", ""} }));
}

TEST(RedirectParserUnitTest, RejectsBadEscapes) {
    for (const char* target : { "/?code=%zz", "/?code=%4", "/?code=%" }) {
        auto outcome = parseRedirect(get(target), 8000, false);
        ASSERT_TRUE(std::holds_alternative<InvalidRedirect>(outcome)) << target;
        EXPECT_EQ(std::get<InvalidRedirect>(outcome).reason.rfind("malformed query string", 0), 0u) << target;
    }
}

TEST(RedirectParserUnitTest, ReportsOffsetOfBadEscape) {
    auto outcome = parseRedirect(get("/?ok=%41&code=%zz"), 8000, false);
    ASSERT_TRUE(std::holds_alternative<InvalidRedirect>(outcome));
    EXPECT_EQ(std::get<InvalidRedirect>(outcome).reason, "malformed query string: bad percent-escape at offset 12");
}

TEST(RedirectParserUnitTest, FindMalformedEscape) {
    EXPECT_FALSE(findMalformedEscape(""));
    EXPECT_FALSE(findMalformedEscape("a=%41%2b&b=+"));
    EXPECT_EQ(findMalformedEscape("%"), 0u);
    EXPECT_EQ(findMalformedEscape("a=%4"), 2u);
    EXPECT_EQ(findMalformedEscape("a=%41%g1"), 5u);
}

TEST(RedirectParserUnitTest, RejectsInvalidUtf8AfterDecoding) {
    auto outcome = parseRedirect(get("/?code=%FF%FE"), 8000, false);
    ASSERT_TRUE(std::holds_alternative<InvalidRedirect>(outcome));
    EXPECT_EQ(std::get<InvalidRedirect>(outcome).reason, "query string is not valid UTF-8");
}

TEST(RedirectParserUnitTest, SnippetIsBounded) {
    std::string target = "/" + std::string(1000, 'a');
    auto outcome = parseRedirect(get(target), 8000, false);
    ASSERT_TRUE(std::holds_alternative<InvalidRedirect>(outcome));
    EXPECT_LE(std::get<InvalidRedirect>(outcome).snippet.size(), 256u + 3u);
}

TEST(RedirectParserUnitTest, FullUrlIgnoredUnlessFragmentCaptureIsOn) {
    auto outcome = parseRedirect(request("GET", "/cb", "127.0.0.1:8000", "http://127.0.0.1:8000/#code=abc"), 8000, false);
    ASSERT_TRUE(std::holds_alternative<InvalidRedirect>(outcome));
    EXPECT_EQ(std::get<InvalidRedirect>(outcome).reason, "missing query string");
}

TEST(RedirectParserUnitTest, FullUrlFragmentIsCaptured) {
    auto outcome = parseRedirect(request("GET", "/cb", "127.0.0.1:8000", "http://127.0.0.1:8000/done#access_token=t0k&state=s"), 8000, true);
    ASSERT_TRUE(std::holds_alternative<CapturedRedirect>(outcome));

    auto& captured = std::get<CapturedRedirect>(outcome);
    EXPECT_EQ(captured.url, "http://127.0.0.1:8000/done#access_token=t0k&state=s");
    EXPECT_EQ(captured.target, "/done#access_token=t0k&state=s");
    EXPECT_EQ(captured.params.at("access_token"), "t0k");
    EXPECT_EQ(captured.params.at("state"), "s");
}

TEST(RedirectParserUnitTest, FullUrlQueryWinsOverFragment) {
    auto outcome = parseRedirect(request("GET", "/cb", "", "http://127.0.0.1:8000/?state=q#state=f&token=t"), 8000, true);
    ASSERT_TRUE(std::holds_alternative<CapturedRedirect>(outcome));
    auto& params = std::get<CapturedRedirect>(outcome).params;
    EXPECT_EQ(params.at("state"), "q");
    EXPECT_EQ(params.at("token"), "t");
}

TEST(RedirectParserUnitTest, FullUrlWithoutFragmentIsInvalid) {
    for (const char* url : { "http://127.0.0.1:8000/", "http://127.0.0.1:8000/?code=abc", "http://127.0.0.1:8000/?code=abc#" }) {
        auto outcome = parseRedirect(request("GET", "/cb", "", url), 8000, true);
        ASSERT_TRUE(std::holds_alternative<InvalidRedirect>(outcome)) << url;
        auto& invalid = std::get<InvalidRedirect>(outcome);
        EXPECT_EQ(invalid.reason, "relayed URL carries no fragment");
        EXPECT_NE(invalid.snippet.find(std::string("Full-Url: ") + url), std::string::npos);
    }
}

TEST(RedirectParserUnitTest, FullUrlFragmentWithBadEscapeIsInvalid) {
    auto outcome = parseRedirect(request("GET", "/cb", "", "http://127.0.0.1:8000/#access_token=%z1"), 8000, true);
    ASSERT_TRUE(std::holds_alternative<InvalidRedirect>(outcome));
    EXPECT_EQ(std::get<InvalidRedirect>(outcome).reason.rfind("malformed query string", 0), 0u);
}

TEST(RedirectParserUnitTest, MalformedFullUrlIsInvalid) {
    auto outcome = parseRedirect(request("GET", "/cb", "", "not a url#x=1"), 8000, true);
    ASSERT_TRUE(std::holds_alternative<InvalidRedirect>(outcome));
    EXPECT_EQ(std::get<InvalidRedirect>(outcome).reason, "malformed Full-Url header");
}
