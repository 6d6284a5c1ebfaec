#include <gtest/gtest.h>
#include <httplib.h>

#include "session-registry.h"
#include "errors.h"
#include "EventCollector.h"
#include "ListenerSocket.h"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <future>
#include <set>
#include <thread>
#include <vector>

using namespace std::chrono_literals;

class SessionRegistryIntegrationTest : public ::testing::Test {
protected:
    void TearDown() override {
        registry.shutdown();
        events.waitUntilIdle();
    }

    // A port that was bindable a moment ago.
    int freePort() {
        int port = registry.start();
        registry.cancel(port);
        return port;
    }

    static bool refuses(int port) {
        httplib::Client cli(kLoopbackHost, port);
        cli.set_connection_timeout(500ms);
        return !cli.Get("/?code=nobody-home");
    }

    EventHub events;
    EventCollector collector{ events };
    SessionRegistry registry{ events };
};

TEST_F(SessionRegistryIntegrationTest, StartReturnsPortFromList) {
    int first = freePort();
    int second = freePort();

    int port = registry.start(ServerConfig{ { first, second } });
    EXPECT_TRUE(port == first || port == second);
    EXPECT_TRUE(registry.isActive(port));
    EXPECT_EQ(registry.activePorts(), std::vector<int>{ port });
    EXPECT_EQ(registry.size(), 1u);
}

TEST_F(SessionRegistryIntegrationTest, OccupiedCandidateIsSkipped) {
    int occupied = registry.start();
    int free_port = freePort();

    int port = registry.start(ServerConfig{ { occupied, free_port } });
    EXPECT_EQ(port, free_port);
    EXPECT_EQ(registry.size(), 2u);
}

TEST_F(SessionRegistryIntegrationTest, AllCandidatesOccupiedLeavesRegistryUnchanged) {
    int a = registry.start();
    int b = registry.start();
    auto before = registry.activePorts();

    try {
        registry.start(ServerConfig{ { a, b } });
        FAIL() << "expected BindError";
    }
    catch (const BindError& e) {
        EXPECT_EQ(e.ports(), (std::vector<int>{ a, b }));
    }
    EXPECT_EQ(registry.activePorts(), before);
}

TEST_F(SessionRegistryIntegrationTest, CapturesCodeAndState) {
    int port = registry.start();

    httplib::Client cli(kLoopbackHost, port);
    auto res = cli.Get("/?code=abc&state=xyz");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 200);

    ASSERT_TRUE(collector.waitFor(1));
    auto captured = collector.eventsOf<CapturedRedirect>();
    ASSERT_EQ(captured.size(), 1u);
    EXPECT_EQ(captured[0].port, port);
    EXPECT_EQ(captured[0].params, (QueryParams{ {"code", "abc"}, {"state", "xyz"} }));
    EXPECT_EQ(captured[0].url, "http://127.0.0.1:" + std::to_string(port) + "/?code=abc&state=xyz");
}

TEST_F(SessionRegistryIntegrationTest, InvalidRequestsStillAnswer200) {
    int port = registry.start();

    httplib::Client cli(kLoopbackHost, port);
    auto no_query = cli.Get("/callback");
    auto post = cli.Post("/?code=abc", "", "text/plain");
    auto del = cli.Delete("/?code=abc");
    ASSERT_TRUE(no_query);
    ASSERT_TRUE(post);
    ASSERT_TRUE(del);
    EXPECT_EQ(no_query->status, 200);
    EXPECT_EQ(post->status, 200);
    EXPECT_EQ(del->status, 200);

    ASSERT_TRUE(collector.waitFor(3));
    auto invalid = collector.eventsOf<InvalidRedirect>();
    ASSERT_EQ(invalid.size(), 3u);
    EXPECT_EQ(invalid[0].reason, "missing query string");
    EXPECT_EQ(invalid[1].reason, "unsupported method 'POST'");
    EXPECT_EQ(invalid[2].reason, "unsupported method 'DELETE'");
    EXPECT_TRUE(collector.eventsOf<CapturedRedirect>().empty());
}

TEST_F(SessionRegistryIntegrationTest, CancelReleasesPort) {
    int port = registry.start();
    registry.cancel(port);

    EXPECT_FALSE(registry.isActive(port));
    EXPECT_EQ(registry.size(), 0u);
    EXPECT_TRUE(refuses(port));

    EXPECT_EQ(registry.start(ServerConfig{ { port } }), port);
}

TEST_F(SessionRegistryIntegrationTest, CancelUnknownPortIsNotRunning) {
    int port = registry.start();
    int other = freePort();

    try {
        registry.cancel(other);
        FAIL() << "expected NotRunning";
    }
    catch (const NotRunning& e) {
        EXPECT_EQ(e.port(), other);
    }
    EXPECT_TRUE(registry.isActive(port));

    httplib::Client cli(kLoopbackHost, port);
    auto res = cli.Get("/?code=still-here");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 200);
}

TEST_F(SessionRegistryIntegrationTest, CancelTwiceIsNotRunning) {
    int port = registry.start();
    registry.cancel(port);
    EXPECT_THROW(registry.cancel(port), NotRunning);
}

TEST_F(SessionRegistryIntegrationTest, ConcurrentEphemeralStartsGetDistinctPorts) {
    constexpr int kStarts = 8;
    std::vector<std::future<int>> futures;
    for (int i = 0; i < kStarts; ++i) {
        futures.push_back(std::async(std::launch::async, [this] {
            return registry.start();
            }));
    }

    std::set<int> ports;
    for (auto& f : futures) {
        ports.insert(f.get());
    }
    EXPECT_EQ(ports.size(), static_cast<size_t>(kStarts));
    EXPECT_EQ(registry.size(), static_cast<size_t>(kStarts));
}

TEST_F(SessionRegistryIntegrationTest, ConcurrentCancelsOfOnePortAllSucceed) {
    int port = registry.start();

    constexpr int kCancels = 6;
    std::atomic<int> ok{ 0 };
    std::atomic<int> not_running{ 0 };
    std::vector<std::thread> threads;
    for (int i = 0; i < kCancels; ++i) {
        threads.emplace_back([&] {
            try {
                registry.cancel(port);
                ++ok;
            }
            catch (const NotRunning&) {
                ++not_running;
            }
            });
    }
    for (auto& t : threads) {
        t.join();
    }

    // Callers that arrived after removal see NotRunning, the rest succeed.
    EXPECT_GE(ok.load(), 1);
    EXPECT_EQ(ok.load() + not_running.load(), kCancels);
    EXPECT_FALSE(registry.isActive(port));
    EXPECT_TRUE(refuses(port));
    EXPECT_EQ(registry.start(ServerConfig{ { port } }), port);
}

TEST_F(SessionRegistryIntegrationTest, CustomResponseIsVerbatimForValidAndInvalid) {
    ServerConfig config;
    config.response = "<html><body>All done &amp; dusted</body></html>";
    int port = registry.start(config);

    httplib::Client cli(kLoopbackHost, port);
    auto valid = cli.Get("/?code=abc");
    auto invalid = cli.Get("/");
    ASSERT_TRUE(valid);
    ASSERT_TRUE(invalid);
    EXPECT_EQ(valid->body, *config.response);
    EXPECT_EQ(invalid->body, *config.response);
}

TEST_F(SessionRegistryIntegrationTest, EventsFollowRequestOrder) {
    int port = registry.start();

    httplib::Client cli(kLoopbackHost, port);
    for (int i = 0; i < 10; ++i) {
        auto res = cli.Get("/?n=" + std::to_string(i));
        ASSERT_TRUE(res);
    }

    ASSERT_TRUE(collector.waitFor(10));
    auto captured = collector.eventsOf<CapturedRedirect>();
    ASSERT_EQ(captured.size(), 10u);
    for (int i = 0; i < 10; ++i) {
        EXPECT_EQ(captured[i].params.at("n"), std::to_string(i));
    }
}

TEST_F(SessionRegistryIntegrationTest, SessionsAreIndependent) {
    int a = registry.start();
    int b = registry.start();
    registry.cancel(a);

    EXPECT_TRUE(refuses(a));
    httplib::Client cli(kLoopbackHost, b);
    auto res = cli.Get("/?code=b");
    ASSERT_TRUE(res);

    ASSERT_TRUE(collector.waitFor(1));
    EXPECT_EQ(collector.eventsOf<CapturedRedirect>()[0].port, b);
}

TEST_F(SessionRegistryIntegrationTest, ShutdownReleasesEveryPortAndRefusesStarts) {
    std::vector<int> ports{ registry.start(), registry.start(), registry.start() };
    registry.shutdown();

    EXPECT_EQ(registry.size(), 0u);
    for (int port : ports) {
        EXPECT_TRUE(refuses(port));
    }
    EXPECT_THROW(registry.start(), std::logic_error);
    EXPECT_NO_THROW(registry.shutdown());
}

TEST_F(SessionRegistryIntegrationTest, InvalidConfigIsRejectedBeforeBinding) {
    ServerConfig config;
    config.ports = { 0 };
    EXPECT_THROW(registry.start(config), ConfigError);
    EXPECT_EQ(registry.size(), 0u);
}

TEST_F(SessionRegistryIntegrationTest, ListenerFailureRetiresSession) {
    int port = registry.start();
    int other = registry.start();

    ASSERT_TRUE(breakListeningSocket(port));

    ASSERT_TRUE(collector.waitFor(1));
    auto failures = collector.eventsOf<ListenerFailure>();
    ASSERT_EQ(failures.size(), 1u);
    EXPECT_EQ(failures[0].port, port);

    // The event goes out before the registry hears about the failure.
    auto deadline = std::chrono::steady_clock::now() + 3s;
    while (registry.isActive(port) && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(10ms);
    }
    EXPECT_FALSE(registry.isActive(port));
    EXPECT_EQ(registry.activePorts(), std::vector<int>{ other });
    EXPECT_THROW(registry.cancel(port), NotRunning);

    EXPECT_EQ(registry.start(ServerConfig{ { port } }), port);
    httplib::Client cli(kLoopbackHost, port);
    auto res = cli.Get("/?code=again");
    ASSERT_TRUE(res);

    ASSERT_TRUE(collector.waitFor(2));
    events.waitUntilIdle();
    EXPECT_EQ(collector.eventsOf<ListenerFailure>().size(), 1u);
    auto captured = collector.eventsOf<CapturedRedirect>();
    ASSERT_EQ(captured.size(), 1u);
    EXPECT_EQ(captured[0].port, port);
}

TEST(SessionRegistryLifetimeTest, DestructorCancelsRemainingSessions) {
    EventHub events;
    int port = 0;
    {
        SessionRegistry registry(events);
        port = registry.start();
    }
    httplib::Client cli(kLoopbackHost, port);
    cli.set_connection_timeout(500ms);
    EXPECT_FALSE(cli.Get("/?code=late"));
}
