#include <catch2/catch_test_macros.hpp>
#include "PolitenessGate.h"
#include "FakeHttpClient.h"

#include <atomic>
#include <thread>

using namespace site_audit;
using namespace site_audit::crawler;
using site_audit::testing::FakeHttpClient;
using namespace std::chrono_literals;

namespace {

CrawlConfig gateConfig(std::chrono::milliseconds delay = 0ms, size_t perHost = 2) {
    CrawlConfig config;
    config.seedUrl = "https://example.com/";
    config.politenessDelay = delay;
    config.perHostConcurrency = perHost;
    return config;
}

} // namespace

TEST_CASE("PolitenessGate applies robots.txt rules", "[PolitenessGate]") {
    auto client = std::make_shared<FakeHttpClient>();
    client->on("https://example.com/robots.txt",
               FakeHttpClient::text("User-agent: *\nDisallow: /private/\n"));
    auto metrics = std::make_shared<CrawlMetrics>();
    PolitenessGate gate(gateConfig(), client, metrics);

    SECTION("Disallowed paths are refused and robots.txt is fetched once") {
        REQUIRE(gate.mayFetch("https://example.com/"));
        REQUIRE_FALSE(gate.mayFetch("https://example.com/private/a"));
        REQUIRE(gate.mayFetch("https://example.com/public"));

        REQUIRE(client->requestCount("https://example.com/robots.txt") == 1);
        REQUIRE(gate.robotsState("example.com") == RobotsState::RULES_LOADED);
        REQUIRE(metrics->getTotalRequests() == 1);
    }

    SECTION("Each host gets its own robots.txt") {
        REQUIRE(gate.mayFetch("https://other.example.org/private/a"));
        REQUIRE(client->requestCount("https://other.example.org/robots.txt") == 1);
        REQUIRE(gate.robotsState("other.example.org") == RobotsState::ROBOTS_UNAVAILABLE);
        REQUIRE(gate.robotsState("example.com") == RobotsState::UNKNOWN);
    }
}

TEST_CASE("PolitenessGate falls back to allow-all when robots.txt is unavailable", "[PolitenessGate]") {
    auto client = std::make_shared<FakeHttpClient>();
    auto metrics = std::make_shared<CrawlMetrics>();

    SECTION("HTTP error") {
        client->on("https://example.com/robots.txt", FakeHttpClient::status(500));
    }

    SECTION("Transport error") {
        client->on("https://example.com/robots.txt",
                   FakeHttpClient::transportError(FetchErrorKind::TIMEOUT));
    }

    PolitenessGate gate(gateConfig(), client, metrics);
    REQUIRE(gate.mayFetch("https://example.com/anything"));
    REQUIRE(gate.robotsState("example.com") == RobotsState::ROBOTS_UNAVAILABLE);
    REQUIRE(gate.robotsUnavailableCount() == 1);
    REQUIRE(metrics->getRobotsUnavailable() == 1);
}

TEST_CASE("PolitenessGate skips robots.txt when disabled", "[PolitenessGate]") {
    auto client = std::make_shared<FakeHttpClient>();
    client->on("https://example.com/robots.txt", FakeHttpClient::text("User-agent: *\nDisallow: /\n"));
    auto config = gateConfig();
    config.respectRobotsTxt = false;
    PolitenessGate gate(config, client);

    REQUIRE(gate.mayFetch("https://example.com/secret"));
    auto permit = gate.acquire("https://example.com/secret");
    REQUIRE(permit.valid());
    REQUIRE(client->requests().empty());
}

TEST_CASE("PolitenessGate loads robots.txt once under concurrency", "[PolitenessGate]") {
    auto client = std::make_shared<FakeHttpClient>();
    client->on("https://example.com/robots.txt", FakeHttpClient::text("User-agent: *\nDisallow: /x\n"));
    client->setLatency(30ms);
    PolitenessGate gate(gateConfig(), client);

    std::atomic<int> refused{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < 4; ++i) {
        threads.emplace_back([&gate, &refused] {
            if (!gate.mayFetch("https://example.com/x")) {
                ++refused;
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    REQUIRE(client->requestCount("https://example.com/robots.txt") == 1);
    REQUIRE(refused == 4);
}

TEST_CASE("PolitenessGate uses the larger of Crawl-delay and the floor", "[PolitenessGate]") {
    auto client = std::make_shared<FakeHttpClient>();
    client->on("https://slow.example.com/robots.txt", FakeHttpClient::text("User-agent: *\nCrawl-delay: 0.2\n"));
    client->on("https://fast.example.com/robots.txt", FakeHttpClient::text("User-agent: *\nCrawl-delay: 0.001\n"));
    PolitenessGate gate(gateConfig(50ms), client);

    REQUIRE(gate.delay("unseen.example.com") == 50ms);

    gate.mayFetch("https://slow.example.com/");
    gate.mayFetch("https://fast.example.com/");
    REQUIRE(gate.delay("slow.example.com") == 200ms);
    REQUIRE(gate.delay("fast.example.com") == 50ms);
}

TEST_CASE("PolitenessGate caps a server supplied Crawl-delay", "[PolitenessGate]") {
    auto client = std::make_shared<FakeHttpClient>();
    client->on("https://example.com/robots.txt", FakeHttpClient::text("User-agent: *\nCrawl-delay: 100000\n"));
    auto config = gateConfig(10ms);
    config.maxCrawlDelay = 2000ms;
    PolitenessGate gate(config, client);

    REQUIRE(gate.mayFetch("https://example.com/"));
    REQUIRE(gate.delay("example.com") == 2000ms);
}

TEST_CASE("PolitenessGate gives up waiting at the deadline", "[PolitenessGate]") {
    auto client = std::make_shared<FakeHttpClient>();
    client->on("https://example.com/robots.txt", FakeHttpClient::text("User-agent: *\nCrawl-delay: 10\n"));
    PolitenessGate gate(gateConfig(10ms), client);

    // The robots.txt request opens a ten second spacing window
    auto started = std::chrono::steady_clock::now();
    auto permit = gate.acquire("https://example.com/", started + 50ms);
    auto waited = std::chrono::steady_clock::now() - started;

    REQUIRE_FALSE(permit.valid());
    REQUIRE(waited >= 40ms);
    REQUIRE(waited < 1000ms);

    SECTION("A deadline already past refuses without waiting") {
        auto again = gate.acquire("https://example.com/other", std::chrono::steady_clock::now());
        REQUIRE_FALSE(again.valid());
    }

    SECTION("A free host still admits before the deadline") {
        auto open = gate.acquire("https://open.example.org/", std::chrono::steady_clock::now() + 1000ms);
        REQUIRE(open.valid());
    }
}

TEST_CASE("PolitenessGate spaces request starts per host", "[PolitenessGate]") {
    auto client = std::make_shared<FakeHttpClient>();
    PolitenessGate gate(gateConfig(40ms, 4), client);

    // The robots.txt request opens the spacing window
    std::vector<std::chrono::steady_clock::time_point> grants;
    for (int i = 0; i < 3; ++i) {
        auto permit = gate.acquire("https://example.com/page" + std::to_string(i));
        grants.push_back(std::chrono::steady_clock::now());
    }

    for (size_t i = 1; i < grants.size(); ++i) {
        REQUIRE(grants[i] - grants[i - 1] >= 35ms);
    }
}

TEST_CASE("PolitenessGate enforces the per-host concurrency ceiling", "[PolitenessGate]") {
    auto client = std::make_shared<FakeHttpClient>();
    PolitenessGate gate(gateConfig(0ms, 2), client);
    gate.mayFetch("https://example.com/");

    std::atomic<int> current{0};
    std::atomic<int> peak{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < 6; ++i) {
        threads.emplace_back([&gate, &current, &peak, i] {
            auto permit = gate.acquire("https://example.com/p" + std::to_string(i));
            int now = ++current;
            int seen = peak.load();
            while (now > seen && !peak.compare_exchange_weak(seen, now)) {
            }
            std::this_thread::sleep_for(20ms);
            --current;
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    REQUIRE(peak <= 2);
    REQUIRE(gate.maxObservedInFlight("example.com") <= 2);
    REQUIRE(gate.maxObservedInFlight("example.com") >= 1);
}

TEST_CASE("PolitenessGate permits release their slot", "[PolitenessGate]") {
    auto client = std::make_shared<FakeHttpClient>();
    PolitenessGate gate(gateConfig(0ms, 1), client);

    auto first = gate.acquire("https://example.com/a");
    HostPermit moved = std::move(first);
    REQUIRE_FALSE(first.valid());
    REQUIRE(moved.valid());
    moved.release();
    REQUIRE_FALSE(moved.valid());

    // Would block forever if the slot had leaked
    auto second = gate.acquire("https://example.com/b");
    REQUIRE(second.valid());
}

TEST_CASE("PolitenessGate pauses a rate-limited host", "[PolitenessGate]") {
    auto client = std::make_shared<FakeHttpClient>();
    PolitenessGate gate(gateConfig(0ms), client);
    gate.acquire("https://example.com/");

    gate.recordRateLimit("example.com", 60ms);
    auto start = std::chrono::steady_clock::now();
    gate.acquire("https://example.com/next");
    REQUIRE(std::chrono::steady_clock::now() - start >= 50ms);
}

TEST_CASE("CrawlMetrics aggregates per host", "[CrawlMetrics]") {
    CrawlMetrics metrics;
    metrics.recordRequest("a.com");
    metrics.recordRequest("a.com");
    metrics.recordRequest("b.com");
    metrics.recordSuccess("a.com");
    metrics.recordFailure("b.com", FailureType::PERMANENT);
    metrics.recordRetry("a.com");
    metrics.recordRateLimit("a.com");

    REQUIRE(metrics.getTotalRequests() == 3);
    REQUIRE(metrics.getSuccessfulRequests() == 1);
    REQUIRE(metrics.getFailedRequests() == 1);
    REQUIRE(metrics.getHostMetrics("a.com").totalRequests == 2);
    REQUIRE(metrics.getHostMetrics("a.com").getSuccessRate() == 0.5);
    REQUIRE(metrics.getHostMetrics("b.com").failedRequests == 1);
    REQUIRE(metrics.getFailureTypeCounts().at(FailureType::PERMANENT) == 1);
    REQUIRE(metrics.getHostMetrics("missing.com").totalRequests == 0);
    REQUIRE_NOTHROW(metrics.logSummary());
}
