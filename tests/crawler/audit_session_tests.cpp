#include <catch2/catch_test_macros.hpp>
#include "../../include/site_audit/AuditSession.h"
#include "FakeHttpClient.h"

#include <algorithm>
#include <atomic>
#include <stdexcept>

using namespace site_audit;
using namespace site_audit::audit;
using namespace site_audit::crawler;
using site_audit::testing::FakeHttpClient;
using namespace std::chrono_literals;

namespace {

const std::string kRoot = "https://example.com";

std::string url(const std::string& path) {
    return kRoot + path;
}

std::string pageHtml(const std::string& name, const std::vector<std::string>& links = {}) {
    std::string html =
        "<!DOCTYPE html><html><head><title>" + name + " page of the example site</title>"
        "<meta name=\"description\" content=\"The " + name + " page of the example site, with enough words to pass.\">"
        "<meta name=\"viewport\" content=\"width=device-width, initial-scale=1\">"
        "</head><body><h1>" + name + "</h1>";
    for (const auto& link : links) {
        html += "<a href=\"" + link + "\">" + link + "</a>";
    }
    html += "</body></html>";
    return html;
}

CrawlConfig sessionConfig() {
    CrawlConfig config;
    config.seedUrl = url("/");
    config.maxDepth = 5;
    config.maxPages = 100;
    config.maxConcurrentConnections = 4;
    config.perHostConcurrency = 2;
    config.politenessDelay = 5ms;
    config.baseRetryDelay = 5ms;
    config.maxRetryDelay = 20ms;
    config.requestTimeout = 1000ms;
    return config;
}

std::vector<Finding> findingsAt(const AuditReport& report, const std::string& checkId, const std::string& target) {
    std::vector<Finding> out;
    for (const auto& finding : report.findingsFor(checkId)) {
        if (finding.url == target) {
            out.push_back(finding);
        }
    }
    return out;
}

const UrlRecord& recordOf(const AuditReport& report, const std::string& target) {
    auto it = report.inventory.find(target);
    REQUIRE(it != report.inventory.end());
    return it->second;
}

// Throws from get() for one URL, delegating everything else
class ThrowingClient : public FakeHttpClient {
public:
    explicit ThrowingClient(std::string poisoned) : poisoned_(std::move(poisoned)) {}

    HttpResponse get(const std::string& target, std::chrono::milliseconds timeout) override {
        if (target == poisoned_) {
            throw std::runtime_error("client blew up");
        }
        return FakeHttpClient::get(target, timeout);
    }

private:
    std::string poisoned_;
};

} // namespace

TEST_CASE("AuditSession resolves redirects before reporting", "[AuditSession]") {
    auto client = std::make_shared<FakeHttpClient>();
    client->on(url("/"), FakeHttpClient::html(pageHtml("Home", {"/old", "/about"})));
    client->on(url("/old"), FakeHttpClient::redirect("/about"));
    client->on(url("/about"), FakeHttpClient::html(pageHtml("About")));

    AuditSession session(sessionConfig(), client);
    auto report = session.run();

    const auto& old = recordOf(report, url("/old"));
    REQUIRE(old.outcome == OutcomeKind::FETCHED);
    REQUIRE(old.finalUrl == url("/about"));
    REQUIRE(old.redirectChain == std::vector<std::string>{url("/about")});

    REQUIRE(report.resolvedUrls() == std::set<std::string>{url("/"), url("/about")});

    SECTION("A single-hop redirect ending in 200 is not a status problem") {
        REQUIRE(report.findingsFor("status-integrity").empty());
    }

    SECTION("The redirecting URL duplicates its target's content") {
        auto duplicates = findingsAt(report, "duplicate-content", url("/old"));
        REQUIRE(duplicates.size() == 1);
        REQUIRE(duplicates[0].evidence == url("/about"));
    }
}

TEST_CASE("AuditSession honours robots.txt", "[AuditSession]") {
    auto client = std::make_shared<FakeHttpClient>();
    client->on(url("/robots.txt"), FakeHttpClient::text("User-agent: *\nDisallow: /private/\n"));
    client->on(url("/"), FakeHttpClient::html(pageHtml("Home", {"/private/secret", "/public", "/go"})));
    client->on(url("/public"), FakeHttpClient::html(pageHtml("Public")));
    client->on(url("/private/secret"), FakeHttpClient::html(pageHtml("Secret")));
    client->on(url("/go"), FakeHttpClient::redirect("/private/other", 302));

    AuditSession session(sessionConfig(), client);
    auto report = session.run();

    REQUIRE(recordOf(report, url("/private/secret")).outcome == OutcomeKind::SKIPPED_ROBOTS);
    REQUIRE(client->requestCount(url("/private/secret")) == 0);

    SECTION("Redirects into a disallowed path are not followed") {
        REQUIRE(recordOf(report, url("/go")).outcome == OutcomeKind::SKIPPED_ROBOTS);
        REQUIRE(client->requestCount(url("/private/other")) == 0);
    }

    SECTION("Skipped URLs are not reported as broken") {
        REQUIRE(report.findingsFor("broken-internal-link").empty());
        REQUIRE(report.summary.pagesSkippedRobots == 2);
        REQUIRE(client->requestCount(url("/robots.txt")) == 1);
    }
}

TEST_CASE("AuditSession retries server errors and then gives up", "[AuditSession]") {
    auto client = std::make_shared<FakeHttpClient>();
    client->on(url("/"), FakeHttpClient::html(pageHtml("Home", {"/broken", "/flaky"})));
    client->on(url("/broken"), FakeHttpClient::status(500));
    client->onSequence(url("/flaky"), {FakeHttpClient::status(503), FakeHttpClient::html(pageHtml("Flaky"))});

    AuditSession session(sessionConfig(), client);
    auto report = session.run();

    const auto& broken = recordOf(report, url("/broken"));
    REQUIRE(broken.outcome == OutcomeKind::FAILED);
    REQUIRE(broken.attempts == 3);
    REQUIRE(client->requestCount(url("/broken")) == 3);

    auto status = findingsAt(report, "status-integrity", url("/broken"));
    REQUIRE(status.size() == 1);
    REQUIRE(status[0].severity == Severity::CRITICAL);

    auto brokenLinks = findingsAt(report, "broken-internal-link", url("/"));
    REQUIRE(brokenLinks.size() == 1);
    REQUIRE(brokenLinks[0].evidence.find(url("/broken")) == 0);

    const auto& flaky = recordOf(report, url("/flaky"));
    REQUIRE(flaky.outcome == OutcomeKind::FETCHED);
    REQUIRE(flaky.attempts == 2);

    REQUIRE(report.summary.retries == 3);
    REQUIRE(session.progress().finished);
    REQUIRE(session.progress().queued == 0);
    REQUIRE(session.progress().inFlight == 0);
}

TEST_CASE("AuditSession does not retry permanent failures", "[AuditSession]") {
    auto client = std::make_shared<FakeHttpClient>();
    client->on(url("/"), FakeHttpClient::html(pageHtml("Home", {"/gone", "/nowhere"})));
    client->on(url("/gone"), FakeHttpClient::status(404));
    client->on(url("/nowhere"), FakeHttpClient::transportError(FetchErrorKind::DNS_FAILURE));

    AuditSession session(sessionConfig(), client);
    auto report = session.run();

    REQUIRE(client->requestCount(url("/gone")) == 1);
    REQUIRE(client->requestCount(url("/nowhere")) == 1);
    REQUIRE(recordOf(report, url("/gone")).outcome == OutcomeKind::FAILED);
    REQUIRE(recordOf(report, url("/gone")).statusCode == 404);
    REQUIRE(findingsAt(report, "status-integrity", url("/nowhere"))[0].severity == Severity::CRITICAL);
    REQUIRE(findingsAt(report, "broken-internal-link", url("/")).size() == 2);
}

TEST_CASE("AuditSession waits out rate limiting", "[AuditSession]") {
    auto client = std::make_shared<FakeHttpClient>();
    auto limited = FakeHttpClient::status(429);
    limited.headers["retry-after"] = "0";
    client->onSequence(url("/"), {limited, FakeHttpClient::html(pageHtml("Home"))});

    AuditSession session(sessionConfig(), client);
    auto report = session.run();

    const auto& home = recordOf(report, url("/"));
    REQUIRE(home.outcome == OutcomeKind::FETCHED);
    REQUIRE(home.attempts == 2);
}

TEST_CASE("AuditSession reports redirect problems", "[AuditSession]") {
    auto client = std::make_shared<FakeHttpClient>();
    client->on(url("/"), FakeHttpClient::html(pageHtml("Home", {"/loop-a", "/bad-location"})));
    client->on(url("/loop-a"), FakeHttpClient::redirect("/loop-b"));
    client->on(url("/loop-b"), FakeHttpClient::redirect("/loop-a"));
    client->on(url("/bad-location"), FakeHttpClient::redirect("http://exa mple.com/", 302));

    AuditSession session(sessionConfig(), client);
    auto report = session.run();

    SECTION("Loops are detected and critical") {
        const auto& loop = recordOf(report, url("/loop-a"));
        REQUIRE(loop.outcome == OutcomeKind::FAILED);
        auto findings = findingsAt(report, "status-integrity", url("/loop-a"));
        REQUIRE(findings.size() == 1);
        REQUIRE(findings[0].message == "Redirect loop");
        REQUIRE(findings[0].severity == Severity::CRITICAL);
    }

    SECTION("An unusable Location header is a malformed link") {
        REQUIRE(recordOf(report, url("/bad-location")).outcome == OutcomeKind::MALFORMED);
        auto findings = findingsAt(report, "malformed-link", url("/bad-location"));
        REQUIRE(findings.size() == 1);
        REQUIRE(findings[0].evidence == "http://exa mple.com/");
    }
}

TEST_CASE("AuditSession spaces requests to a host", "[AuditSession]") {
    auto client = std::make_shared<FakeHttpClient>();
    std::vector<std::string> links;
    for (int i = 0; i < 6; ++i) {
        std::string path = "/p" + std::to_string(i);
        links.push_back(path);
        client->on(url(path), FakeHttpClient::html(pageHtml("Page " + std::to_string(i))));
    }
    client->on(url("/"), FakeHttpClient::html(pageHtml("Home", links)));

    auto config = sessionConfig();
    config.politenessDelay = 30ms;
    AuditSession session(config, client);
    auto report = session.run();

    REQUIRE(report.summary.pagesFetched == 7);
    auto times = client->requestTimes("example.com");
    REQUIRE(times.size() == 8);   // robots.txt plus seven pages
    std::sort(times.begin(), times.end());
    for (size_t i = 1; i < times.size(); ++i) {
        REQUIRE(times[i] - times[i - 1] >= 25ms);
    }
}

TEST_CASE("AuditSession keeps per-host concurrency under the ceiling", "[AuditSession]") {
    auto client = std::make_shared<FakeHttpClient>();
    client->setLatency(25ms);
    std::vector<std::string> links;
    for (int i = 0; i < 10; ++i) {
        std::string path = "/p" + std::to_string(i);
        links.push_back(path);
        client->on(url(path), FakeHttpClient::html(pageHtml("Page " + std::to_string(i))));
    }
    client->on(url("/"), FakeHttpClient::html(pageHtml("Home", links)));

    auto config = sessionConfig();
    config.politenessDelay = 0ms;
    config.maxConcurrentConnections = 8;
    config.perHostConcurrency = 2;
    AuditSession session(config, client);
    auto report = session.run();

    REQUIRE(report.summary.pagesFetched == 11);
    REQUIRE(client->maxInFlight("example.com") <= 2);
}

TEST_CASE("AuditSession fetches each URL once", "[AuditSession]") {
    auto client = std::make_shared<FakeHttpClient>();
    client->on(url("/"), FakeHttpClient::html(pageHtml("Home", {
        "/a", "/a/", "/a#section", "https://EXAMPLE.com/a?utm_source=mail", "/"
    })));
    client->on(url("/a"), FakeHttpClient::html(pageHtml("A", {"/", "/a"})));

    AuditSession session(sessionConfig(), client);
    auto report = session.run();

    REQUIRE(client->requestCount(url("/")) == 1);
    REQUIRE(client->requestCount(url("/a")) == 1);
    REQUIRE(report.inventory.size() == 2);
}

TEST_CASE("AuditSession respects the depth limit", "[AuditSession]") {
    auto client = std::make_shared<FakeHttpClient>();
    client->on(url("/"), FakeHttpClient::html(pageHtml("Home", {"/level1"})));
    client->on(url("/level1"), FakeHttpClient::html(pageHtml("Level one", {"/level2"})));
    client->on(url("/level2"), FakeHttpClient::html(pageHtml("Level two")));

    auto config = sessionConfig();
    config.maxDepth = 1;
    AuditSession session(config, client);
    auto report = session.run();

    REQUIRE(recordOf(report, url("/level1")).depth == 1);
    REQUIRE(recordOf(report, url("/level1")).parentUrl == url("/"));
    REQUIRE(report.inventory.count(url("/level2")) == 0);
    REQUIRE(client->requestCount(url("/level2")) == 0);
}

TEST_CASE("AuditSession stops admitting at the page budget", "[AuditSession]") {
    auto client = std::make_shared<FakeHttpClient>();
    client->on(url("/"), FakeHttpClient::html(pageHtml("Home", {"/1", "/2", "/3", "/4", "/5"})));
    for (int i = 1; i <= 5; ++i) {
        client->on(url("/" + std::to_string(i)), FakeHttpClient::html(pageHtml("Page " + std::to_string(i))));
    }

    auto config = sessionConfig();
    config.maxPages = 3;
    AuditSession session(config, client);
    auto report = session.run();

    REQUIRE(report.inventory.size() == 3);
    REQUIRE(report.summary.pagesFetched == 3);
    REQUIRE(report.summary.enqueueRefusedByBudget == 3);
    REQUIRE(client->requestCount(url("/5")) == 0);
}

TEST_CASE("AuditSession stops at the time limit", "[AuditSession]") {
    auto client = std::make_shared<FakeHttpClient>();
    client->setLatency(40ms);
    std::vector<std::string> links;
    for (int i = 0; i < 20; ++i) {
        links.push_back("/p" + std::to_string(i));
    }
    client->on(url("/"), FakeHttpClient::html(pageHtml("Home", links)));

    auto config = sessionConfig();
    config.maxConcurrentConnections = 1;
    config.timeLimit = 100ms;
    AuditSession session(config, client);

    auto started = std::chrono::steady_clock::now();
    auto report = session.run();
    auto elapsed = std::chrono::steady_clock::now() - started;

    REQUIRE(report.deadlineReached);
    REQUIRE(report.summary.pagesSkippedBudget > 0);
    REQUIRE(report.inventory.size() == 21);
    REQUIRE(elapsed < 2000ms);
    REQUIRE(toJson(report)["deadlineReached"] == true);
}

TEST_CASE("AuditSession keeps the time limit under a huge Crawl-delay", "[AuditSession]") {
    auto client = std::make_shared<FakeHttpClient>();
    client->on(url("/robots.txt"), FakeHttpClient::text("User-agent: *\nCrawl-delay: 100000\n"));
    client->on(url("/"), FakeHttpClient::html(pageHtml("Home", {"/a"})));

    auto config = sessionConfig();
    config.timeLimit = 150ms;
    AuditSession session(config, client);

    auto started = std::chrono::steady_clock::now();
    auto report = session.run();
    auto elapsed = std::chrono::steady_clock::now() - started;

    REQUIRE(elapsed < 2000ms);
    REQUIRE(report.deadlineReached);
    REQUIRE(recordOf(report, url("/")).outcome == OutcomeKind::SKIPPED_BUDGET);
    REQUIRE(report.summary.pagesSkippedBudget == 1);
    REQUIRE(report.summary.pagesFetched == 0);
    REQUIRE(client->requestCount(url("/")) == 0);
    REQUIRE(client->requestCount(url("/robots.txt")) == 1);
}

TEST_CASE("AuditSession isolates failures", "[AuditSession]") {
    auto client = std::make_shared<ThrowingClient>(url("/poison"));
    client->on(url("/"), FakeHttpClient::html(pageHtml("Home", {"/poison", "/fine"})));
    client->on(url("/fine"), FakeHttpClient::html(pageHtml("Fine")));

    auto config = sessionConfig();
    config.maxRetries = 0;
    auto registry = makeDefaultRegistry(config);
    registry.registerCheck("always-throws", [](const PageModel&, const CrawlIndex&) -> std::vector<Finding> {
        throw std::runtime_error("bad check");
    });

    AuditSession session(config, client, registry);
    auto report = session.run();

    SECTION("A client exception fails only its own URL") {
        REQUIRE(recordOf(report, url("/poison")).outcome == OutcomeKind::FAILED);
        REQUIRE(recordOf(report, url("/fine")).outcome == OutcomeKind::FETCHED);
        REQUIRE(recordOf(report, url("/")).outcome == OutcomeKind::FETCHED);
    }

    SECTION("A throwing check becomes a finding and other checks still run") {
        auto failures = report.findingsFor("check-failure");
        REQUIRE(failures.size() == 3);
        REQUIRE(failures[0].message == "Check always-throws did not complete");
        REQUIRE_FALSE(report.findingsFor("status-integrity").empty());
    }
}

TEST_CASE("AuditSession reports progress", "[AuditSession]") {
    auto client = std::make_shared<FakeHttpClient>();
    client->on(url("/"), FakeHttpClient::html(pageHtml("Home", {"/a", "/missing"})));
    client->on(url("/a"), FakeHttpClient::html(pageHtml("A")));

    AuditSession session(sessionConfig(), client);
    std::atomic<size_t> calls{0};
    std::atomic<size_t> maxVisited{0};
    session.setProgressCallback([&calls, &maxVisited](const CrawlProgress& progress) {
        ++calls;
        size_t seen = maxVisited.load();
        while (progress.visited > seen && !maxVisited.compare_exchange_weak(seen, progress.visited)) {
        }
    });
    auto report = session.run();

    REQUIRE(calls == 3);
    REQUIRE(maxVisited == 3);
    auto progress = session.progress();
    REQUIRE(progress.finished);
    REQUIRE(progress.fetched == 2);
    REQUIRE(progress.failed == 1);
    REQUIRE(progress.visited == 3);
}

TEST_CASE("AuditSession rejects invalid configuration up front", "[AuditSession]") {
    auto client = std::make_shared<FakeHttpClient>();

    SECTION("Unparseable seed") {
        auto config = sessionConfig();
        config.seedUrl = "not a url";
        REQUIRE_THROWS_AS(AuditSession(config, client), ConfigError);
    }

    SECTION("Zero page budget") {
        auto config = sessionConfig();
        config.maxPages = 0;
        REQUIRE_THROWS_AS(AuditSession(config, client), ConfigError);
    }

    REQUIRE(client->requests().empty());
}

TEST_CASE("AuditSession runs once", "[AuditSession]") {
    auto client = std::make_shared<FakeHttpClient>();
    client->on(url("/"), FakeHttpClient::html(pageHtml("Home")));

    AuditSession session(sessionConfig(), client);
    session.run();
    REQUIRE_THROWS_AS(session.run(), std::logic_error);
}
