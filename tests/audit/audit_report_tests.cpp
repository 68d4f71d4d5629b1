#include <catch2/catch_test_macros.hpp>
#include "../../include/site_audit/audit/AuditReport.h"

#include <cstdio>
#include <fstream>

using namespace site_audit::audit;
using namespace site_audit::crawler;

namespace {

AuditReport sampleReport() {
    AuditReport report;
    report.seedUrl = "https://example.com/";
    report.startTime = std::chrono::system_clock::from_time_t(1700000000);
    report.endTime = report.startTime + std::chrono::milliseconds(1500);

    UrlRecord home;
    home.url = "https://example.com/";
    home.finalUrl = home.url;
    home.statusCode = 200;
    home.outcome = OutcomeKind::FETCHED;
    home.attempts = 1;
    report.inventory[home.url] = home;

    UrlRecord old;
    old.url = "https://example.com/old";
    old.finalUrl = "https://example.com/about";
    old.statusCode = 200;
    old.outcome = OutcomeKind::FETCHED;
    old.depth = 1;
    old.parentUrl = home.url;
    old.redirectChain = {"https://example.com/about"};
    report.inventory[old.url] = old;

    UrlRecord about = old;
    about.url = "https://example.com/about";
    about.redirectChain.clear();
    report.inventory[about.url] = about;

    UrlRecord privatePage;
    privatePage.url = "https://example.com/private/x";
    privatePage.finalUrl = privatePage.url;
    privatePage.outcome = OutcomeKind::SKIPPED_ROBOTS;
    report.inventory[privatePage.url] = privatePage;

    UrlRecord broken;
    broken.url = "https://example.com/broken";
    broken.finalUrl = broken.url;
    broken.statusCode = 500;
    broken.outcome = OutcomeKind::FAILED;
    broken.attempts = 3;
    broken.error = "HTTP 500";
    report.inventory[broken.url] = broken;

    report.findings = {
        {"status-integrity", Severity::CRITICAL, "https://example.com/broken", "Server error response", "HTTP 500"},
        {"duplicate-content", Severity::WARNING, "https://example.com/old", "Body identical to other crawled URLs",
         "https://example.com/about"}
    };
    report.summary.pagesFetched = 3;
    report.summary.pagesFailed = 1;
    report.summary.pagesSkippedRobots = 1;
    report.summary.findingsBySeverity[Severity::CRITICAL] = 1;
    report.summary.findingsBySeverity[Severity::WARNING] = 1;
    return report;
}

} // namespace

TEST_CASE("AuditReport lists URLs after redirect resolution", "[AuditReport]") {
    auto report = sampleReport();
    auto resolved = report.resolvedUrls();

    REQUIRE(resolved == std::set<std::string>{"https://example.com/", "https://example.com/about"});
    REQUIRE(resolved.count("https://example.com/old") == 0);
    REQUIRE(resolved.count("https://example.com/private/x") == 0);
}

TEST_CASE("AuditReport filters findings by check", "[AuditReport]") {
    auto report = sampleReport();
    REQUIRE(report.findingsFor("status-integrity").size() == 1);
    REQUIRE(report.findingsFor("duplicate-content")[0].url == "https://example.com/old");
    REQUIRE(report.findingsFor("mobile-meta").empty());
}

TEST_CASE("AuditReport serializes to JSON", "[AuditReport]") {
    auto j = toJson(sampleReport());

    REQUIRE(j["seedUrl"] == "https://example.com/");
    REQUIRE(j["startTime"] == "2023-11-14T22:13:20Z");
    REQUIRE(j["durationMs"] == 1500);
    REQUIRE(j["deadlineReached"] == false);

    const auto& inventory = j["inventory"];
    REQUIRE(inventory.size() == 5);
    REQUIRE(inventory["https://example.com/old"]["finalUrl"] == "https://example.com/about");
    REQUIRE(inventory["https://example.com/old"]["redirectChain"].size() == 1);
    REQUIRE(inventory["https://example.com/private/x"]["outcome"] == "skipped(robots)");
    REQUIRE(inventory["https://example.com/broken"]["outcome"] == "failed");
    REQUIRE(inventory["https://example.com/broken"]["error"] == "HTTP 500");
    REQUIRE_FALSE(inventory["https://example.com/"].contains("redirectChain"));

    REQUIRE(j["findings"].size() == 2);
    REQUIRE(j["findings"][0]["severity"] == "critical");
    REQUIRE(j["findings"][1]["checkId"] == "duplicate-content");

    const auto& summary = j["summary"];
    REQUIRE(summary["pagesFetched"] == 3);
    REQUIRE(summary["findingsBySeverity"]["critical"] == 1);
    REQUIRE(summary["findingsBySeverity"]["info"] == 0);
}

TEST_CASE("AuditReport is written to disk", "[AuditReport]") {
    auto report = sampleReport();

    SECTION("Valid path") {
        const std::string path = "site_audit_report_test.json";
        writeReport(report, path);

        std::ifstream in(path);
        REQUIRE(in.is_open());
        auto parsed = nlohmann::json::parse(in);
        REQUIRE(parsed["seedUrl"] == "https://example.com/");
        REQUIRE(parsed["findings"].size() == 2);
        std::remove(path.c_str());
    }

    SECTION("Unwritable path") {
        REQUIRE_THROWS_AS(writeReport(report, "/nonexistent-dir/report.json"), std::runtime_error);
    }
}

TEST_CASE("Severity names", "[AuditReport]") {
    REQUIRE(severityToString(Severity::INFO) == "info");
    REQUIRE(severityToString(Severity::WARNING) == "warning");
    REQUIRE(severityToString(Severity::CRITICAL) == "critical");
}
