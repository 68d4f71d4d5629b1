#include <catch2/catch_test_macros.hpp>
#include "CheckEngine.h"
#include "checks/Checks.h"

#include <algorithm>
#include <stdexcept>

using namespace site_audit;
using namespace site_audit::audit;
using namespace site_audit::crawler;

namespace {

PageModel page(const std::string& url) {
    PageModel model;
    model.url = url;
    model.finalUrl = url;
    model.statusCode = 200;
    model.isHtml = true;
    return model;
}

std::vector<Finding> oneFinding(const PageModel& model, const CrawlIndex&) {
    return {{"", Severity::WARNING, model.url, "first", ""}};
}

} // namespace

TEST_CASE("CheckEngine runs every check on every page", "[CheckEngine]") {
    CheckRegistry registry;
    registry.registerCheck("one", oneFinding);
    registry.registerCheck("two", [](const PageModel& model, const CrawlIndex&) {
        return std::vector<Finding>{{"two", Severity::INFO, model.url, "second", "e"}};
    });

    std::vector<PageModel> pages;
    for (int i = 0; i < 20; ++i) {
        pages.push_back(page("https://example.com/p" + std::to_string(i)));
    }

    CheckEngine engine(registry, 4);
    auto findings = engine.run(pages, CrawlIndex());

    REQUIRE(findings.size() == 40);
    SECTION("Findings without an id take the registry id") {
        REQUIRE(findings[0].checkId == "one");
        REQUIRE(findings[1].checkId == "two");
    }
    SECTION("Output is sorted by url, then check") {
        REQUIRE(std::is_sorted(findings.begin(), findings.end(), findingLess));
        REQUIRE(findings.front().url == "https://example.com/p0");
        REQUIRE(findings.back().url == "https://example.com/p9");
    }
}

TEST_CASE("CheckEngine output does not depend on worker count", "[CheckEngine]") {
    CrawlConfig config;
    config.seedUrl = "https://example.com/";
    auto registry = makeDefaultRegistry(config);

    std::vector<PageModel> pages;
    for (int i = 0; i < 12; ++i) {
        auto model = page("https://example.com/p" + std::to_string(i));
        if (i % 3 == 0) {
            model.title = "Same title everywhere";
        }
        if (i % 4 == 0) {
            model.statusCode = 500;
        }
        pages.push_back(model);
    }
    std::vector<UrlRecord> records;
    for (const auto& model : pages) {
        UrlRecord record;
        record.url = model.url;
        record.finalUrl = model.url;
        record.statusCode = model.statusCode;
        record.outcome = model.statusCode == 200 ? OutcomeKind::FETCHED : OutcomeKind::FAILED;
        records.push_back(record);
    }
    auto index = CrawlIndex::build(records, pages, {"example.com"});

    auto serial = CheckEngine(registry, 1).run(pages, index);
    auto parallel = CheckEngine(registry, 8).run(pages, index);

    REQUIRE(serial.size() == parallel.size());
    for (size_t i = 0; i < serial.size(); ++i) {
        REQUIRE(serial[i].url == parallel[i].url);
        REQUIRE(serial[i].checkId == parallel[i].checkId);
        REQUIRE(serial[i].message == parallel[i].message);
        REQUIRE(serial[i].evidence == parallel[i].evidence);
    }
}

TEST_CASE("CheckEngine contains failing checks", "[CheckEngine]") {
    CheckRegistry registry;
    registry.registerCheck("explodes", [](const PageModel& model, const CrawlIndex&) -> std::vector<Finding> {
        if (model.url.find("bad") != std::string::npos) {
            throw std::runtime_error("unexpected input");
        }
        return {};
    });
    registry.registerCheck("steady", oneFinding);

    std::vector<PageModel> pages = {page("https://example.com/bad"), page("https://example.com/good")};
    auto findings = CheckEngine(registry).run(pages, CrawlIndex());

    REQUIRE(findings.size() == 3);
    const Finding& failure = findings[0];
    REQUIRE(failure.checkId == checks::kCheckFailure);
    REQUIRE(failure.severity == Severity::INFO);
    REQUIRE(failure.url == "https://example.com/bad");
    REQUIRE(failure.message == "Check explodes did not complete");
    REQUIRE(failure.evidence == "unexpected input");

    REQUIRE(findings[1].checkId == "steady");
    REQUIRE(findings[2].url == "https://example.com/good");
}

TEST_CASE("CheckEngine handles an empty crawl", "[CheckEngine]") {
    CheckRegistry registry;
    registry.registerCheck("one", oneFinding);
    REQUIRE(CheckEngine(registry).run({}, CrawlIndex()).empty());
}

TEST_CASE("CheckEngine finalize sorts and removes duplicates", "[CheckEngine]") {
    std::vector<Finding> findings = {
        {"b", Severity::INFO, "https://example.com/2", "m", ""},
        {"a", Severity::WARNING, "https://example.com/2", "m", ""},
        {"a", Severity::WARNING, "https://example.com/1", "m", "x"},
        {"a", Severity::WARNING, "https://example.com/2", "m", ""}
    };
    CheckEngine::finalize(findings);

    REQUIRE(findings.size() == 3);
    REQUIRE(findings[0].url == "https://example.com/1");
    REQUIRE(findings[1].checkId == "a");
    REQUIRE(findings[2].checkId == "b");
}
