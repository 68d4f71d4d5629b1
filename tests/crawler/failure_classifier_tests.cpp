#include <catch2/catch_test_macros.hpp>
#include "FailureClassifier.h"

#include <ctime>

using namespace site_audit;
using namespace site_audit::crawler;
using namespace std::chrono_literals;

TEST_CASE("FailureClassifier classifies HTTP status codes", "[FailureClassifier]") {
    CrawlConfig config;

    SECTION("Success and redirects are not failures") {
        REQUIRE(FailureClassifier::classify(200, FetchErrorKind::NONE, config) == FailureType::NONE);
        REQUIRE(FailureClassifier::classify(204, FetchErrorKind::NONE, config) == FailureType::NONE);
        REQUIRE(FailureClassifier::classify(301, FetchErrorKind::NONE, config) == FailureType::NONE);
    }

    SECTION("429 is rate limiting") {
        REQUIRE(FailureClassifier::classify(429, FetchErrorKind::NONE, config) == FailureType::RATE_LIMITED);
    }

    SECTION("Server errors and retryable codes are temporary") {
        REQUIRE(FailureClassifier::classify(500, FetchErrorKind::NONE, config) == FailureType::TEMPORARY);
        REQUIRE(FailureClassifier::classify(503, FetchErrorKind::NONE, config) == FailureType::TEMPORARY);
        REQUIRE(FailureClassifier::classify(599, FetchErrorKind::NONE, config) == FailureType::TEMPORARY);
        REQUIRE(FailureClassifier::classify(408, FetchErrorKind::NONE, config) == FailureType::TEMPORARY);
    }

    SECTION("Other client errors are permanent") {
        REQUIRE(FailureClassifier::classify(404, FetchErrorKind::NONE, config) == FailureType::PERMANENT);
        REQUIRE(FailureClassifier::classify(403, FetchErrorKind::NONE, config) == FailureType::PERMANENT);
        REQUIRE(FailureClassifier::classify(410, FetchErrorKind::NONE, config) == FailureType::PERMANENT);
    }

    SECTION("Retryable codes are configurable") {
        config.retryableHttpCodes.insert(404);
        REQUIRE(FailureClassifier::classify(404, FetchErrorKind::NONE, config) == FailureType::TEMPORARY);
    }
}

TEST_CASE("FailureClassifier classifies transport errors", "[FailureClassifier]") {
    CrawlConfig config;

    REQUIRE(FailureClassifier::classify(0, FetchErrorKind::TIMEOUT, config) == FailureType::TEMPORARY);
    REQUIRE(FailureClassifier::classify(0, FetchErrorKind::CONNECTION_REFUSED, config) == FailureType::TEMPORARY);
    REQUIRE(FailureClassifier::classify(0, FetchErrorKind::OTHER, config) == FailureType::TEMPORARY);
    REQUIRE(FailureClassifier::classify(0, FetchErrorKind::DNS_FAILURE, config) == FailureType::PERMANENT);
    REQUIRE(FailureClassifier::classify(0, FetchErrorKind::TLS_FAILURE, config) == FailureType::PERMANENT);
    REQUIRE(FailureClassifier::classify(200, FetchErrorKind::TOO_LARGE, config) == FailureType::PERMANENT);
}

TEST_CASE("FailureClassifier retry decisions", "[FailureClassifier]") {
    SECTION("Only temporary and rate-limited failures retry") {
        REQUIRE(FailureClassifier::shouldRetry(FailureType::TEMPORARY, 0, 2));
        REQUIRE(FailureClassifier::shouldRetry(FailureType::RATE_LIMITED, 1, 2));
        REQUIRE_FALSE(FailureClassifier::shouldRetry(FailureType::PERMANENT, 0, 2));
        REQUIRE_FALSE(FailureClassifier::shouldRetry(FailureType::NONE, 0, 2));
    }

    SECTION("Retries stop at the limit") {
        REQUIRE_FALSE(FailureClassifier::shouldRetry(FailureType::TEMPORARY, 2, 2));
        REQUIRE_FALSE(FailureClassifier::shouldRetry(FailureType::TEMPORARY, 0, 0));
    }
}

TEST_CASE("FailureClassifier computes backoff", "[FailureClassifier]") {
    CrawlConfig config;
    config.baseRetryDelay = 100ms;
    config.backoffMultiplier = 2.0f;
    config.maxRetryDelay = 500ms;

    REQUIRE(FailureClassifier::calculateRetryDelay(1, config) == 100ms);
    REQUIRE(FailureClassifier::calculateRetryDelay(2, config) == 200ms);
    REQUIRE(FailureClassifier::calculateRetryDelay(3, config) == 400ms);
    REQUIRE(FailureClassifier::calculateRetryDelay(4, config) == 500ms);
    REQUIRE(FailureClassifier::calculateRetryDelay(10, config) == 500ms);
}

TEST_CASE("FailureClassifier honours Retry-After", "[FailureClassifier]") {
    CrawlConfig config;
    config.baseRetryDelay = 100ms;
    config.maxRetryAfter = 5000ms;

    SECTION("Delta seconds") {
        REQUIRE(FailureClassifier::parseRetryAfter("3") == 3000ms);
        REQUIRE(FailureClassifier::parseRetryAfter(" 0 ") == 0ms);
    }

    SECTION("HTTP date relative to now") {
        std::tm tm{};
        tm.tm_year = 2015 - 1900;
        tm.tm_mon = 9;
        tm.tm_mday = 21;
        tm.tm_hour = 7;
        tm.tm_min = 28;
        tm.tm_sec = 0;
        auto now = std::chrono::system_clock::from_time_t(timegm(&tm));

        REQUIRE(FailureClassifier::parseRetryAfter("Wed, 21 Oct 2015 07:28:30 GMT", now) == 30000ms);
        REQUIRE(FailureClassifier::parseRetryAfter("Wed, 21 Oct 2015 07:27:00 GMT", now) == 0ms);
    }

    SECTION("Garbage is ignored") {
        REQUIRE_FALSE(FailureClassifier::parseRetryAfter("").has_value());
        REQUIRE_FALSE(FailureClassifier::parseRetryAfter("soon").has_value());
        REQUIRE_FALSE(FailureClassifier::parseRetryAfter("-5").has_value());
    }

    SECTION("Rate-limited responses use the header, capped") {
        HttpResponse response;
        response.statusCode = 429;
        response.headers["retry-after"] = "2";
        REQUIRE(FailureClassifier::retryDelayFor(response, FailureType::RATE_LIMITED, 1, config) == 2000ms);

        response.headers["retry-after"] = "3600";
        REQUIRE(FailureClassifier::retryDelayFor(response, FailureType::RATE_LIMITED, 1, config) == 5000ms);
    }

    SECTION("Without a header, or for other failures, backoff applies") {
        HttpResponse response;
        response.statusCode = 429;
        REQUIRE(FailureClassifier::retryDelayFor(response, FailureType::RATE_LIMITED, 1, config) == 100ms);

        response.statusCode = 503;
        response.headers["retry-after"] = "2";
        REQUIRE(FailureClassifier::retryDelayFor(response, FailureType::TEMPORARY, 1, config) == 100ms);
    }
}

TEST_CASE("FailureClassifier names failure types", "[FailureClassifier]") {
    REQUIRE(FailureClassifier::describe(FailureType::RATE_LIMITED) == "RATE_LIMITED");
    REQUIRE(FailureClassifier::describe(FailureType::PERMANENT) == "PERMANENT");
}
