#pragma once

#include <chrono>
#include <map>
#include <string>
#include <vector>

namespace site_audit::crawler {

enum class FetchErrorKind {
    NONE,
    TIMEOUT,
    CONNECTION_REFUSED,
    DNS_FAILURE,
    TLS_FAILURE,
    TOO_LARGE,
    OTHER
};

std::string fetchErrorKindToString(FetchErrorKind kind);

// Response header names are stored lower-cased
using HeaderMap = std::map<std::string, std::string>;

// One HTTP exchange as returned by an HttpClient
struct HttpResponse {
    int statusCode = 0;        // 0 when no response was received
    HeaderMap headers;
    std::string body;
    FetchErrorKind error = FetchErrorKind::NONE;
    std::string errorMessage;
    std::chrono::milliseconds latency{0};

    bool transportFailed() const { return error != FetchErrorKind::NONE; }

    std::string header(const std::string& lowerName) const {
        auto it = headers.find(lowerName);
        return it == headers.end() ? std::string() : it->second;
    }
};

// Terminal result of fetching one CrawlTask, after redirects and retries.
// Immutable once produced.
struct FetchResult {
    std::string url;
    std::string finalUrl;
    // Every URL visited after the first, in order
    std::vector<std::string> redirectChain;
    bool redirectLoop = false;
    // Location header that could not be normalized, if any
    std::string malformedLocation;
    // A redirect pointed at a path robots.txt disallows; it was not followed
    bool blockedByRobots = false;
    // The crawl time limit passed while waiting for host admission
    bool deadlineExpired = false;

    int statusCode = 0;
    HeaderMap headers;
    std::string body;
    FetchErrorKind error = FetchErrorKind::NONE;
    std::string errorMessage;

    std::chrono::milliseconds latency{0};
    int attempts = 0;

    std::string contentType() const {
        auto it = headers.find("content-type");
        return it == headers.end() ? std::string() : it->second;
    }
};

} // namespace site_audit::crawler
