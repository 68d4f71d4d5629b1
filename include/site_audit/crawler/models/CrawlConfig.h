#pragma once

#include <chrono>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "../../common/UrlNormalizer.h"

namespace site_audit {

// Raised for invalid session configuration, before any fetch begins
class ConfigError : public std::invalid_argument {
public:
    explicit ConfigError(const std::string& message) : std::invalid_argument(message) {}
};

struct CrawlConfig {
    // Start URL of the crawl
    std::string seedUrl;

    // Seed is depth 0; discovered links are parent depth + 1
    size_t maxDepth = 3;

    // Upper bound on URLs admitted to the frontier
    size_t maxPages = 500;

    // Wall-clock budget for the crawl phase; zero disables it
    std::chrono::milliseconds timeLimit{0};

    // Size of the fetcher worker pool
    size_t maxConcurrentConnections = 8;

    // In-flight ceiling per host, independent of the pool size
    size_t perHostConcurrency = 2;

    // Minimum spacing between request starts to the same host
    std::chrono::milliseconds politenessDelay{500};

    // Ceiling applied to a robots.txt Crawl-delay
    std::chrono::milliseconds maxCrawlDelay{30000};

    std::chrono::milliseconds requestTimeout{15000};
    std::chrono::milliseconds connectTimeout{10000};

    std::string userAgent = "SiteAuditBot/1.0";

    bool respectRobotsTxt = true;

    common::TrailingSlashPolicy trailingSlashPolicy = common::TrailingSlashPolicy::STRIP;
    bool stripTrackingParameters = true;
    std::vector<std::string> trackingParameters = common::UrlNormalizerOptions().trackingParameters;

    // === RETRY CONFIGURATION ===
    int maxRetries = 2;
    std::chrono::milliseconds baseRetryDelay{1000};
    float backoffMultiplier = 2.0f;
    std::chrono::milliseconds maxRetryDelay{30000};
    // Upper bound honoured for a server supplied Retry-After
    std::chrono::milliseconds maxRetryAfter{120000};
    std::set<int> retryableHttpCodes = {408, 429, 500, 502, 503, 504, 520, 521, 522, 523, 524};

    // Hops followed before a redirect chain is abandoned
    size_t maxRedirects = 10;
    // Chains longer than this are reported by status-integrity
    size_t redirectHopLimit = 3;

    // === CHECK THRESHOLDS ===
    size_t titleMinLength = 10;
    size_t titleMaxLength = 60;
    size_t descriptionMinLength = 50;
    size_t descriptionMaxLength = 160;

    // Enqueue img/script/stylesheet references alongside anchors
    bool fetchResources = true;

    // Hosts treated as internal in addition to the seed host
    std::vector<std::string> allowedHosts;

    // Larger bodies are truncated and reported as a fetch error
    size_t maxBodyBytes = 10 * 1024 * 1024;

    bool verifySSL = true;

    // Check identifiers removed from the registry at session start
    std::vector<std::string> disabledChecks;

    // Throws ConfigError describing the first invalid field
    void validate() const;

    common::UrlNormalizerOptions normalizerOptions() const;
};

CrawlConfig crawlConfigFromJson(const nlohmann::json& j, CrawlConfig base = CrawlConfig());
nlohmann::json toJson(const CrawlConfig& config);

// Throws ConfigError when the file is missing or not valid JSON
CrawlConfig loadCrawlConfig(const std::string& path);

std::string trailingSlashPolicyToString(common::TrailingSlashPolicy policy);
common::TrailingSlashPolicy trailingSlashPolicyFromString(const std::string& value);

} // namespace site_audit
