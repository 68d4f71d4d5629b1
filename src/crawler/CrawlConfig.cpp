#include "../../include/site_audit/crawler/models/CrawlConfig.h"
#include "../../include/Logger.h"

#include <algorithm>
#include <cctype>
#include <fstream>

namespace site_audit {

namespace {

void require(bool condition, const std::string& message) {
    if (!condition) {
        throw ConfigError(message);
    }
}

} // namespace

void CrawlConfig::validate() const {
    require(!seedUrl.empty(), "seedUrl must be set");

    common::UrlNormalizer normalizer(normalizerOptions());
    auto seed = normalizer.normalize(seedUrl);
    require(seed.success, "invalid seedUrl: " + seed.message);

    require(maxPages > 0, "maxPages must be positive");
    require(maxConcurrentConnections > 0, "maxConcurrentConnections must be positive");
    require(perHostConcurrency > 0, "perHostConcurrency must be positive");
    require(perHostConcurrency <= 16, "perHostConcurrency must not exceed 16");
    require(politenessDelay.count() >= 0, "politenessDelay must not be negative");
    require(maxCrawlDelay >= politenessDelay, "maxCrawlDelay must be >= politenessDelay");
    require(requestTimeout.count() > 0, "requestTimeout must be positive");
    require(connectTimeout.count() > 0, "connectTimeout must be positive");
    require(timeLimit.count() >= 0, "timeLimit must not be negative");
    require(!userAgent.empty(), "userAgent must be set");
    require(maxRetries >= 0, "maxRetries must not be negative");
    require(baseRetryDelay.count() >= 0, "baseRetryDelay must not be negative");
    require(backoffMultiplier >= 1.0f, "backoffMultiplier must be at least 1");
    require(maxRetryDelay >= baseRetryDelay, "maxRetryDelay must be >= baseRetryDelay");
    require(maxRetryAfter.count() >= 0, "maxRetryAfter must not be negative");
    require(maxRedirects > redirectHopLimit, "maxRedirects must be greater than redirectHopLimit");
    require(titleMinLength <= titleMaxLength, "titleMinLength must be <= titleMaxLength");
    require(descriptionMinLength <= descriptionMaxLength, "descriptionMinLength must be <= descriptionMaxLength");
    require(maxBodyBytes > 0, "maxBodyBytes must be positive");
}

common::UrlNormalizerOptions CrawlConfig::normalizerOptions() const {
    common::UrlNormalizerOptions options;
    options.trailingSlash = trailingSlashPolicy;
    options.stripTrackingParameters = stripTrackingParameters;
    options.trackingParameters = trackingParameters;
    return options;
}

std::string trailingSlashPolicyToString(common::TrailingSlashPolicy policy) {
    switch (policy) {
        case common::TrailingSlashPolicy::KEEP: return "keep";
        case common::TrailingSlashPolicy::STRIP: return "strip";
        case common::TrailingSlashPolicy::ADD: return "add";
        default: return "strip";
    }
}

common::TrailingSlashPolicy trailingSlashPolicyFromString(const std::string& value) {
    std::string lower = value;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "keep") return common::TrailingSlashPolicy::KEEP;
    if (lower == "strip") return common::TrailingSlashPolicy::STRIP;
    if (lower == "add") return common::TrailingSlashPolicy::ADD;
    throw ConfigError("unknown trailingSlashPolicy: " + value);
}

CrawlConfig crawlConfigFromJson(const nlohmann::json& j, CrawlConfig base) {
    if (!j.is_object()) {
        throw ConfigError("configuration must be a JSON object");
    }

    CrawlConfig config = std::move(base);
    try {
        if (j.contains("seedUrl")) config.seedUrl = j["seedUrl"].get<std::string>();
        if (j.contains("maxDepth")) config.maxDepth = j["maxDepth"].get<size_t>();
        if (j.contains("maxPages")) config.maxPages = j["maxPages"].get<size_t>();
        if (j.contains("timeLimitMs")) config.timeLimit = std::chrono::milliseconds(j["timeLimitMs"].get<long long>());
        if (j.contains("maxConcurrentConnections")) config.maxConcurrentConnections = j["maxConcurrentConnections"].get<size_t>();
        if (j.contains("perHostConcurrency")) config.perHostConcurrency = j["perHostConcurrency"].get<size_t>();
        if (j.contains("politenessDelayMs")) config.politenessDelay = std::chrono::milliseconds(j["politenessDelayMs"].get<long long>());
        if (j.contains("maxCrawlDelayMs")) config.maxCrawlDelay = std::chrono::milliseconds(j["maxCrawlDelayMs"].get<long long>());
        if (j.contains("requestTimeoutMs")) config.requestTimeout = std::chrono::milliseconds(j["requestTimeoutMs"].get<long long>());
        if (j.contains("connectTimeoutMs")) config.connectTimeout = std::chrono::milliseconds(j["connectTimeoutMs"].get<long long>());
        if (j.contains("userAgent")) config.userAgent = j["userAgent"].get<std::string>();
        if (j.contains("respectRobotsTxt")) config.respectRobotsTxt = j["respectRobotsTxt"].get<bool>();
        if (j.contains("trailingSlashPolicy")) config.trailingSlashPolicy = trailingSlashPolicyFromString(j["trailingSlashPolicy"].get<std::string>());
        if (j.contains("stripTrackingParameters")) config.stripTrackingParameters = j["stripTrackingParameters"].get<bool>();
        if (j.contains("trackingParameters")) config.trackingParameters = j["trackingParameters"].get<std::vector<std::string>>();
        if (j.contains("maxRetries")) config.maxRetries = j["maxRetries"].get<int>();
        if (j.contains("baseRetryDelayMs")) config.baseRetryDelay = std::chrono::milliseconds(j["baseRetryDelayMs"].get<long long>());
        if (j.contains("backoffMultiplier")) config.backoffMultiplier = j["backoffMultiplier"].get<float>();
        if (j.contains("maxRetryDelayMs")) config.maxRetryDelay = std::chrono::milliseconds(j["maxRetryDelayMs"].get<long long>());
        if (j.contains("maxRetryAfterMs")) config.maxRetryAfter = std::chrono::milliseconds(j["maxRetryAfterMs"].get<long long>());
        if (j.contains("retryableHttpCodes")) config.retryableHttpCodes = j["retryableHttpCodes"].get<std::set<int>>();
        if (j.contains("maxRedirects")) config.maxRedirects = j["maxRedirects"].get<size_t>();
        if (j.contains("redirectHopLimit")) config.redirectHopLimit = j["redirectHopLimit"].get<size_t>();
        if (j.contains("titleMinLength")) config.titleMinLength = j["titleMinLength"].get<size_t>();
        if (j.contains("titleMaxLength")) config.titleMaxLength = j["titleMaxLength"].get<size_t>();
        if (j.contains("descriptionMinLength")) config.descriptionMinLength = j["descriptionMinLength"].get<size_t>();
        if (j.contains("descriptionMaxLength")) config.descriptionMaxLength = j["descriptionMaxLength"].get<size_t>();
        if (j.contains("fetchResources")) config.fetchResources = j["fetchResources"].get<bool>();
        if (j.contains("allowedHosts")) config.allowedHosts = j["allowedHosts"].get<std::vector<std::string>>();
        if (j.contains("maxBodyBytes")) config.maxBodyBytes = j["maxBodyBytes"].get<size_t>();
        if (j.contains("verifySSL")) config.verifySSL = j["verifySSL"].get<bool>();
        if (j.contains("disabledChecks")) config.disabledChecks = j["disabledChecks"].get<std::vector<std::string>>();
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError(std::string("invalid configuration value: ") + e.what());
    }
    return config;
}

nlohmann::json toJson(const CrawlConfig& config) {
    nlohmann::json j;
    j["seedUrl"] = config.seedUrl;
    j["maxDepth"] = config.maxDepth;
    j["maxPages"] = config.maxPages;
    j["timeLimitMs"] = config.timeLimit.count();
    j["maxConcurrentConnections"] = config.maxConcurrentConnections;
    j["perHostConcurrency"] = config.perHostConcurrency;
    j["politenessDelayMs"] = config.politenessDelay.count();
    j["maxCrawlDelayMs"] = config.maxCrawlDelay.count();
    j["requestTimeoutMs"] = config.requestTimeout.count();
    j["connectTimeoutMs"] = config.connectTimeout.count();
    j["userAgent"] = config.userAgent;
    j["respectRobotsTxt"] = config.respectRobotsTxt;
    j["trailingSlashPolicy"] = trailingSlashPolicyToString(config.trailingSlashPolicy);
    j["stripTrackingParameters"] = config.stripTrackingParameters;
    j["trackingParameters"] = config.trackingParameters;
    j["maxRetries"] = config.maxRetries;
    j["baseRetryDelayMs"] = config.baseRetryDelay.count();
    j["backoffMultiplier"] = config.backoffMultiplier;
    j["maxRetryDelayMs"] = config.maxRetryDelay.count();
    j["maxRetryAfterMs"] = config.maxRetryAfter.count();
    j["retryableHttpCodes"] = config.retryableHttpCodes;
    j["maxRedirects"] = config.maxRedirects;
    j["redirectHopLimit"] = config.redirectHopLimit;
    j["titleMinLength"] = config.titleMinLength;
    j["titleMaxLength"] = config.titleMaxLength;
    j["descriptionMinLength"] = config.descriptionMinLength;
    j["descriptionMaxLength"] = config.descriptionMaxLength;
    j["fetchResources"] = config.fetchResources;
    j["allowedHosts"] = config.allowedHosts;
    j["maxBodyBytes"] = config.maxBodyBytes;
    j["verifySSL"] = config.verifySSL;
    j["disabledChecks"] = config.disabledChecks;
    return j;
}

CrawlConfig loadCrawlConfig(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        throw ConfigError("cannot open configuration file: " + path);
    }

    nlohmann::json root;
    try {
        in >> root;
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigError("malformed configuration file " + path + ": " + e.what());
    }

    LOG_INFO("Loaded crawl configuration from " + path);
    return crawlConfigFromJson(root);
}

} // namespace site_audit
