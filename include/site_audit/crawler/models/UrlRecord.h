#pragma once

#include <chrono>
#include <string>
#include <vector>

namespace site_audit::crawler {

// Terminal disposition of a URL in a crawl
enum class OutcomeKind {
    FETCHED,
    FAILED,
    SKIPPED_ROBOTS,
    SKIPPED_BUDGET,
    MALFORMED
};

std::string outcomeKindToString(OutcomeKind kind);

// Inventory entry for one visited URL
struct UrlRecord {
    std::string url;
    std::string finalUrl;
    int statusCode = 0;
    OutcomeKind outcome = OutcomeKind::FETCHED;
    size_t depth = 0;
    std::string parentUrl;
    std::vector<std::string> redirectChain;
    int attempts = 0;
    std::chrono::milliseconds latency{0};
    std::string error;

    bool isBroken() const {
        return outcome == OutcomeKind::FAILED || (statusCode >= 400 && statusCode < 500);
    }
};

} // namespace site_audit::crawler
