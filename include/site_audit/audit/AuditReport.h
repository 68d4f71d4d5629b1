#pragma once

#include <chrono>
#include <map>
#include <set>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "Finding.h"
#include "../crawler/models/UrlRecord.h"

namespace site_audit::audit {

struct AuditSummary {
    size_t pagesFetched = 0;
    size_t pagesSkippedRobots = 0;
    size_t pagesFailed = 0;
    size_t pagesMalformed = 0;
    size_t pagesSkippedBudget = 0;
    size_t totalRequests = 0;
    size_t retries = 0;
    size_t robotsUnavailableHosts = 0;
    size_t enqueueRefusedByBudget = 0;
    std::map<Severity, size_t> findingsBySeverity;
};

// Finalized output of one audit session, handed to reporting consumers
struct AuditReport {
    std::string seedUrl;
    std::chrono::system_clock::time_point startTime;
    std::chrono::system_clock::time_point endTime;
    bool deadlineReached = false;

    // Requested URL -> terminal outcome
    std::map<std::string, crawler::UrlRecord> inventory;

    // Sorted by (url, checkId, message)
    std::vector<Finding> findings;

    AuditSummary summary;

    // Distinct URLs reached after redirect resolution
    std::set<std::string> resolvedUrls() const;

    std::vector<Finding> findingsFor(const std::string& checkId) const;
};

nlohmann::json toJson(const AuditReport& report);

// Writes the JSON report; throws std::runtime_error if the file cannot be written
void writeReport(const AuditReport& report, const std::string& path);

} // namespace site_audit::audit
