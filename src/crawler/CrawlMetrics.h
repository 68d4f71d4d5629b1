#pragma once

#include <atomic>
#include <map>
#include <mutex>
#include <string>
#include <unordered_map>
#include "../../include/site_audit/crawler/models/FailureType.h"

namespace site_audit::crawler {

struct HostMetricsSnapshot {
    size_t totalRequests = 0;
    size_t successfulRequests = 0;
    size_t failedRequests = 0;
    size_t retriedRequests = 0;
    size_t rateLimitedRequests = 0;

    double getSuccessRate() const {
        return totalRequests > 0 ? static_cast<double>(successfulRequests) / totalRequests : 0.0;
    }
};

// Crawl-wide counters shared by workers and the politeness gate
class CrawlMetrics {
public:
    CrawlMetrics() = default;

    // A request counts once per HTTP exchange, robots.txt included
    void recordRequest(const std::string& host);
    void recordSuccess(const std::string& host);
    void recordFailure(const std::string& host, FailureType type);
    void recordRetry(const std::string& host);
    void recordRateLimit(const std::string& host);
    void recordRobotsUnavailable() { robotsUnavailable_.fetch_add(1); }
    void recordSkippedRobots() { skippedRobots_.fetch_add(1); }
    void recordBudgetRefusal() { budgetRefusals_.fetch_add(1); }

    size_t getTotalRequests() const { return totalRequests_.load(); }
    size_t getSuccessfulRequests() const { return successfulRequests_.load(); }
    size_t getFailedRequests() const { return failedRequests_.load(); }
    size_t getRetriedRequests() const { return retriedRequests_.load(); }
    size_t getRateLimitedRequests() const { return rateLimitedRequests_.load(); }
    size_t getRobotsUnavailable() const { return robotsUnavailable_.load(); }
    size_t getSkippedRobots() const { return skippedRobots_.load(); }
    size_t getBudgetRefusals() const { return budgetRefusals_.load(); }

    double getSuccessRate() const {
        size_t total = totalRequests_.load();
        return total > 0 ? static_cast<double>(successfulRequests_.load()) / total : 0.0;
    }

    HostMetricsSnapshot getHostMetrics(const std::string& host) const;
    std::unordered_map<std::string, HostMetricsSnapshot> getAllHostMetrics() const;
    std::map<FailureType, size_t> getFailureTypeCounts() const;

    void logSummary() const;

private:
    std::atomic<size_t> totalRequests_{0};
    std::atomic<size_t> successfulRequests_{0};
    std::atomic<size_t> failedRequests_{0};
    std::atomic<size_t> retriedRequests_{0};
    std::atomic<size_t> rateLimitedRequests_{0};
    std::atomic<size_t> robotsUnavailable_{0};
    std::atomic<size_t> skippedRobots_{0};
    std::atomic<size_t> budgetRefusals_{0};

    mutable std::mutex hostMutex_;
    std::unordered_map<std::string, HostMetricsSnapshot> hostMetrics_;
    std::map<FailureType, size_t> failureTypeCounts_;
};

} // namespace site_audit::crawler
