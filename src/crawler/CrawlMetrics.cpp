#include "CrawlMetrics.h"
#include "FailureClassifier.h"
#include "../../include/Logger.h"
#include <algorithm>
#include <iomanip>
#include <sstream>
#include <vector>

namespace site_audit::crawler {

void CrawlMetrics::recordRequest(const std::string& host) {
    totalRequests_.fetch_add(1);
    std::lock_guard<std::mutex> lock(hostMutex_);
    hostMetrics_[host].totalRequests++;
}

void CrawlMetrics::recordSuccess(const std::string& host) {
    successfulRequests_.fetch_add(1);
    std::lock_guard<std::mutex> lock(hostMutex_);
    hostMetrics_[host].successfulRequests++;
}

void CrawlMetrics::recordFailure(const std::string& host, FailureType type) {
    failedRequests_.fetch_add(1);
    std::lock_guard<std::mutex> lock(hostMutex_);
    hostMetrics_[host].failedRequests++;
    failureTypeCounts_[type]++;
}

void CrawlMetrics::recordRetry(const std::string& host) {
    retriedRequests_.fetch_add(1);
    std::lock_guard<std::mutex> lock(hostMutex_);
    hostMetrics_[host].retriedRequests++;
}

void CrawlMetrics::recordRateLimit(const std::string& host) {
    rateLimitedRequests_.fetch_add(1);
    std::lock_guard<std::mutex> lock(hostMutex_);
    hostMetrics_[host].rateLimitedRequests++;
}

HostMetricsSnapshot CrawlMetrics::getHostMetrics(const std::string& host) const {
    std::lock_guard<std::mutex> lock(hostMutex_);
    auto it = hostMetrics_.find(host);
    return it == hostMetrics_.end() ? HostMetricsSnapshot{} : it->second;
}

std::unordered_map<std::string, HostMetricsSnapshot> CrawlMetrics::getAllHostMetrics() const {
    std::lock_guard<std::mutex> lock(hostMutex_);
    return hostMetrics_;
}

std::map<FailureType, size_t> CrawlMetrics::getFailureTypeCounts() const {
    std::lock_guard<std::mutex> lock(hostMutex_);
    return failureTypeCounts_;
}

void CrawlMetrics::logSummary() const {
    std::ostringstream oss;

    size_t total = getTotalRequests();
    size_t failed = getFailedRequests();

    oss << "\n=== CRAWL METRICS SUMMARY ===\n";
    oss << "Total Requests: " << total << "\n";
    oss << "Successful: " << getSuccessfulRequests() << " (" << std::fixed << std::setprecision(1) << (getSuccessRate() * 100) << "%)\n";
    oss << "Failed: " << failed << " (" << std::fixed << std::setprecision(1) << (total > 0 ? (static_cast<double>(failed) / total * 100) : 0.0) << "%)\n";
    oss << "Retried: " << getRetriedRequests() << "\n";
    oss << "Rate Limited: " << getRateLimitedRequests() << "\n";
    oss << "Skipped by robots.txt: " << getSkippedRobots() << "\n";
    oss << "Hosts without robots.txt: " << getRobotsUnavailable() << "\n";
    oss << "Budget refusals: " << getBudgetRefusals() << "\n";

    auto failureTypes = getFailureTypeCounts();
    if (!failureTypes.empty()) {
        oss << "\nFailure Types:\n";
        for (const auto& [type, count] : failureTypes) {
            oss << "  " << FailureClassifier::describe(type) << ": " << count << "\n";
        }
    }

    auto hostMetrics = getAllHostMetrics();
    if (!hostMetrics.empty()) {
        oss << "\nHosts by Request Count:\n";

        std::vector<std::pair<std::string, HostMetricsSnapshot>> sortedHosts(hostMetrics.begin(), hostMetrics.end());
        std::sort(sortedHosts.begin(), sortedHosts.end(),
                  [](const auto& a, const auto& b) {
                      if (a.second.totalRequests != b.second.totalRequests) {
                          return a.second.totalRequests > b.second.totalRequests;
                      }
                      return a.first < b.first;
                  });

        size_t maxHosts = std::min(sortedHosts.size(), size_t(10));
        for (size_t i = 0; i < maxHosts; ++i) {
            const auto& [host, metrics] = sortedHosts[i];
            oss << "  " << host << ": " << metrics.totalRequests << " requests, "
                << std::fixed << std::setprecision(1) << (metrics.getSuccessRate() * 100) << "% success, "
                << metrics.retriedRequests << " retries";
            if (metrics.rateLimitedRequests > 0) {
                oss << " [" << metrics.rateLimitedRequests << " rate limited]";
            }
            oss << "\n";
        }
    }

    oss << "===============================";
    LOG_INFO(oss.str());
}

} // namespace site_audit::crawler
