#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>
#include "CrawlMetrics.h"
#include "PageModelBuilder.h"
#include "PolitenessGate.h"
#include "URLFrontier.h"
#include "../../include/site_audit/crawler/HttpClient.h"
#include "../../include/site_audit/crawler/models/CrawlConfig.h"

namespace site_audit::crawler {

// Fixed-size set of workers draining a shared frontier. Each worker owns
// one task at a time from dequeue until markVisited.
class FetcherPool {
public:
    using CompletionCallback = std::function<void(const UrlRecord&)>;

    FetcherPool(const CrawlConfig& config,
                URLFrontier& frontier,
                PolitenessGate& gate,
                std::shared_ptr<HttpClient> client,
                std::shared_ptr<CrawlMetrics> metrics);

    // Called from worker threads after each task reaches its outcome
    void setCompletionCallback(CompletionCallback callback);

    // Blocks until the frontier is drained. When a deadline is given,
    // admission stops once it passes; in-flight work still completes.
    void run(std::optional<std::chrono::steady_clock::time_point> deadline = std::nullopt);

    bool deadlineReached() const { return deadlineReached_.load(); }

    // Models built so far; moves them out of the pool
    std::vector<PageModel> takePages();

    // Seed host plus configured allowed hosts
    const std::unordered_set<std::string>& internalHosts() const { return internalHosts_; }

    bool isInternal(const std::string& url) const;

    // Fetch one URL with retries and redirect resolution. Exposed so a
    // single URL can be audited without a running pool.
    FetchResult resolve(const std::string& url);

private:
    void workerLoop(size_t workerId);
    void processTask(const CrawlTask& task);
    // Empty when the deadline passed before the host admitted a request
    std::optional<HttpResponse> fetchWithRetries(const std::string& url, int& attempts);
    void enqueueDiscovered(const PageModel& page, const CrawlTask& task);
    void complete(const CrawlTask& task, UrlRecord record);
    bool pastDeadline() const;

    const CrawlConfig config_;
    URLFrontier& frontier_;
    PolitenessGate& gate_;
    std::shared_ptr<HttpClient> client_;
    std::shared_ptr<CrawlMetrics> metrics_;
    PageModelBuilder builder_;
    common::UrlNormalizer normalizer_;
    std::unordered_set<std::string> internalHosts_;

    std::optional<std::chrono::steady_clock::time_point> deadline_;
    std::atomic<bool> deadlineReached_{false};

    std::mutex pagesMutex_;
    std::vector<PageModel> pages_;

    CompletionCallback onComplete_;
};

} // namespace site_audit::crawler
