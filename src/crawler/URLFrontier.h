#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>
#include "../../include/site_audit/common/UrlNormalizer.h"
#include "../../include/site_audit/crawler/models/CrawlTask.h"
#include "../../include/site_audit/crawler/models/UrlRecord.h"

namespace site_audit::crawler {

enum class EnqueueStatus {
    ACCEPTED,
    DUPLICATE,        // already queued, in flight or visited
    TOO_DEEP,
    BUDGET_EXCEEDED,  // maxPages reached
    MALFORMED,
    CLOSED            // admission stopped by the deadline
};

std::string enqueueStatusToString(EnqueueStatus status);

struct FrontierStats {
    size_t queued = 0;
    size_t inFlight = 0;
    size_t visited = 0;
    size_t admitted = 0;
    size_t refusedByBudget = 0;
};

// Breadth-first work queue plus the visited set. A single mutex guards all
// of it; no I/O happens while it is held.
class URLFrontier {
public:
    URLFrontier(size_t maxDepth, size_t maxPages,
                common::UrlNormalizerOptions options = common::UrlNormalizerOptions());

    // Inserts the task unless its normalized URL is already known, it is
    // deeper than maxDepth, or a budget has been reached
    EnqueueStatus enqueue(CrawlTask task);

    // Next task in discovery order, nullopt when the queue is empty
    std::optional<CrawlTask> dequeue();

    // Like dequeue() but waits up to timeout for work to appear. Returns
    // early with nullopt once the frontier is drained.
    std::optional<CrawlTask> waitForTask(std::chrono::milliseconds timeout);

    // Records the terminal outcome for url. Returns false if url already
    // has one; the first record wins.
    bool markVisited(const std::string& url, UrlRecord record);

    // Stops all further admission. Tasks still queued are recorded as
    // SKIPPED_BUDGET; returns how many.
    size_t close();

    bool isClosed() const;

    // Queue empty and no task in flight
    bool isDrained() const;

    bool isVisited(const std::string& url) const;

    std::vector<UrlRecord> records() const;

    FrontierStats stats() const;

private:
    bool drainedLocked() const;
    std::optional<CrawlTask> popLocked();

    const size_t maxDepth_;
    const size_t maxPages_;
    const common::UrlNormalizer normalizer_;

    mutable std::mutex mutex_;
    std::condition_variable workAvailable_;
    std::deque<CrawlTask> queue_;
    // Every URL ever admitted: queued, in flight or visited
    std::unordered_set<std::string> seen_;
    std::unordered_set<std::string> inFlight_;
    std::map<std::string, UrlRecord> visited_;
    size_t admitted_ = 0;
    size_t refusedByBudget_ = 0;
    bool closed_ = false;
};

} // namespace site_audit::crawler
