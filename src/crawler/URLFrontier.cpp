#include "URLFrontier.h"
#include "../../include/Logger.h"

namespace site_audit::crawler {

std::string enqueueStatusToString(EnqueueStatus status) {
    switch (status) {
        case EnqueueStatus::ACCEPTED: return "accepted";
        case EnqueueStatus::DUPLICATE: return "duplicate";
        case EnqueueStatus::TOO_DEEP: return "too-deep";
        case EnqueueStatus::BUDGET_EXCEEDED: return "budget-exceeded";
        case EnqueueStatus::MALFORMED: return "malformed";
        case EnqueueStatus::CLOSED: return "closed";
        default: return "unknown";
    }
}

std::string outcomeKindToString(OutcomeKind kind) {
    switch (kind) {
        case OutcomeKind::FETCHED: return "fetched";
        case OutcomeKind::FAILED: return "failed";
        case OutcomeKind::SKIPPED_ROBOTS: return "skipped(robots)";
        case OutcomeKind::SKIPPED_BUDGET: return "skipped(budget)";
        case OutcomeKind::MALFORMED: return "malformed";
        default: return "unknown";
    }
}

URLFrontier::URLFrontier(size_t maxDepth, size_t maxPages, common::UrlNormalizerOptions options)
    : maxDepth_(maxDepth), maxPages_(maxPages), normalizer_(std::move(options)) {
    LOG_DEBUG("URLFrontier created with maxDepth=" + std::to_string(maxDepth) +
              ", maxPages=" + std::to_string(maxPages));
}

EnqueueStatus URLFrontier::enqueue(CrawlTask task) {
    auto normalized = normalizer_.normalize(task.url);
    if (!normalized) {
        LOG_DEBUG("Rejecting malformed URL " + task.url + ": " + normalized.message);
        return EnqueueStatus::MALFORMED;
    }
    task.url = normalized.value;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return EnqueueStatus::CLOSED;
        }
        if (seen_.count(task.url) > 0) {
            return EnqueueStatus::DUPLICATE;
        }
        if (task.depth > maxDepth_) {
            return EnqueueStatus::TOO_DEEP;
        }
        if (admitted_ >= maxPages_) {
            ++refusedByBudget_;
            if (refusedByBudget_ == 1) {
                LOG_WARNING("Page budget of " + std::to_string(maxPages_) + " reached, refusing further URLs");
            }
            return EnqueueStatus::BUDGET_EXCEEDED;
        }

        seen_.insert(task.url);
        ++admitted_;
        LOG_DEBUG("Queued " + task.url + " at depth " + std::to_string(task.depth));
        queue_.push_back(std::move(task));
    }
    workAvailable_.notify_one();
    return EnqueueStatus::ACCEPTED;
}

std::optional<CrawlTask> URLFrontier::popLocked() {
    if (closed_ || queue_.empty()) {
        return std::nullopt;
    }
    CrawlTask task = std::move(queue_.front());
    queue_.pop_front();
    inFlight_.insert(task.url);
    return task;
}

std::optional<CrawlTask> URLFrontier::dequeue() {
    std::lock_guard<std::mutex> lock(mutex_);
    return popLocked();
}

std::optional<CrawlTask> URLFrontier::waitForTask(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    workAvailable_.wait_for(lock, timeout, [this] {
        return (!closed_ && !queue_.empty()) || drainedLocked();
    });
    return popLocked();
}

bool URLFrontier::markVisited(const std::string& url, UrlRecord record) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        inFlight_.erase(url);
        if (visited_.count(url) > 0) {
            LOG_WARNING("Ignoring second outcome for " + url);
            return false;
        }
        seen_.insert(url);
        visited_.emplace(url, std::move(record));
    }
    // Completion may have drained the frontier; wake every waiter
    workAvailable_.notify_all();
    return true;
}

size_t URLFrontier::close() {
    size_t skipped = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return 0;
        }
        closed_ = true;
        while (!queue_.empty()) {
            CrawlTask task = std::move(queue_.front());
            queue_.pop_front();
            UrlRecord record;
            record.url = task.url;
            record.outcome = OutcomeKind::SKIPPED_BUDGET;
            record.depth = task.depth;
            record.parentUrl = task.parentUrl;
            visited_.emplace(task.url, std::move(record));
            ++skipped;
        }
    }
    workAvailable_.notify_all();
    if (skipped > 0) {
        LOG_WARNING("Frontier closed with " + std::to_string(skipped) + " URLs still queued");
    } else {
        LOG_INFO("Frontier closed");
    }
    return skipped;
}

bool URLFrontier::isClosed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

bool URLFrontier::drainedLocked() const {
    return (queue_.empty() || closed_) && inFlight_.empty();
}

bool URLFrontier::isDrained() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return drainedLocked();
}

bool URLFrontier::isVisited(const std::string& url) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return visited_.count(url) > 0;
}

std::vector<UrlRecord> URLFrontier::records() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<UrlRecord> out;
    out.reserve(visited_.size());
    for (const auto& [url, record] : visited_) {
        out.push_back(record);
    }
    return out;
}

FrontierStats URLFrontier::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    FrontierStats stats;
    stats.queued = queue_.size();
    stats.inFlight = inFlight_.size();
    stats.visited = visited_.size();
    stats.admitted = admitted_;
    stats.refusedByBudget = refusedByBudget_;
    return stats;
}

} // namespace site_audit::crawler
