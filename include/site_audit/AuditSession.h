#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include "audit/AuditReport.h"
#include "audit/CheckRegistry.h"
#include "crawler/HttpClient.h"
#include "crawler/models/CrawlConfig.h"

namespace site_audit {

namespace crawler {
class URLFrontier;
class PolitenessGate;
class CrawlMetrics;
class FetcherPool;
}

struct CrawlProgress {
    size_t queued = 0;
    size_t inFlight = 0;
    size_t visited = 0;
    size_t fetched = 0;
    size_t failed = 0;
    size_t skipped = 0;
    bool finished = false;
};

// One crawl plus audit, run to completion by a single blocking call.
// Sessions share no state, so several can run side by side.
class AuditSession {
public:
    using ProgressCallback = std::function<void(const CrawlProgress&)>;

    // Validates config and throws ConfigError before any network activity.
    // A null client selects the libcurl PageFetcher.
    explicit AuditSession(CrawlConfig config, std::shared_ptr<crawler::HttpClient> client = nullptr);
    AuditSession(CrawlConfig config, std::shared_ptr<crawler::HttpClient> client, audit::CheckRegistry registry);
    ~AuditSession();

    AuditSession(const AuditSession&) = delete;
    AuditSession& operator=(const AuditSession&) = delete;

    // Crawl until drained or out of budget, then run the checks. May be
    // called once; a second call throws std::logic_error.
    audit::AuditReport run();

    // Snapshot, safe to call from any thread while run() is in progress
    CrawlProgress progress() const;

    // Invoked from worker threads after every completed URL
    void setProgressCallback(ProgressCallback callback);

    const CrawlConfig& config() const { return config_; }
    audit::CheckRegistry& registry() { return registry_; }

private:
    void onTaskComplete(const crawler::UrlRecord& record);
    audit::AuditSummary summarize(const audit::AuditReport& report) const;

    const CrawlConfig config_;
    std::shared_ptr<crawler::HttpClient> client_;
    audit::CheckRegistry registry_;

    std::shared_ptr<crawler::CrawlMetrics> metrics_;
    std::unique_ptr<crawler::URLFrontier> frontier_;
    std::unique_ptr<crawler::PolitenessGate> gate_;
    std::unique_ptr<crawler::FetcherPool> pool_;

    std::atomic<bool> started_{false};
    std::atomic<bool> finished_{false};
    std::atomic<size_t> fetched_{0};
    std::atomic<size_t> failed_{0};
    std::atomic<size_t> skipped_{0};

    mutable std::mutex callbackMutex_;
    ProgressCallback progressCallback_;
};

} // namespace site_audit
