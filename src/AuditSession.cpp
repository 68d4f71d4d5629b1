#include "../include/site_audit/AuditSession.h"
#include "../include/Logger.h"
#include "audit/CheckEngine.h"
#include "crawler/CrawlMetrics.h"
#include "crawler/FetcherPool.h"
#include "crawler/PageFetcher.h"
#include "crawler/PolitenessGate.h"
#include "crawler/URLFrontier.h"
#include <stdexcept>

namespace site_audit {

using crawler::OutcomeKind;

namespace {

CrawlConfig validated(CrawlConfig config) {
    config.validate();
    return config;
}

} // namespace

AuditSession::AuditSession(CrawlConfig config, std::shared_ptr<crawler::HttpClient> client)
    : AuditSession(config, std::move(client), audit::makeDefaultRegistry(config)) {
}

AuditSession::AuditSession(CrawlConfig config, std::shared_ptr<crawler::HttpClient> client, audit::CheckRegistry registry)
    : config_(validated(std::move(config)))
    , client_(std::move(client))
    , registry_(std::move(registry))
    , metrics_(std::make_shared<crawler::CrawlMetrics>()) {
    if (!client_) {
        client_ = std::make_shared<crawler::PageFetcher>(config_);
    }
    frontier_ = std::make_unique<crawler::URLFrontier>(config_.maxDepth, config_.maxPages, config_.normalizerOptions());
    gate_ = std::make_unique<crawler::PolitenessGate>(config_, client_, metrics_);
    pool_ = std::make_unique<crawler::FetcherPool>(config_, *frontier_, *gate_, client_, metrics_);
    pool_->setCompletionCallback([this](const crawler::UrlRecord& record) { onTaskComplete(record); });

    LOG_DEBUG("AuditSession created for " + config_.seedUrl + " with " + std::to_string(registry_.size()) + " checks");
}

AuditSession::~AuditSession() = default;

void AuditSession::setProgressCallback(ProgressCallback callback) {
    std::lock_guard<std::mutex> lock(callbackMutex_);
    progressCallback_ = std::move(callback);
}

CrawlProgress AuditSession::progress() const {
    auto stats = frontier_->stats();
    CrawlProgress progress;
    progress.queued = stats.queued;
    progress.inFlight = stats.inFlight;
    progress.visited = stats.visited;
    progress.fetched = fetched_.load();
    progress.failed = failed_.load();
    progress.skipped = skipped_.load();
    progress.finished = finished_.load();
    return progress;
}

void AuditSession::onTaskComplete(const crawler::UrlRecord& record) {
    switch (record.outcome) {
        case OutcomeKind::FETCHED:
            fetched_.fetch_add(1);
            break;
        case OutcomeKind::FAILED:
        case OutcomeKind::MALFORMED:
            failed_.fetch_add(1);
            break;
        default:
            skipped_.fetch_add(1);
            break;
    }

    ProgressCallback callback;
    {
        std::lock_guard<std::mutex> lock(callbackMutex_);
        callback = progressCallback_;
    }
    if (callback) {
        callback(progress());
    }
}

audit::AuditReport AuditSession::run() {
    if (started_.exchange(true)) {
        throw std::logic_error("AuditSession::run may only be called once");
    }

    audit::AuditReport report;
    report.seedUrl = config_.seedUrl;
    report.startTime = std::chrono::system_clock::now();
    LOG_INFO("Starting audit of " + config_.seedUrl);

    crawler::CrawlTask seed{config_.seedUrl, 0, ""};
    auto status = frontier_->enqueue(seed);
    if (status != crawler::EnqueueStatus::ACCEPTED) {
        // validate() already proved the seed normalizes, so this is a budget of zero
        LOG_WARNING("Seed URL not admitted: " + crawler::enqueueStatusToString(status));
    }

    std::optional<std::chrono::steady_clock::time_point> deadline;
    if (config_.timeLimit.count() > 0) {
        deadline = std::chrono::steady_clock::now() + config_.timeLimit;
    }
    pool_->run(deadline);
    report.deadlineReached = pool_->deadlineReached();

    auto records = frontier_->records();
    auto pages = pool_->takePages();
    std::vector<std::string> internalHosts(pool_->internalHosts().begin(), pool_->internalHosts().end());
    auto index = audit::CrawlIndex::build(records, pages, internalHosts);

    audit::CheckEngine engine(registry_, std::max<size_t>(1, config_.maxConcurrentConnections));
    report.findings = engine.run(pages, index);

    for (auto& record : records) {
        std::string url = record.url;
        report.inventory.emplace(std::move(url), std::move(record));
    }
    report.summary = summarize(report);
    report.endTime = std::chrono::system_clock::now();
    finished_.store(true);

    metrics_->logSummary();
    LOG_INFO_STREAM("Audit of " << config_.seedUrl << " finished: " << report.summary.pagesFetched << " fetched, "
                    << report.summary.pagesFailed << " failed, " << report.summary.pagesSkippedRobots
                    << " skipped by robots.txt, " << report.summary.pagesSkippedBudget << " skipped by budget, "
                    << report.findings.size() << " findings");
    return report;
}

audit::AuditSummary AuditSession::summarize(const audit::AuditReport& report) const {
    audit::AuditSummary summary;
    for (const auto& [url, record] : report.inventory) {
        switch (record.outcome) {
            case OutcomeKind::FETCHED: summary.pagesFetched++; break;
            case OutcomeKind::FAILED: summary.pagesFailed++; break;
            case OutcomeKind::SKIPPED_ROBOTS: summary.pagesSkippedRobots++; break;
            case OutcomeKind::SKIPPED_BUDGET: summary.pagesSkippedBudget++; break;
            case OutcomeKind::MALFORMED: summary.pagesMalformed++; break;
        }
    }
    summary.totalRequests = metrics_->getTotalRequests();
    summary.retries = metrics_->getRetriedRequests();
    summary.robotsUnavailableHosts = gate_->robotsUnavailableCount();
    summary.enqueueRefusedByBudget = frontier_->stats().refusedByBudget;
    for (const auto& finding : report.findings) {
        summary.findingsBySeverity[finding.severity]++;
    }
    return summary;
}

} // namespace site_audit
