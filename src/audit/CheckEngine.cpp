#include "CheckEngine.h"
#include "checks/Checks.h"
#include "../../include/Logger.h"
#include <algorithm>
#include <atomic>
#include <thread>

namespace site_audit::audit {

CheckEngine::CheckEngine(const CheckRegistry& registry, size_t workers)
    : registry_(registry), workers_(std::max<size_t>(1, workers)) {
}

std::vector<Finding> CheckEngine::runPage(const crawler::PageModel& page, const CrawlIndex& index) const {
    std::vector<Finding> findings;
    for (const auto& [id, check] : registry_.checks()) {
        try {
            auto produced = check(page, index);
            for (auto& finding : produced) {
                if (finding.checkId.empty()) {
                    finding.checkId = id;
                }
                findings.push_back(std::move(finding));
            }
        } catch (const std::exception& e) {
            LOG_WARNING("Check " + id + " failed on " + page.url + ": " + e.what());
            findings.push_back({checks::kCheckFailure, Severity::INFO, page.url,
                                "Check " + id + " did not complete", e.what()});
        }
    }
    return findings;
}

std::vector<Finding> CheckEngine::run(const std::vector<crawler::PageModel>& pages, const CrawlIndex& index) const {
    LOG_INFO("Running " + std::to_string(registry_.size()) + " checks over " + std::to_string(pages.size()) + " pages");

    size_t threadCount = std::min(workers_, std::max<size_t>(1, pages.size()));
    std::vector<std::vector<Finding>> perThread(threadCount);
    std::atomic<size_t> next{0};

    auto work = [&](size_t slot) {
        while (true) {
            size_t i = next.fetch_add(1);
            if (i >= pages.size()) {
                break;
            }
            auto findings = runPage(pages[i], index);
            perThread[slot].insert(perThread[slot].end(),
                                   std::make_move_iterator(findings.begin()),
                                   std::make_move_iterator(findings.end()));
        }
    };

    if (threadCount == 1) {
        work(0);
    } else {
        std::vector<std::thread> threads;
        threads.reserve(threadCount);
        for (size_t slot = 0; slot < threadCount; ++slot) {
            threads.emplace_back(work, slot);
        }
        for (auto& thread : threads) {
            thread.join();
        }
    }

    std::vector<Finding> merged;
    for (auto& list : perThread) {
        merged.insert(merged.end(), std::make_move_iterator(list.begin()), std::make_move_iterator(list.end()));
    }
    finalize(merged);

    LOG_INFO("Check engine produced " + std::to_string(merged.size()) + " findings");
    return merged;
}

void CheckEngine::finalize(std::vector<Finding>& findings) {
    std::sort(findings.begin(), findings.end(), findingLess);
    auto last = std::unique(findings.begin(), findings.end(), [](const Finding& a, const Finding& b) {
        return a.url == b.url && a.checkId == b.checkId && a.message == b.message &&
               a.evidence == b.evidence && a.severity == b.severity;
    });
    findings.erase(last, findings.end());
}

} // namespace site_audit::audit
