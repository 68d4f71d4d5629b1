#pragma once

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include "CrawlMetrics.h"
#include "RobotsTxtParser.h"
#include "../../include/site_audit/crawler/HttpClient.h"
#include "../../include/site_audit/crawler/models/CrawlConfig.h"

namespace site_audit::crawler {

enum class RobotsState {
    UNKNOWN,
    FETCHING_ROBOTS,
    RULES_LOADED,
    ROBOTS_UNAVAILABLE  // allow-all fallback
};

std::string robotsStateToString(RobotsState state);

// Everything the gate knows about one host. Guarded by its own mutex so
// unrelated hosts never contend.
struct HostState {
    std::mutex mutex;
    std::condition_variable changed;

    RobotsState robotsState = RobotsState::UNKNOWN;
    std::shared_ptr<const RobotsRuleSet> rules;
    std::chrono::milliseconds effectiveDelay{0};

    size_t inFlight = 0;
    size_t maxObservedInFlight = 0;
    std::chrono::steady_clock::time_point nextAllowed{};
    std::chrono::steady_clock::time_point lastFetch{};
    size_t requests = 0;
};

class PolitenessGate;

// Admission to send one request to a host. Releases the in-flight slot
// when destroyed.
class HostPermit {
public:
    HostPermit() = default;
    HostPermit(HostPermit&& other) noexcept;
    HostPermit& operator=(HostPermit&& other) noexcept;
    HostPermit(const HostPermit&) = delete;
    HostPermit& operator=(const HostPermit&) = delete;
    ~HostPermit();

    void release();
    bool valid() const { return state_ != nullptr; }

private:
    friend class PolitenessGate;
    explicit HostPermit(std::shared_ptr<HostState> state) : state_(std::move(state)) {}

    std::shared_ptr<HostState> state_;
};

class PolitenessGate {
public:
    PolitenessGate(const CrawlConfig& config, std::shared_ptr<HttpClient> client,
                   std::shared_ptr<CrawlMetrics> metrics = nullptr);

    // Path rule check against the configured user agent. Loads robots.txt
    // on first use for the host; concurrent callers wait for that load.
    bool mayFetch(const std::string& url);

    // max(robots crawl-delay, configured floor)
    std::chrono::milliseconds delay(const std::string& host);

    // Blocks until the host has a free slot and its spacing has elapsed.
    // Returns an invalid permit if the deadline passes first.
    HostPermit acquire(const std::string& url,
                       std::optional<std::chrono::steady_clock::time_point> deadline = std::nullopt);

    // Pushes the host's next admission time at least duration into the future
    void recordRateLimit(const std::string& host, std::chrono::milliseconds duration);

    RobotsState robotsState(const std::string& host) const;
    size_t maxObservedInFlight(const std::string& host) const;
    size_t robotsUnavailableCount() const;

private:
    std::shared_ptr<HostState> stateFor(const std::string& host) const;
    std::shared_ptr<HostState> getOrCreate(const std::string& host);
    void ensureRobots(const std::string& url, const std::string& host, HostState& state);
    void loadRobots(const std::string& url, const std::string& host, HostState& state);

    const CrawlConfig config_;
    std::shared_ptr<HttpClient> client_;
    std::shared_ptr<CrawlMetrics> metrics_;

    // Held only to look up or insert an entry
    mutable std::mutex tableMutex_;
    std::unordered_map<std::string, std::shared_ptr<HostState>> hosts_;
    size_t robotsUnavailable_ = 0;
};

} // namespace site_audit::crawler
