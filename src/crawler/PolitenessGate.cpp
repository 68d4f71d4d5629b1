#include "PolitenessGate.h"
#include "../../include/Logger.h"
#include "../../include/site_audit/common/UrlNormalizer.h"
#include <algorithm>

namespace site_audit::crawler {

using common::UrlNormalizer;

std::string robotsStateToString(RobotsState state) {
    switch (state) {
        case RobotsState::UNKNOWN: return "unknown";
        case RobotsState::FETCHING_ROBOTS: return "fetching-robots";
        case RobotsState::RULES_LOADED: return "rules-loaded";
        case RobotsState::ROBOTS_UNAVAILABLE: return "robots-unavailable";
        default: return "unknown";
    }
}

HostPermit::HostPermit(HostPermit&& other) noexcept : state_(std::move(other.state_)) {
    other.state_.reset();
}

HostPermit& HostPermit::operator=(HostPermit&& other) noexcept {
    if (this != &other) {
        release();
        state_ = std::move(other.state_);
        other.state_.reset();
    }
    return *this;
}

HostPermit::~HostPermit() {
    release();
}

void HostPermit::release() {
    if (!state_) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (state_->inFlight > 0) {
            state_->inFlight--;
        }
    }
    state_->changed.notify_all();
    state_.reset();
}

PolitenessGate::PolitenessGate(const CrawlConfig& config, std::shared_ptr<HttpClient> client,
                               std::shared_ptr<CrawlMetrics> metrics)
    : config_(config), client_(std::move(client)), metrics_(std::move(metrics)) {
    LOG_DEBUG("PolitenessGate initialized with perHostConcurrency=" + std::to_string(config_.perHostConcurrency) +
              ", delay floor=" + std::to_string(config_.politenessDelay.count()) + "ms");
}

std::shared_ptr<HostState> PolitenessGate::stateFor(const std::string& host) const {
    std::lock_guard<std::mutex> lock(tableMutex_);
    auto it = hosts_.find(host);
    return it == hosts_.end() ? nullptr : it->second;
}

std::shared_ptr<HostState> PolitenessGate::getOrCreate(const std::string& host) {
    std::lock_guard<std::mutex> lock(tableMutex_);
    auto& entry = hosts_[host];
    if (!entry) {
        entry = std::make_shared<HostState>();
        entry->effectiveDelay = config_.politenessDelay;
    }
    return entry;
}

void PolitenessGate::ensureRobots(const std::string& url, const std::string& host, HostState& state) {
    if (!config_.respectRobotsTxt) {
        return;
    }

    std::unique_lock<std::mutex> lock(state.mutex);
    if (state.robotsState == RobotsState::UNKNOWN) {
        state.robotsState = RobotsState::FETCHING_ROBOTS;
        lock.unlock();
        loadRobots(url, host, state);
        return;
    }
    state.changed.wait(lock, [&state] { return state.robotsState != RobotsState::FETCHING_ROBOTS; });
}

void PolitenessGate::loadRobots(const std::string& url, const std::string& host, HostState& state) {
    std::string robotsUrl = UrlNormalizer::extractOrigin(url) + "/robots.txt";
    LOG_DEBUG("Fetching " + robotsUrl);

    auto started = std::chrono::steady_clock::now();
    if (metrics_) {
        metrics_->recordRequest(host);
    }

    HttpResponse response;
    try {
        response = client_->get(robotsUrl, config_.requestTimeout);
    } catch (const std::exception& e) {
        response.error = FetchErrorKind::OTHER;
        response.errorMessage = e.what();
    }

    std::shared_ptr<const RobotsRuleSet> rules;
    std::string reason;
    if (response.transportFailed()) {
        reason = fetchErrorKindToString(response.error) + ": " + response.errorMessage;
    } else if (response.statusCode < 200 || response.statusCode >= 300) {
        reason = "HTTP " + std::to_string(response.statusCode);
    } else {
        rules = std::make_shared<const RobotsRuleSet>(RobotsTxtParser::parse(response.body));
    }

    bool unavailable = rules == nullptr;
    {
        std::lock_guard<std::mutex> lock(state.mutex);
        state.rules = rules;
        state.robotsState = unavailable ? RobotsState::ROBOTS_UNAVAILABLE : RobotsState::RULES_LOADED;

        std::chrono::milliseconds delay = config_.politenessDelay;
        if (rules) {
            auto crawlDelay = rules->crawlDelay(config_.userAgent);
            if (crawlDelay && *crawlDelay > config_.maxCrawlDelay) {
                LOG_WARNING_STREAM("Crawl-delay of " << crawlDelay->count() << "ms for " << host << " capped at "
                                   << config_.maxCrawlDelay.count() << "ms");
                crawlDelay = config_.maxCrawlDelay;
            }
            if (crawlDelay && *crawlDelay > delay) {
                delay = *crawlDelay;
            }
        }
        state.effectiveDelay = delay;
        // The robots.txt request itself counts towards the host's spacing
        state.requests++;
        state.lastFetch = started;
        state.nextAllowed = std::max(state.nextAllowed, started + delay);
    }
    state.changed.notify_all();

    if (unavailable) {
        {
            std::lock_guard<std::mutex> lock(tableMutex_);
            robotsUnavailable_++;
        }
        if (metrics_) {
            metrics_->recordRobotsUnavailable();
        }
        LOG_WARNING("robots.txt unavailable for " + host + " (" + reason + "), allowing all paths");
    } else {
        LOG_INFO("Loaded robots.txt for " + host);
    }
}

bool PolitenessGate::mayFetch(const std::string& url) {
    if (!config_.respectRobotsTxt) {
        return true;
    }
    std::string host = UrlNormalizer::extractHost(url);
    if (host.empty()) {
        return false;
    }

    auto state = getOrCreate(host);
    ensureRobots(url, host, *state);

    std::shared_ptr<const RobotsRuleSet> rules;
    {
        std::lock_guard<std::mutex> lock(state->mutex);
        rules = state->rules;
    }
    if (!rules) {
        return true;
    }
    return rules->isAllowed(UrlNormalizer::extractPathAndQuery(url), config_.userAgent);
}

std::chrono::milliseconds PolitenessGate::delay(const std::string& host) {
    auto state = stateFor(host);
    if (!state) {
        return config_.politenessDelay;
    }
    std::lock_guard<std::mutex> lock(state->mutex);
    return state->effectiveDelay;
}

HostPermit PolitenessGate::acquire(const std::string& url,
                                   std::optional<std::chrono::steady_clock::time_point> deadline) {
    std::string host = UrlNormalizer::extractHost(url);
    auto state = getOrCreate(host);
    ensureRobots(url, host, *state);

    std::unique_lock<std::mutex> lock(state->mutex);
    while (true) {
        auto now = std::chrono::steady_clock::now();
        bool blocked = state->inFlight >= config_.perHostConcurrency || now < state->nextAllowed;
        if (blocked && deadline && now >= *deadline) {
            LOG_DEBUG("Deadline passed while waiting for " + host);
            return HostPermit();
        }
        if (state->inFlight >= config_.perHostConcurrency) {
            if (deadline) {
                state->changed.wait_until(lock, *deadline);
            } else {
                state->changed.wait(lock);
            }
            continue;
        }
        if (now < state->nextAllowed) {
            auto wakeAt = deadline ? std::min(state->nextAllowed, *deadline) : state->nextAllowed;
            state->changed.wait_until(lock, wakeAt);
            continue;
        }

        state->inFlight++;
        state->maxObservedInFlight = std::max(state->maxObservedInFlight, state->inFlight);
        state->requests++;
        state->lastFetch = now;
        state->nextAllowed = now + state->effectiveDelay;
        break;
    }

    LOG_TRACE_STREAM("Permit granted for " << host << " (in flight: " << state->inFlight << ")");
    return HostPermit(state);
}

void PolitenessGate::recordRateLimit(const std::string& host, std::chrono::milliseconds duration) {
    auto state = getOrCreate(host);
    {
        std::lock_guard<std::mutex> lock(state->mutex);
        auto resumeAt = std::chrono::steady_clock::now() + duration;
        state->nextAllowed = std::max(state->nextAllowed, resumeAt);
    }
    state->changed.notify_all();
    LOG_WARNING("Host " + host + " rate limited, pausing for " + std::to_string(duration.count()) + "ms");
}

RobotsState PolitenessGate::robotsState(const std::string& host) const {
    auto state = stateFor(host);
    if (!state) {
        return RobotsState::UNKNOWN;
    }
    std::lock_guard<std::mutex> lock(state->mutex);
    return state->robotsState;
}

size_t PolitenessGate::maxObservedInFlight(const std::string& host) const {
    auto state = stateFor(host);
    if (!state) {
        return 0;
    }
    std::lock_guard<std::mutex> lock(state->mutex);
    return state->maxObservedInFlight;
}

size_t PolitenessGate::robotsUnavailableCount() const {
    std::lock_guard<std::mutex> lock(tableMutex_);
    return robotsUnavailable_;
}

} // namespace site_audit::crawler
