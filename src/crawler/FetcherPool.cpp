#include "FetcherPool.h"
#include "FailureClassifier.h"
#include "../../include/Logger.h"
#include <algorithm>
#include <cctype>
#include <thread>

namespace site_audit::crawler {

using common::UrlNormalizer;

namespace {

constexpr std::chrono::milliseconds kIdleWait{50};

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool isRedirect(int status) {
    return status == 301 || status == 302 || status == 303 || status == 307 || status == 308;
}

} // namespace

FetcherPool::FetcherPool(const CrawlConfig& config,
                         URLFrontier& frontier,
                         PolitenessGate& gate,
                         std::shared_ptr<HttpClient> client,
                         std::shared_ptr<CrawlMetrics> metrics)
    : config_(config)
    , frontier_(frontier)
    , gate_(gate)
    , client_(std::move(client))
    , metrics_(metrics ? std::move(metrics) : std::make_shared<CrawlMetrics>())
    , builder_(config.normalizerOptions())
    , normalizer_(config.normalizerOptions()) {
    auto seed = normalizer_.normalize(config_.seedUrl);
    if (seed) {
        internalHosts_.insert(UrlNormalizer::extractHost(seed.value));
    }
    for (const auto& host : config_.allowedHosts) {
        internalHosts_.insert(toLower(host));
    }
}

void FetcherPool::setCompletionCallback(CompletionCallback callback) {
    onComplete_ = std::move(callback);
}

bool FetcherPool::isInternal(const std::string& url) const {
    return internalHosts_.count(UrlNormalizer::extractHost(url)) > 0;
}

bool FetcherPool::pastDeadline() const {
    return deadline_ && std::chrono::steady_clock::now() >= *deadline_;
}

void FetcherPool::run(std::optional<std::chrono::steady_clock::time_point> deadline) {
    deadline_ = deadline;
    size_t workerCount = std::max<size_t>(1, config_.maxConcurrentConnections);
    LOG_INFO("Starting " + std::to_string(workerCount) + " fetcher workers");

    std::vector<std::thread> workers;
    workers.reserve(workerCount);
    for (size_t i = 0; i < workerCount; ++i) {
        workers.emplace_back(&FetcherPool::workerLoop, this, i);
    }
    for (auto& worker : workers) {
        worker.join();
    }
    LOG_INFO("All fetcher workers finished");
}

void FetcherPool::workerLoop(size_t workerId) {
    LOG_DEBUG("Worker " + std::to_string(workerId) + " started");
    while (true) {
        if (pastDeadline() && !frontier_.isClosed()) {
            if (!deadlineReached_.exchange(true)) {
                LOG_WARNING("Crawl time limit reached, stopping admission");
            }
            frontier_.close();
        }

        auto task = frontier_.waitForTask(kIdleWait);
        if (!task) {
            if (frontier_.isDrained()) {
                break;
            }
            continue;
        }

        try {
            processTask(*task);
        } catch (const std::exception& e) {
            LOG_ERROR_STREAM("Unexpected error while processing " << task->url << ": " << e.what());
            UrlRecord record;
            record.url = task->url;
            record.finalUrl = task->url;
            record.outcome = OutcomeKind::FAILED;
            record.depth = task->depth;
            record.parentUrl = task->parentUrl;
            record.error = e.what();
            complete(*task, std::move(record));
        }
    }
    LOG_DEBUG("Worker " + std::to_string(workerId) + " exiting");
}

void FetcherPool::processTask(const CrawlTask& task) {
    LOG_DEBUG("Processing " + task.url + " (depth " + std::to_string(task.depth) + ")");

    UrlRecord record;
    record.url = task.url;
    record.finalUrl = task.url;
    record.depth = task.depth;
    record.parentUrl = task.parentUrl;

    if (!gate_.mayFetch(task.url)) {
        LOG_INFO("Skipping " + task.url + ": disallowed by robots.txt");
        metrics_->recordSkippedRobots();
        record.outcome = OutcomeKind::SKIPPED_ROBOTS;
        complete(task, std::move(record));
        return;
    }

    FetchResult fetched = resolve(task.url);
    PageModel page = builder_.build(fetched);
    if (!fetched.malformedLocation.empty()) {
        page.malformedLinks.push_back({fetched.malformedLocation, "malformed Location header"});
    }

    record.finalUrl = fetched.finalUrl;
    record.statusCode = fetched.statusCode;
    record.redirectChain = fetched.redirectChain;
    record.attempts = fetched.attempts;
    record.latency = fetched.latency;
    record.error = fetched.errorMessage;

    if (fetched.deadlineExpired) {
        if (!deadlineReached_.exchange(true)) {
            LOG_WARNING("Crawl time limit reached, stopping admission");
        }
        record.outcome = OutcomeKind::SKIPPED_BUDGET;
    } else if (!fetched.malformedLocation.empty()) {
        record.outcome = OutcomeKind::MALFORMED;
    } else if (fetched.blockedByRobots) {
        metrics_->recordSkippedRobots();
        record.outcome = OutcomeKind::SKIPPED_ROBOTS;
    } else if (fetched.error == FetchErrorKind::NONE && !fetched.redirectLoop &&
               fetched.statusCode >= 200 && fetched.statusCode < 300) {
        record.outcome = OutcomeKind::FETCHED;
    } else {
        record.outcome = OutcomeKind::FAILED;
    }

    if (record.outcome == OutcomeKind::FETCHED && page.isHtml) {
        enqueueDiscovered(page, task);
    }

    if (record.outcome != OutcomeKind::SKIPPED_ROBOTS && record.outcome != OutcomeKind::SKIPPED_BUDGET) {
        std::lock_guard<std::mutex> lock(pagesMutex_);
        pages_.push_back(std::move(page));
    }

    complete(task, std::move(record));
}

FetchResult FetcherPool::resolve(const std::string& url) {
    FetchResult result;
    result.url = url;

    std::string current = url;
    std::unordered_set<std::string> visitedHops{url};
    auto started = std::chrono::steady_clock::now();
    HttpResponse response;

    while (true) {
        auto attempt = fetchWithRetries(current, result.attempts);
        if (!attempt) {
            response = HttpResponse();
            response.errorMessage = "time limit reached before the request was sent";
            result.deadlineExpired = true;
            break;
        }
        response = std::move(*attempt);
        if (response.transportFailed() || !isRedirect(response.statusCode)) {
            break;
        }

        std::string location = response.header("location");
        if (location.empty()) {
            LOG_WARNING("Redirect without Location header at " + current);
            break;
        }

        auto next = normalizer_.normalize(location, current);
        if (!next) {
            LOG_WARNING("Malformed Location '" + location + "' at " + current + ": " + next.message);
            result.malformedLocation = location;
            break;
        }

        if (visitedHops.count(next.value) > 0) {
            LOG_WARNING("Redirect loop detected at " + current + " -> " + next.value);
            result.redirectChain.push_back(next.value);
            result.redirectLoop = true;
            break;
        }

        if (result.redirectChain.size() >= config_.maxRedirects) {
            LOG_WARNING("Too many redirects starting at " + url);
            response.errorMessage = "too many redirects";
            break;
        }

        result.redirectChain.push_back(next.value);
        visitedHops.insert(next.value);

        if (!gate_.mayFetch(next.value)) {
            LOG_INFO("Redirect target " + next.value + " disallowed by robots.txt");
            current = next.value;
            response = HttpResponse();
            response.errorMessage = "redirect target disallowed by robots.txt";
            result.blockedByRobots = true;
            break;
        }
        current = next.value;
    }

    result.finalUrl = current;
    result.statusCode = response.statusCode;
    result.headers = std::move(response.headers);
    result.body = std::move(response.body);
    result.error = response.error;
    result.errorMessage = std::move(response.errorMessage);
    if (result.redirectLoop) {
        result.errorMessage = "redirect loop";
    }
    result.latency = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    return result;
}

std::optional<HttpResponse> FetcherPool::fetchWithRetries(const std::string& url, int& attempts) {
    std::string host = UrlNormalizer::extractHost(url);
    int retries = 0;

    while (true) {
        HttpResponse response;
        {
            HostPermit permit = gate_.acquire(url, deadline_);
            if (!permit.valid()) {
                LOG_INFO("Time limit reached before " + url + " was admitted");
                return std::nullopt;
            }
            metrics_->recordRequest(host);
            try {
                response = client_->get(url, config_.requestTimeout);
            } catch (const std::exception& e) {
                response = HttpResponse();
                response.error = FetchErrorKind::OTHER;
                response.errorMessage = e.what();
            }
        }
        attempts++;

        FailureType type = FailureClassifier::classify(response.statusCode, response.error, config_);
        if (type == FailureType::NONE) {
            metrics_->recordSuccess(host);
            return response;
        }

        std::chrono::milliseconds delay = FailureClassifier::retryDelayFor(response, type, retries + 1, config_);
        if (type == FailureType::RATE_LIMITED) {
            metrics_->recordRateLimit(host);
            gate_.recordRateLimit(host, delay);
        }

        if (!FailureClassifier::shouldRetry(type, retries, config_.maxRetries) || pastDeadline()) {
            metrics_->recordFailure(host, type);
            if (type != FailureType::PERMANENT) {
                LOG_WARNING_STREAM("Giving up on " << url << " after " << attempts << " attempts ("
                                   << (response.transportFailed() ? fetchErrorKindToString(response.error)
                                                                  : "HTTP " + std::to_string(response.statusCode))
                                   << ")");
            }
            return response;
        }

        retries++;
        metrics_->recordRetry(host);
        LOG_WARNING_STREAM("Retry " << retries << "/" << config_.maxRetries << " for " << url << " in "
                           << delay.count() << "ms (" << FailureClassifier::describe(type) << ")");

        // Rate-limited hosts are already paused by the gate
        if (type != FailureType::RATE_LIMITED && delay.count() > 0) {
            std::this_thread::sleep_for(delay);
        }
    }
}

void FetcherPool::enqueueDiscovered(const PageModel& page, const CrawlTask& task) {
    std::vector<std::string> targets;
    for (const auto& link : page.links) {
        if (isInternal(link)) {
            targets.push_back(link);
        }
    }
    if (config_.fetchResources) {
        for (const auto& resource : page.resources) {
            if (isInternal(resource.url)) {
                targets.push_back(resource.url);
            }
        }
    }

    size_t accepted = 0;
    for (const auto& target : targets) {
        CrawlTask child{target, task.depth + 1, task.url};
        EnqueueStatus status = frontier_.enqueue(std::move(child));
        if (status == EnqueueStatus::ACCEPTED) {
            accepted++;
        } else if (status == EnqueueStatus::BUDGET_EXCEEDED) {
            metrics_->recordBudgetRefusal();
        }
    }
    LOG_DEBUG_STREAM("Discovered " << targets.size() << " internal URLs on " << task.url << ", "
                     << accepted << " queued");
}

void FetcherPool::complete(const CrawlTask& task, UrlRecord record) {
    LOG_INFO("[" + outcomeKindToString(record.outcome) + "] " + task.url +
             (record.statusCode > 0 ? " (" + std::to_string(record.statusCode) + ")" : ""));
    UrlRecord copy = record;
    // Children are already queued, so the frontier cannot drain early
    if (frontier_.markVisited(task.url, std::move(record)) && onComplete_) {
        onComplete_(copy);
    }
}

std::vector<PageModel> FetcherPool::takePages() {
    std::lock_guard<std::mutex> lock(pagesMutex_);
    std::vector<PageModel> out = std::move(pages_);
    pages_.clear();
    return out;
}

} // namespace site_audit::crawler
