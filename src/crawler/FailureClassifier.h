#pragma once

#include <chrono>
#include <optional>
#include <string>
#include "../../include/site_audit/crawler/models/CrawlConfig.h"
#include "../../include/site_audit/crawler/models/FailureType.h"
#include "../../include/site_audit/crawler/models/FetchResult.h"

namespace site_audit::crawler {

class FailureClassifier {
public:
    /**
     * Classify one HTTP exchange
     * @param httpCode HTTP status code (0 if no response was received)
     * @param error Transport error reported by the HttpClient
     * @param config Crawl configuration with the retryable status codes
     * @return NONE for 1xx-3xx responses, otherwise how to handle the failure
     */
    static FailureType classify(int httpCode, FetchErrorKind error, const CrawlConfig& config);

    /**
     * @param retriesSoFar Retries already performed for this URL
     * @return true if another attempt should be made
     */
    static bool shouldRetry(FailureType failureType, int retriesSoFar, int maxRetries);

    /**
     * Exponential backoff: base * multiplier^(retryNumber - 1), capped at maxRetryDelay
     * @param retryNumber 1 for the first retry
     */
    static std::chrono::milliseconds calculateRetryDelay(int retryNumber, const CrawlConfig& config);

    /**
     * Delay before the next attempt. A rate-limited response with a usable
     * Retry-After is honoured (capped at maxRetryAfter); everything else
     * uses the backoff.
     */
    static std::chrono::milliseconds retryDelayFor(const HttpResponse& response,
                                                   FailureType failureType,
                                                   int retryNumber,
                                                   const CrawlConfig& config);

    /**
     * Parse a Retry-After value: delta-seconds or an IMF-fixdate HTTP-date.
     * A date in the past yields zero.
     */
    static std::optional<std::chrono::milliseconds> parseRetryAfter(
        const std::string& value,
        std::chrono::system_clock::time_point now = std::chrono::system_clock::now());

    static std::string describe(FailureType failureType);

private:
    static bool isPermanentTransportError(FetchErrorKind error);
};

} // namespace site_audit::crawler
