#include "FailureClassifier.h"
#include "../../include/Logger.h"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <ctime>
#include <iomanip>
#include <locale>
#include <sstream>

namespace site_audit::crawler {

FailureType FailureClassifier::classify(int httpCode, FetchErrorKind error, const CrawlConfig& config) {
    if (error != FetchErrorKind::NONE) {
        if (isPermanentTransportError(error)) {
            LOG_DEBUG("Classified as PERMANENT (" + fetchErrorKindToString(error) + ")");
            return FailureType::PERMANENT;
        }
        LOG_DEBUG("Classified as TEMPORARY (" + fetchErrorKindToString(error) + ")");
        return FailureType::TEMPORARY;
    }

    if (httpCode == 429) {
        LOG_DEBUG("Classified as RATE_LIMITED (HTTP 429)");
        return FailureType::RATE_LIMITED;
    }

    if (httpCode >= 100 && httpCode < 400) {
        return FailureType::NONE;
    }

    if (config.retryableHttpCodes.count(httpCode) > 0 || (httpCode >= 500 && httpCode < 600)) {
        LOG_DEBUG("Classified as TEMPORARY (HTTP " + std::to_string(httpCode) + ")");
        return FailureType::TEMPORARY;
    }

    LOG_DEBUG("Classified as PERMANENT (HTTP " + std::to_string(httpCode) + ")");
    return FailureType::PERMANENT;
}

bool FailureClassifier::shouldRetry(FailureType failureType, int retriesSoFar, int maxRetries) {
    if (failureType != FailureType::TEMPORARY && failureType != FailureType::RATE_LIMITED) {
        return false;
    }
    return retriesSoFar < maxRetries;
}

std::chrono::milliseconds FailureClassifier::calculateRetryDelay(int retryNumber, const CrawlConfig& config) {
    double multiplier = std::pow(config.backoffMultiplier, std::max(0, retryNumber - 1));
    double calculated = static_cast<double>(config.baseRetryDelay.count()) * multiplier;
    double capped = std::min(calculated, static_cast<double>(config.maxRetryDelay.count()));
    auto finalDelay = std::chrono::milliseconds(static_cast<long long>(capped));

    LOG_DEBUG("Calculated retry delay for retry " + std::to_string(retryNumber) +
              ": " + std::to_string(finalDelay.count()) + "ms");
    return finalDelay;
}

std::chrono::milliseconds FailureClassifier::retryDelayFor(const HttpResponse& response,
                                                           FailureType failureType,
                                                           int retryNumber,
                                                           const CrawlConfig& config) {
    if (failureType == FailureType::RATE_LIMITED) {
        auto retryAfter = parseRetryAfter(response.header("retry-after"));
        if (retryAfter) {
            return std::min(*retryAfter, config.maxRetryAfter);
        }
    }
    return calculateRetryDelay(retryNumber, config);
}

std::optional<std::chrono::milliseconds> FailureClassifier::parseRetryAfter(
    const std::string& value, std::chrono::system_clock::time_point now) {
    size_t start = value.find_first_not_of(" \t");
    if (start == std::string::npos) {
        return std::nullopt;
    }
    size_t end = value.find_last_not_of(" \t");
    std::string trimmed = value.substr(start, end - start + 1);

    if (std::all_of(trimmed.begin(), trimmed.end(), [](unsigned char c) { return std::isdigit(c); })) {
        if (trimmed.size() > 9) {
            return std::nullopt;
        }
        return std::chrono::milliseconds(std::stoll(trimmed) * 1000);
    }

    // IMF-fixdate, e.g. "Wed, 21 Oct 2015 07:28:00 GMT"
    std::tm tm{};
    std::istringstream in(trimmed);
    in.imbue(std::locale::classic());
    in >> std::get_time(&tm, "%a, %d %b %Y %H:%M:%S");
    if (in.fail()) {
        return std::nullopt;
    }
    std::time_t when = timegm(&tm);
    if (when == static_cast<std::time_t>(-1)) {
        return std::nullopt;
    }
    auto target = std::chrono::system_clock::from_time_t(when);
    if (target <= now) {
        return std::chrono::milliseconds(0);
    }
    return std::chrono::duration_cast<std::chrono::milliseconds>(target - now);
}

std::string FailureClassifier::describe(FailureType failureType) {
    switch (failureType) {
        case FailureType::NONE:
            return "NONE";
        case FailureType::TEMPORARY:
            return "TEMPORARY";
        case FailureType::RATE_LIMITED:
            return "RATE_LIMITED";
        case FailureType::PERMANENT:
            return "PERMANENT";
        default:
            return "INVALID";
    }
}

bool FailureClassifier::isPermanentTransportError(FetchErrorKind error) {
    switch (error) {
        case FetchErrorKind::DNS_FAILURE:   // host does not resolve
        case FetchErrorKind::TLS_FAILURE:   // certificate or handshake problem
        case FetchErrorKind::TOO_LARGE:     // body over maxBodyBytes
            return true;
        default:
            return false;
    }
}

} // namespace site_audit::crawler
