#pragma once

namespace site_audit::crawler {

// How a failed fetch attempt is handled
enum class FailureType {
    NONE,         // Not a failure
    TEMPORARY,    // Retry with exponential backoff
    RATE_LIMITED, // Retry after Retry-After or backoff
    PERMANENT     // Terminal (4xx other than 408/429, DNS, bad URL)
};

} // namespace site_audit::crawler
