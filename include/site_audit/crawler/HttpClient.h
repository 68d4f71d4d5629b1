#pragma once

#include <chrono>
#include <string>
#include "models/FetchResult.h"

namespace site_audit::crawler {

// Single-request HTTP transport. Implementations must not follow redirects
// and must be safe to call from several worker threads at once.
class HttpClient {
public:
    virtual ~HttpClient() = default;

    // Never throws for network problems; they are reported in the response
    virtual HttpResponse get(const std::string& url, std::chrono::milliseconds timeout) = 0;
};

} // namespace site_audit::crawler
