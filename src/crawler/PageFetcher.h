#pragma once

#include <chrono>
#include <string>
#include <curl/curl.h>
#include "../../include/site_audit/crawler/HttpClient.h"
#include "../../include/site_audit/crawler/models/CrawlConfig.h"

namespace site_audit::crawler {

// HttpClient over libcurl. Each request uses its own easy handle, so one
// PageFetcher can be shared by every worker.
class PageFetcher : public HttpClient {
public:
    // Throws std::runtime_error if libcurl cannot be initialised
    explicit PageFetcher(const CrawlConfig& config);
    ~PageFetcher() override;

    HttpResponse get(const std::string& url, std::chrono::milliseconds timeout) override;

    static FetchErrorKind mapCurlError(CURLcode code, bool bodyTooLarge);

private:
    static size_t writeCallback(void* contents, size_t size, size_t nmemb, void* userp);
    static size_t headerCallback(char* buffer, size_t size, size_t nitems, void* userp);

    std::string userAgent_;
    std::chrono::milliseconds connectTimeout_;
    size_t maxBodyBytes_;
    bool verifySSL_;
};

} // namespace site_audit::crawler
