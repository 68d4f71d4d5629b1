#include "PageFetcher.h"
#include "../../include/Logger.h"
#include <algorithm>
#include <cctype>
#include <mutex>
#include <stdexcept>

namespace site_audit::crawler {

namespace {

struct BodyBuffer {
    std::string data;
    size_t limit = 0;
    bool tooLarge = false;
};

std::once_flag curlGlobalInitFlag;
CURLcode curlGlobalInitResult = CURLE_OK;

} // namespace

std::string fetchErrorKindToString(FetchErrorKind kind) {
    switch (kind) {
        case FetchErrorKind::NONE: return "none";
        case FetchErrorKind::TIMEOUT: return "timeout";
        case FetchErrorKind::CONNECTION_REFUSED: return "connection-refused";
        case FetchErrorKind::DNS_FAILURE: return "dns-failure";
        case FetchErrorKind::TLS_FAILURE: return "tls-failure";
        case FetchErrorKind::TOO_LARGE: return "too-large";
        case FetchErrorKind::OTHER: return "other";
        default: return "unknown";
    }
}

PageFetcher::PageFetcher(const CrawlConfig& config)
    : userAgent_(config.userAgent)
    , connectTimeout_(config.connectTimeout)
    , maxBodyBytes_(config.maxBodyBytes)
    , verifySSL_(config.verifySSL) {
    std::call_once(curlGlobalInitFlag, [] {
        curlGlobalInitResult = curl_global_init(CURL_GLOBAL_DEFAULT);
    });
    if (curlGlobalInitResult != CURLE_OK) {
        LOG_ERROR("Failed to initialize CURL: " + std::string(curl_easy_strerror(curlGlobalInitResult)));
        throw std::runtime_error("Failed to initialize CURL");
    }
    LOG_DEBUG("PageFetcher created with userAgent: " + userAgent_);
}

PageFetcher::~PageFetcher() {
    LOG_DEBUG("PageFetcher destroyed");
}

size_t PageFetcher::writeCallback(void* contents, size_t size, size_t nmemb, void* userp) {
    size_t realSize = size * nmemb;
    auto* buffer = static_cast<BodyBuffer*>(userp);
    if (buffer->data.size() + realSize > buffer->limit) {
        buffer->tooLarge = true;
        // Returning a short count aborts the transfer with CURLE_WRITE_ERROR
        return 0;
    }
    buffer->data.append(static_cast<char*>(contents), realSize);
    return realSize;
}

size_t PageFetcher::headerCallback(char* buffer, size_t size, size_t nitems, void* userp) {
    size_t realSize = size * nitems;
    auto* headers = static_cast<HeaderMap*>(userp);
    std::string line(buffer, realSize);

    if (line.rfind("HTTP/", 0) == 0) {
        // Interim responses (100 Continue) start a fresh header block
        headers->clear();
        return realSize;
    }

    size_t colon = line.find(':');
    if (colon == std::string::npos) {
        return realSize;
    }
    std::string name = line.substr(0, colon);
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    std::string value = line.substr(colon + 1);
    value.erase(0, value.find_first_not_of(" \t"));
    size_t end = value.find_last_not_of(" \t\r\n");
    value = end == std::string::npos ? std::string() : value.substr(0, end + 1);

    auto it = headers->find(name);
    if (it == headers->end()) {
        headers->emplace(std::move(name), std::move(value));
    } else {
        it->second += ", " + value;
    }
    return realSize;
}

FetchErrorKind PageFetcher::mapCurlError(CURLcode code, bool bodyTooLarge) {
    switch (code) {
        case CURLE_OK:
            return FetchErrorKind::NONE;
        case CURLE_OPERATION_TIMEDOUT:
            return FetchErrorKind::TIMEOUT;
        case CURLE_COULDNT_CONNECT:
            return FetchErrorKind::CONNECTION_REFUSED;
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_RESOLVE_PROXY:
            return FetchErrorKind::DNS_FAILURE;
        case CURLE_SSL_CONNECT_ERROR:
        case CURLE_PEER_FAILED_VERIFICATION:
        case CURLE_SSL_CERTPROBLEM:
        case CURLE_SSL_CIPHER:
        case CURLE_SSL_CACERT_BADFILE:
            return FetchErrorKind::TLS_FAILURE;
        case CURLE_FILESIZE_EXCEEDED:
            return FetchErrorKind::TOO_LARGE;
        case CURLE_WRITE_ERROR:
            return bodyTooLarge ? FetchErrorKind::TOO_LARGE : FetchErrorKind::OTHER;
        default:
            return FetchErrorKind::OTHER;
    }
}

HttpResponse PageFetcher::get(const std::string& url, std::chrono::milliseconds timeout) {
    HttpResponse response;
    auto started = std::chrono::steady_clock::now();

    CURL* curl = curl_easy_init();
    if (!curl) {
        response.error = FetchErrorKind::OTHER;
        response.errorMessage = "Failed to create CURL handle";
        LOG_ERROR(response.errorMessage + " for " + url);
        return response;
    }

    BodyBuffer body;
    body.limit = maxBodyBytes_;
    char errbuf[CURL_ERROR_SIZE] = {0};

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_PROTOCOLS, CURLPROTO_HTTP | CURLPROTO_HTTPS);
    curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, errbuf);
    curl_easy_setopt(curl, CURLOPT_USERAGENT, userAgent_.c_str());
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout.count()));
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(connectTimeout_.count()));
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    // Redirects are followed hop by hop by the caller
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 0L);
    curl_easy_setopt(curl, CURLOPT_ACCEPT_ENCODING, "");
    curl_easy_setopt(curl, CURLOPT_MAXFILESIZE_LARGE, static_cast<curl_off_t>(maxBodyBytes_));
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, verifySSL_ ? 1L : 0L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, verifySSL_ ? 2L : 0L);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &body);
    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, headerCallback);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, &response.headers);

    LOG_DEBUG("GET " + url);
    CURLcode res = curl_easy_perform(curl);

    long statusCode = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &statusCode);
    curl_easy_cleanup(curl);

    response.latency = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);

    if (res != CURLE_OK) {
        response.error = mapCurlError(res, body.tooLarge);
        response.errorMessage = std::string(curl_easy_strerror(res));
        if (errbuf[0] != '\0') {
            response.errorMessage += " | " + std::string(errbuf);
        }
        response.statusCode = static_cast<int>(statusCode);
        LOG_WARNING("CURL error (" + fetchErrorKindToString(response.error) + ") for " + url + ": " + response.errorMessage);
        return response;
    }

    response.statusCode = static_cast<int>(statusCode);
    response.body = std::move(body.data);

    if (response.statusCode >= 400 && response.statusCode < 500) {
        LOG_DEBUG("HTTP CLIENT ERROR (" + std::to_string(response.statusCode) + "): " + url);
    } else if (response.statusCode >= 500) {
        LOG_DEBUG("HTTP SERVER ERROR (" + std::to_string(response.statusCode) + "): " + url);
    }
    return response;
}

} // namespace site_audit::crawler
