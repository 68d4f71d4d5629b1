#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>
#include "FetchResult.h"

namespace site_audit::crawler {

struct Heading {
    int level = 1;
    std::string text;
};

struct HreflangLink {
    std::string language;
    std::string url;
};

enum class ResourceKind {
    IMAGE,
    SCRIPT,
    STYLESHEET,
    OTHER
};

struct ResourceRef {
    ResourceKind kind = ResourceKind::OTHER;
    std::string url;
};

// A reference on the page that could not be normalized
struct MalformedLink {
    std::string raw;
    std::string reason;
    // Well-formed reference with a scheme other than http/https
    bool disallowedScheme = false;
};

struct StructuredDataBlock {
    std::string type;   // e.g. "application/ld+json"
    std::string content;
};

// Parsed representation of one fetched URL. Built once, read-only afterwards.
struct PageModel {
    std::string url;
    std::string finalUrl;
    int statusCode = 0;
    bool isHtml = false;
    std::string contentType;
    HeaderMap headers;
    size_t byteSize = 0;
    std::chrono::milliseconds fetchLatency{0};
    std::vector<std::string> redirectChain;
    bool redirectLoop = false;
    FetchErrorKind fetchError = FetchErrorKind::NONE;
    std::string fetchErrorMessage;
    int attempts = 0;

    std::optional<std::string> title;
    std::optional<std::string> metaDescription;
    std::optional<std::string> metaRobots;
    std::optional<std::string> viewport;
    std::vector<Heading> headings;
    std::optional<std::string> canonical;
    std::string canonicalRaw;
    std::vector<HreflangLink> hreflangs;
    std::vector<StructuredDataBlock> structuredData;

    // Absolute, normalized, deduplicated, in document order
    std::vector<std::string> links;
    std::vector<ResourceRef> resources;
    std::vector<MalformedLink> malformedLinks;

    // Hash of the whitespace-collapsed body, empty when there is no body
    std::string bodyHash;

    // Number of parse errors reported by the HTML parser
    size_t markupErrors = 0;
    bool parseFailed = false;
};

} // namespace site_audit::crawler
