#pragma once

#include <string>
#include <vector>
#include "Result.h"

namespace site_audit::common {

enum class TrailingSlashPolicy {
    KEEP,   // leave the path as written
    STRIP,  // "/a/" -> "/a" (the root path stays "/")
    ADD     // "/a" -> "/a/" unless the last segment looks like a file
};

enum class NormalizationError {
    NONE,
    EMPTY,
    MALFORMED,
    UNSUPPORTED_SCHEME,
    MISSING_HOST,
    INVALID_PORT,
    RELATIVE_WITHOUT_BASE
};

struct UrlNormalizerOptions {
    TrailingSlashPolicy trailingSlash = TrailingSlashPolicy::STRIP;
    bool stripTrackingParameters = true;
    // Exact parameter names; an entry ending in '*' matches by prefix
    std::vector<std::string> trackingParameters = {
        "utm_*", "gclid", "fbclid", "msclkid", "dclid", "mc_cid", "mc_eid", "_ga", "yclid"
    };
};

using NormalizeResult = Result<std::string, NormalizationError>;

// Components of an absolute or relative reference as split by RFC 3986
struct ParsedUrl {
    std::string scheme;
    bool hasAuthority = false;
    std::string userinfo;
    std::string host;
    std::string port;
    std::string path;
    bool hasQuery = false;
    std::string query;
};

class UrlNormalizer {
public:
    explicit UrlNormalizer(UrlNormalizerOptions options = UrlNormalizerOptions());

    // Resolve raw against base (which may be empty when raw is absolute) and
    // canonicalize. Deterministic and free of shared mutable state.
    NormalizeResult normalize(const std::string& raw, const std::string& base = "") const;

    const UrlNormalizerOptions& options() const { return options_; }

    // host[:port] of a normalized URL, empty if it has none
    static std::string extractHost(const std::string& url);

    // scheme://host[:port]
    static std::string extractOrigin(const std::string& url);

    // Path plus query, used for robots.txt matching
    static std::string extractPathAndQuery(const std::string& url);

    static std::string describe(NormalizationError error);

private:
    bool isTrackingParameter(const std::string& key) const;
    std::string filterQuery(const std::string& query) const;
    std::string applyTrailingSlash(const std::string& path) const;

    UrlNormalizerOptions options_;
};

// Trim surrounding ASCII whitespace and remove control characters and
// invisible formatting codepoints (U+200B..U+200F, U+2060, U+FEFF,
// directional overrides) that commonly leak into copy/pasted hrefs.
std::string sanitizeUrl(const std::string& input);

} // namespace site_audit::common
