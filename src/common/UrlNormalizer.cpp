#include "../../include/site_audit/common/UrlNormalizer.h"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <sstream>

namespace site_audit::common {

namespace {

inline bool isAsciiSpace(unsigned char c) {
    return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\f';
}

inline bool isUnreserved(unsigned char c) {
    return std::isalnum(c) || c == '-' || c == '.' || c == '_' || c == '~';
}

inline bool isSubDelim(unsigned char c) {
    switch (c) {
        case '!': case '$': case '&': case '\'': case '(': case ')':
        case '*': case '+': case ',': case ';': case '=':
            return true;
        default:
            return false;
    }
}

inline int hexValue(unsigned char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

void appendEscaped(std::string& out, unsigned char c) {
    static const char* kHex = "0123456789ABCDEF";
    out.push_back('%');
    out.push_back(kHex[c >> 4]);
    out.push_back(kHex[c & 0x0F]);
}

// Canonical percent-encoding: decode escapes of unreserved characters,
// upper-case the remaining escapes, escape bytes outside the allowed set.
// Applying it twice yields the same string.
std::string normalizePercentEncoding(const std::string& in, bool isQuery) {
    std::string out;
    out.reserve(in.size());
    for (size_t i = 0; i < in.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(in[i]);
        if (c == '%') {
            if (i + 2 < in.size() &&
                hexValue(static_cast<unsigned char>(in[i + 1])) >= 0 &&
                hexValue(static_cast<unsigned char>(in[i + 2])) >= 0) {
                unsigned char decoded = static_cast<unsigned char>(
                    hexValue(static_cast<unsigned char>(in[i + 1])) * 16 +
                    hexValue(static_cast<unsigned char>(in[i + 2])));
                if (isUnreserved(decoded)) {
                    out.push_back(static_cast<char>(decoded));
                } else {
                    appendEscaped(out, decoded);
                }
                i += 2;
            } else {
                appendEscaped(out, '%');
            }
            continue;
        }
        if (c == '\\' && !isQuery) {
            out.push_back('/');
            continue;
        }
        if (isUnreserved(c) || isSubDelim(c) || c == ':' || c == '@' || c == '/' ||
            (isQuery && c == '?')) {
            out.push_back(static_cast<char>(c));
        } else {
            appendEscaped(out, c);
        }
    }
    return out;
}

// RFC 3986 section 5.2.4
std::string removeDotSegments(const std::string& path) {
    std::string input = path;
    std::string output;

    while (!input.empty()) {
        if (input.rfind("../", 0) == 0) {
            input.erase(0, 3);
        } else if (input.rfind("./", 0) == 0) {
            input.erase(0, 2);
        } else if (input.rfind("/./", 0) == 0) {
            input.replace(0, 3, "/");
        } else if (input == "/.") {
            input = "/";
        } else if (input.rfind("/../", 0) == 0 || input == "/..") {
            input = (input == "/..") ? "/" : input.substr(3);
            size_t lastSlash = output.find_last_of('/');
            output.erase(lastSlash == std::string::npos ? 0 : lastSlash);
        } else if (input == "." || input == "..") {
            input.clear();
        } else {
            size_t start = (input[0] == '/') ? 1 : 0;
            size_t next = input.find('/', start);
            if (next == std::string::npos) {
                output += input;
                input.clear();
            } else {
                output += input.substr(0, next);
                input.erase(0, next);
            }
        }
    }
    return output;
}

std::string mergePaths(const ParsedUrl& base, const std::string& refPath) {
    if (base.hasAuthority && base.path.empty()) {
        return "/" + refPath;
    }
    size_t lastSlash = base.path.find_last_of('/');
    if (lastSlash == std::string::npos) {
        return refPath;
    }
    return base.path.substr(0, lastSlash + 1) + refPath;
}

bool looksLikeScheme(const std::string& s, size_t colon) {
    if (colon == 0 || !std::isalpha(static_cast<unsigned char>(s[0]))) {
        return false;
    }
    for (size_t i = 1; i < colon; ++i) {
        unsigned char c = static_cast<unsigned char>(s[i]);
        if (!std::isalnum(c) && c != '+' && c != '-' && c != '.') {
            return false;
        }
    }
    return true;
}

ParsedUrl parseReference(const std::string& input) {
    ParsedUrl parsed;
    std::string rest = input;

    size_t hash = rest.find('#');
    if (hash != std::string::npos) {
        rest.erase(hash);
    }

    size_t colon = rest.find(':');
    size_t firstDelimiter = rest.find_first_of("/?");
    if (colon != std::string::npos && (firstDelimiter == std::string::npos || colon < firstDelimiter) &&
        looksLikeScheme(rest, colon)) {
        parsed.scheme = toLower(rest.substr(0, colon));
        rest.erase(0, colon + 1);
    }

    size_t question = rest.find('?');
    if (question != std::string::npos) {
        parsed.hasQuery = true;
        parsed.query = rest.substr(question + 1);
        rest.erase(question);
    }

    if (rest.rfind("//", 0) == 0) {
        parsed.hasAuthority = true;
        size_t authorityEnd = rest.find_first_of("/\\", 2);
        std::string authority = rest.substr(2, authorityEnd == std::string::npos ? std::string::npos : authorityEnd - 2);
        rest = (authorityEnd == std::string::npos) ? "" : rest.substr(authorityEnd);

        size_t at = authority.rfind('@');
        if (at != std::string::npos) {
            parsed.userinfo = authority.substr(0, at);
            authority.erase(0, at + 1);
        }

        if (!authority.empty() && authority[0] == '[') {
            size_t close = authority.find(']');
            if (close == std::string::npos) {
                parsed.host = authority;
            } else {
                parsed.host = authority.substr(0, close + 1);
                if (close + 1 < authority.size() && authority[close + 1] == ':') {
                    parsed.port = authority.substr(close + 2);
                }
            }
        } else {
            size_t portColon = authority.rfind(':');
            if (portColon != std::string::npos) {
                parsed.host = authority.substr(0, portColon);
                parsed.port = authority.substr(portColon + 1);
            } else {
                parsed.host = authority;
            }
        }
    }

    parsed.path = rest;
    return parsed;
}

bool isValidHost(const std::string& host) {
    if (host.front() == '[') {
        if (host.back() != ']' || host.size() < 3) return false;
        for (size_t i = 1; i + 1 < host.size(); ++i) {
            unsigned char c = static_cast<unsigned char>(host[i]);
            if (!std::isxdigit(c) && c != ':' && c != '.') return false;
        }
        return true;
    }
    for (unsigned char c : host) {
        if (!std::isalnum(c) && c != '-' && c != '.' && c != '_' && c < 0x80) {
            return false;
        }
    }
    return host.find("..") == std::string::npos;
}

size_t authorityEnd(const std::string& url, size_t start) {
    size_t end = url.find_first_of("/?#", start);
    return end == std::string::npos ? url.size() : end;
}

} // namespace

UrlNormalizer::UrlNormalizer(UrlNormalizerOptions options) : options_(std::move(options)) {
}

NormalizeResult UrlNormalizer::normalize(const std::string& raw, const std::string& base) const {
    const std::string cleaned = sanitizeUrl(raw);
    if (cleaned.empty()) {
        return NormalizeResult::Failure(NormalizationError::EMPTY, "empty URL");
    }

    ParsedUrl ref = parseReference(cleaned);
    ParsedUrl target;

    if (!ref.scheme.empty()) {
        target = ref;
        target.path = removeDotSegments(normalizePercentEncoding(ref.path, false));
    } else {
        if (base.empty()) {
            return NormalizeResult::Failure(NormalizationError::RELATIVE_WITHOUT_BASE,
                                            "relative reference without a base: " + cleaned);
        }
        auto baseResult = normalize(base);
        if (!baseResult.success) {
            return NormalizeResult::Failure(baseResult.error, "invalid base URL: " + baseResult.message);
        }
        ParsedUrl b = parseReference(baseResult.value);

        target.scheme = b.scheme;
        if (ref.hasAuthority) {
            target.hasAuthority = true;
            target.userinfo = ref.userinfo;
            target.host = ref.host;
            target.port = ref.port;
            target.path = removeDotSegments(normalizePercentEncoding(ref.path, false));
            target.hasQuery = ref.hasQuery;
            target.query = ref.query;
        } else {
            target.hasAuthority = b.hasAuthority;
            target.userinfo = b.userinfo;
            target.host = b.host;
            target.port = b.port;
            std::string refPath = normalizePercentEncoding(ref.path, false);
            if (refPath.empty()) {
                target.path = b.path;
                target.hasQuery = ref.hasQuery ? true : b.hasQuery;
                target.query = ref.hasQuery ? ref.query : b.query;
            } else {
                target.path = removeDotSegments(refPath[0] == '/' ? refPath : mergePaths(b, refPath));
                target.hasQuery = ref.hasQuery;
                target.query = ref.query;
            }
        }
    }

    if (target.scheme != "http" && target.scheme != "https") {
        return NormalizeResult::Failure(NormalizationError::UNSUPPORTED_SCHEME,
                                        "unsupported scheme '" + target.scheme + "' in " + cleaned);
    }

    std::string host = toLower(target.host);
    while (!host.empty() && host.back() == '.') {
        host.pop_back();
    }
    if (!target.hasAuthority || host.empty()) {
        return NormalizeResult::Failure(NormalizationError::MISSING_HOST, "missing host in " + cleaned);
    }
    if (!isValidHost(host)) {
        return NormalizeResult::Failure(NormalizationError::MALFORMED, "malformed host '" + host + "' in " + cleaned);
    }

    std::string port;
    if (!target.port.empty()) {
        if (target.port.size() > 5 ||
            !std::all_of(target.port.begin(), target.port.end(), [](unsigned char c) { return std::isdigit(c); })) {
            return NormalizeResult::Failure(NormalizationError::INVALID_PORT, "invalid port '" + target.port + "' in " + cleaned);
        }
        int portNumber = std::stoi(target.port);
        if (portNumber <= 0 || portNumber > 65535) {
            return NormalizeResult::Failure(NormalizationError::INVALID_PORT, "port out of range in " + cleaned);
        }
        bool isDefault = (target.scheme == "http" && portNumber == 80) ||
                         (target.scheme == "https" && portNumber == 443);
        if (!isDefault) {
            port = std::to_string(portNumber);
        }
    }

    std::string path = target.path.empty() ? "/" : target.path;
    if (path[0] != '/') {
        path = "/" + path;
    }
    path = applyTrailingSlash(path);

    std::string query;
    if (target.hasQuery) {
        query = filterQuery(normalizePercentEncoding(target.query, true));
    }

    std::string out = target.scheme + "://";
    if (!target.userinfo.empty()) {
        out += target.userinfo + "@";
    }
    out += host;
    if (!port.empty()) {
        out += ":" + port;
    }
    out += path;
    if (!query.empty()) {
        out += "?" + query;
    }

    return NormalizeResult::Success(out);
}

bool UrlNormalizer::isTrackingParameter(const std::string& key) const {
    std::string lowerKey = toLower(key);
    for (const auto& pattern : options_.trackingParameters) {
        std::string lowerPattern = toLower(pattern);
        if (!lowerPattern.empty() && lowerPattern.back() == '*') {
            if (lowerKey.rfind(lowerPattern.substr(0, lowerPattern.size() - 1), 0) == 0) {
                return true;
            }
        } else if (lowerKey == lowerPattern) {
            return true;
        }
    }
    return false;
}

std::string UrlNormalizer::filterQuery(const std::string& query) const {
    std::string out;
    std::istringstream stream(query);
    std::string pair;
    while (std::getline(stream, pair, '&')) {
        if (pair.empty()) {
            continue;
        }
        if (options_.stripTrackingParameters) {
            std::string key = pair.substr(0, pair.find('='));
            if (isTrackingParameter(key)) {
                continue;
            }
        }
        if (!out.empty()) {
            out += "&";
        }
        out += pair;
    }
    return out;
}

std::string UrlNormalizer::applyTrailingSlash(const std::string& path) const {
    std::string result = path;
    switch (options_.trailingSlash) {
        case TrailingSlashPolicy::STRIP:
            while (result.size() > 1 && result.back() == '/') {
                result.pop_back();
            }
            break;
        case TrailingSlashPolicy::ADD: {
            if (result.back() != '/') {
                std::string lastSegment = result.substr(result.find_last_of('/') + 1);
                if (lastSegment.find('.') == std::string::npos) {
                    result += "/";
                }
            }
            break;
        }
        case TrailingSlashPolicy::KEEP:
            break;
    }
    return result;
}

std::string UrlNormalizer::extractHost(const std::string& url) {
    size_t schemeEnd = url.find("://");
    if (schemeEnd == std::string::npos) {
        return "";
    }
    size_t start = schemeEnd + 3;
    std::string authority = url.substr(start, authorityEnd(url, start) - start);
    size_t at = authority.rfind('@');
    if (at != std::string::npos) {
        authority.erase(0, at + 1);
    }
    return toLower(authority);
}

std::string UrlNormalizer::extractOrigin(const std::string& url) {
    size_t schemeEnd = url.find("://");
    if (schemeEnd == std::string::npos) {
        return "";
    }
    return toLower(url.substr(0, schemeEnd)) + "://" + extractHost(url);
}

std::string UrlNormalizer::extractPathAndQuery(const std::string& url) {
    size_t schemeEnd = url.find("://");
    if (schemeEnd == std::string::npos) {
        return "/";
    }
    size_t start = authorityEnd(url, schemeEnd + 3);
    std::string rest = url.substr(start);
    size_t hash = rest.find('#');
    if (hash != std::string::npos) {
        rest.erase(hash);
    }
    if (rest.empty() || rest[0] != '/') {
        rest = "/" + rest;
    }
    return rest;
}

std::string UrlNormalizer::describe(NormalizationError error) {
    switch (error) {
        case NormalizationError::NONE: return "NONE";
        case NormalizationError::EMPTY: return "EMPTY";
        case NormalizationError::MALFORMED: return "MALFORMED";
        case NormalizationError::UNSUPPORTED_SCHEME: return "UNSUPPORTED_SCHEME";
        case NormalizationError::MISSING_HOST: return "MISSING_HOST";
        case NormalizationError::INVALID_PORT: return "INVALID_PORT";
        case NormalizationError::RELATIVE_WITHOUT_BASE: return "RELATIVE_WITHOUT_BASE";
        default: return "INVALID";
    }
}

std::string sanitizeUrl(const std::string& input) {
    if (input.empty()) return input;

    size_t start = 0;
    size_t end = input.size();
    while (start < end && isAsciiSpace(static_cast<unsigned char>(input[start]))) start++;
    while (end > start && isAsciiSpace(static_cast<unsigned char>(input[end - 1]))) end--;

    std::string s = input.substr(start, end - start);

    std::string out;
    out.reserve(s.size());

    for (size_t i = 0; i < s.size();) {
        unsigned char c = static_cast<unsigned char>(s[i]);
        if ((c & 0x80) == 0) {
            if (c < 0x20 || c == 0x7F) { i++; continue; }
            out.push_back(static_cast<char>(c));
            i++;
            continue;
        }

        // Decode just enough UTF-8 to inspect the codepoint
        uint32_t cp = 0;
        size_t adv = 1;
        if ((c & 0xE0) == 0xC0 && i + 1 < s.size()) {
            cp = ((c & 0x1F) << 6) | (static_cast<unsigned char>(s[i + 1]) & 0x3F);
            adv = 2;
        } else if ((c & 0xF0) == 0xE0 && i + 2 < s.size()) {
            cp = ((c & 0x0F) << 12) |
                 ((static_cast<unsigned char>(s[i + 1]) & 0x3F) << 6) |
                 (static_cast<unsigned char>(s[i + 2]) & 0x3F);
            adv = 3;
        } else if ((c & 0xF8) == 0xF0 && i + 3 < s.size()) {
            cp = ((c & 0x07) << 18) |
                 ((static_cast<unsigned char>(s[i + 1]) & 0x3F) << 12) |
                 ((static_cast<unsigned char>(s[i + 2]) & 0x3F) << 6) |
                 (static_cast<unsigned char>(s[i + 3]) & 0x3F);
            adv = 4;
        } else {
            i++;
            continue;
        }

        if (cp == 0x200B || cp == 0x200C || cp == 0x200D || cp == 0x2060 || cp == 0xFEFF ||
            cp == 0x200E || cp == 0x200F ||
            cp == 0x202A || cp == 0x202B || cp == 0x202C || cp == 0x202D || cp == 0x202E ||
            cp == 0x2066 || cp == 0x2067 || cp == 0x2068 || cp == 0x2069) {
            i += adv;
            continue;
        }

        for (size_t k = 0; k < adv; ++k) {
            out.push_back(s[i + k]);
        }
        i += adv;
    }

    return out;
}

} // namespace site_audit::common
