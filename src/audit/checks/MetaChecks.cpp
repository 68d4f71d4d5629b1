#include "Checks.h"
#include <algorithm>
#include <cctype>

namespace site_audit::audit::checks {

using crawler::PageModel;

bool isAuditableHtml(const PageModel& page) {
    return page.isHtml && !page.parseFailed && page.fetchError == crawler::FetchErrorKind::NONE &&
           page.statusCode >= 200 && page.statusCode < 300;
}

size_t characterCount(const std::string& text) {
    size_t count = 0;
    for (unsigned char c : text) {
        // Continuation bytes (10xxxxxx) do not start a code point
        if ((c & 0xC0) != 0x80) {
            ++count;
        }
    }
    return count;
}

namespace {

std::string trimmed(const std::string& text) {
    return CrawlIndex::textKey(text).empty() ? std::string() : text;
}

std::string joinOthers(const std::vector<std::string>& urls, const std::string& self) {
    std::string out;
    for (const auto& url : urls) {
        if (url == self) {
            continue;
        }
        if (!out.empty()) {
            out += ", ";
        }
        out += url;
    }
    return out;
}

void checkText(const std::optional<std::string>& value,
               const std::string& label,
               size_t minLength,
               size_t maxLength,
               Severity lengthSeverity,
               const std::vector<std::string>& sameText,
               const PageModel& page,
               std::vector<Finding>& findings) {
    if (!value || trimmed(*value).empty()) {
        findings.push_back({kMetaQuality, Severity::WARNING, page.finalUrl, "Missing " + label, ""});
        return;
    }

    size_t length = characterCount(*value);
    if (length < minLength) {
        findings.push_back({kMetaQuality, lengthSeverity, page.finalUrl,
                            label + " too short (" + std::to_string(length) + " < " + std::to_string(minLength) + ")",
                            *value});
    } else if (length > maxLength) {
        findings.push_back({kMetaQuality, lengthSeverity, page.finalUrl,
                            label + " too long (" + std::to_string(length) + " > " + std::to_string(maxLength) + ")",
                            *value});
    }

    std::string others = joinOthers(sameText, page.finalUrl);
    if (!others.empty()) {
        findings.push_back({kMetaQuality, Severity::WARNING, page.finalUrl, "Duplicate " + label, others});
    }
}

} // namespace

std::vector<Finding> metaQuality(const PageModel& page, const CrawlIndex& index, const MetaBounds& bounds) {
    std::vector<Finding> findings;
    if (!isAuditableHtml(page)) {
        return findings;
    }

    checkText(page.title, "title", bounds.titleMin, bounds.titleMax, Severity::WARNING,
              page.title ? index.urlsWithTitle(*page.title) : std::vector<std::string>(),
              page, findings);
    checkText(page.metaDescription, "meta description", bounds.descriptionMin, bounds.descriptionMax, Severity::INFO,
              page.metaDescription ? index.urlsWithDescription(*page.metaDescription) : std::vector<std::string>(),
              page, findings);
    return findings;
}

std::vector<Finding> mobileMeta(const PageModel& page, const CrawlIndex& /*index*/) {
    std::vector<Finding> findings;
    if (!isAuditableHtml(page)) {
        return findings;
    }

    if (!page.viewport) {
        findings.push_back({kMobileMeta, Severity::WARNING, page.finalUrl, "Missing viewport meta tag", ""});
        return findings;
    }

    std::string viewport = CrawlIndex::textKey(*page.viewport);
    viewport.erase(std::remove(viewport.begin(), viewport.end(), ' '), viewport.end());

    if (viewport.find("width=device-width") == std::string::npos) {
        findings.push_back({kMobileMeta, Severity::WARNING, page.finalUrl,
                            "Viewport does not set width=device-width", *page.viewport});
    }
    if (viewport.find("user-scalable=no") != std::string::npos ||
        viewport.find("user-scalable=0") != std::string::npos ||
        viewport.find("maximum-scale=1,") != std::string::npos ||
        viewport.find("maximum-scale=1.0") != std::string::npos ||
        (viewport.size() >= 15 && viewport.compare(viewport.size() - 15, 15, "maximum-scale=1") == 0)) {
        findings.push_back({kMobileMeta, Severity::INFO, page.finalUrl,
                            "Viewport disables zooming", *page.viewport});
    }
    return findings;
}

std::vector<Finding> duplicateContent(const PageModel& page, const CrawlIndex& index) {
    std::vector<Finding> findings;
    if (page.bodyHash.empty() || page.fetchError != crawler::FetchErrorKind::NONE ||
        page.statusCode < 200 || page.statusCode >= 300) {
        return findings;
    }

    std::string others = joinOthers(index.urlsWithBodyHash(page.bodyHash), page.url);
    if (!others.empty()) {
        findings.push_back({kDuplicateContent, Severity::WARNING, page.url,
                            "Body identical to other crawled URLs", others});
    }
    return findings;
}

} // namespace site_audit::audit::checks
