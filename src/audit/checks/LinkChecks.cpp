#include "Checks.h"

namespace site_audit::audit::checks {

using crawler::OutcomeKind;
using crawler::PageModel;
using crawler::UrlRecord;

namespace {

std::string describeRecord(const UrlRecord& record) {
    if (record.statusCode > 0) {
        return "HTTP " + std::to_string(record.statusCode);
    }
    std::string out = crawler::outcomeKindToString(record.outcome);
    if (!record.error.empty()) {
        out += ": " + record.error;
    }
    return out;
}

void checkTarget(const std::string& target, const std::string& kind, const PageModel& page,
                 const CrawlIndex& index, std::vector<Finding>& findings) {
    if (!index.isInternal(target)) {
        return;
    }
    const UrlRecord* record = index.find(target);
    // Never reached, or deliberately not fetched (robots, budget)
    if (!record || record->outcome == OutcomeKind::SKIPPED_ROBOTS || record->outcome == OutcomeKind::SKIPPED_BUDGET) {
        return;
    }
    if (record->isBroken()) {
        findings.push_back({kBrokenInternalLink, Severity::WARNING, page.url,
                            "Broken internal " + kind, target + " (" + describeRecord(*record) + ")"});
    }
}

} // namespace

std::vector<Finding> brokenInternalLink(const PageModel& page, const CrawlIndex& index) {
    std::vector<Finding> findings;
    for (const auto& link : page.links) {
        checkTarget(link, "link", page, index, findings);
    }
    for (const auto& resource : page.resources) {
        checkTarget(resource.url, "resource", page, index, findings);
    }
    return findings;
}

std::vector<Finding> malformedLink(const PageModel& page, const CrawlIndex& /*index*/) {
    std::vector<Finding> findings;
    for (const auto& link : page.malformedLinks) {
        if (link.disallowedScheme) {
            findings.push_back({kMalformedLink, Severity::INFO, page.url,
                                "Link with disallowed scheme", link.raw});
        } else {
            findings.push_back({kMalformedLink, Severity::WARNING, page.url,
                                "Malformed link: " + link.reason, link.raw});
        }
    }
    return findings;
}

std::vector<Finding> canonicalLink(const PageModel& page, const CrawlIndex& index) {
    std::vector<Finding> findings;
    if (!isAuditableHtml(page) || page.canonicalRaw.empty()) {
        return findings;
    }

    if (!page.canonical) {
        findings.push_back({kCanonicalLink, Severity::WARNING, page.finalUrl,
                            "Malformed canonical link", page.canonicalRaw});
        return findings;
    }

    const std::string& canonical = *page.canonical;
    if (!page.redirectChain.empty() && canonical != page.finalUrl) {
        // The redirect target is authoritative; the declared canonical is ignored
        findings.push_back({kCanonicalLink, Severity::INFO, page.url,
                            "Canonical disagrees with redirect target",
                            "redirects to " + page.finalUrl + ", canonical " + canonical});
    }

    const UrlRecord* record = index.find(canonical);
    if (!record) {
        return findings;
    }
    if (record->isBroken()) {
        findings.push_back({kCanonicalLink, Severity::WARNING, page.finalUrl,
                            "Canonical points to a broken URL", canonical + " (" + describeRecord(*record) + ")"});
    } else if (!record->redirectChain.empty()) {
        findings.push_back({kCanonicalLink, Severity::WARNING, page.finalUrl,
                            "Canonical points to a redirecting URL", canonical + " -> " + record->finalUrl});
    }
    return findings;
}

} // namespace site_audit::audit::checks
