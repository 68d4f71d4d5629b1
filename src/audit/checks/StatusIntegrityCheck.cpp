#include "Checks.h"

namespace site_audit::audit::checks {

using crawler::FetchErrorKind;
using crawler::PageModel;

namespace {

std::string chainEvidence(const PageModel& page) {
    std::string evidence = page.url;
    for (const auto& hop : page.redirectChain) {
        evidence += " -> " + hop;
    }
    return evidence;
}

} // namespace

std::vector<Finding> statusIntegrity(const PageModel& page, const CrawlIndex& /*index*/, size_t hopLimit) {
    std::vector<Finding> findings;

    if (page.redirectLoop) {
        findings.push_back({kStatusIntegrity, Severity::CRITICAL, page.url,
                            "Redirect loop", chainEvidence(page)});
        return findings;
    }

    if (page.redirectChain.size() > hopLimit) {
        findings.push_back({kStatusIntegrity, Severity::WARNING, page.url,
                            "Redirect chain of " + std::to_string(page.redirectChain.size()) +
                                " hops exceeds limit of " + std::to_string(hopLimit),
                            chainEvidence(page)});
    }

    if (page.fetchError != FetchErrorKind::NONE) {
        findings.push_back({kStatusIntegrity, Severity::CRITICAL, page.url,
                            "Fetch failed: " + crawler::fetchErrorKindToString(page.fetchError),
                            page.fetchErrorMessage + " after " + std::to_string(page.attempts) + " attempts"});
        return findings;
    }

    int status = page.statusCode;
    std::string evidence = "HTTP " + std::to_string(status) + " after " + std::to_string(page.attempts) + " attempts";
    if (!page.redirectChain.empty()) {
        evidence += " at " + page.finalUrl;
    }

    if (status >= 500) {
        findings.push_back({kStatusIntegrity, Severity::CRITICAL, page.url,
                            "Server error response", evidence});
    } else if (status >= 400) {
        findings.push_back({kStatusIntegrity, Severity::WARNING, page.url,
                            "Client error response", evidence});
    } else if (status >= 300) {
        findings.push_back({kStatusIntegrity, Severity::WARNING, page.url,
                            "Unresolved redirect", evidence});
    } else if (status < 200) {
        findings.push_back({kStatusIntegrity, Severity::WARNING, page.url,
                            "Unexpected status", evidence});
    }
    return findings;
}

} // namespace site_audit::audit::checks
