#include "Checks.h"
#include <nlohmann/json.hpp>

namespace site_audit::audit::checks {

using crawler::PageModel;

std::vector<Finding> malformedMarkup(const PageModel& page, const CrawlIndex& /*index*/) {
    std::vector<Finding> findings;
    if (!page.isHtml) {
        return findings;
    }
    if (page.parseFailed) {
        findings.push_back({kMalformedMarkup, Severity::WARNING, page.finalUrl, "HTML could not be parsed", ""});
    } else if (page.markupErrors > 0) {
        findings.push_back({kMalformedMarkup, Severity::INFO, page.finalUrl,
                            "HTML parse errors", std::to_string(page.markupErrors) + " errors reported by the parser"});
    }
    return findings;
}

std::vector<Finding> headingStructure(const PageModel& page, const CrawlIndex& /*index*/) {
    std::vector<Finding> findings;
    if (!isAuditableHtml(page)) {
        return findings;
    }

    size_t h1Count = 0;
    for (const auto& heading : page.headings) {
        if (heading.level == 1) {
            ++h1Count;
        }
    }
    if (h1Count == 0) {
        findings.push_back({kHeadingStructure, Severity::WARNING, page.finalUrl, "Missing H1 heading", ""});
    } else if (h1Count > 1) {
        findings.push_back({kHeadingStructure, Severity::INFO, page.finalUrl,
                            "Multiple H1 headings", std::to_string(h1Count) + " H1 elements"});
    }

    int previous = 0;
    for (const auto& heading : page.headings) {
        if (previous > 0 && heading.level > previous + 1) {
            findings.push_back({kHeadingStructure, Severity::INFO, page.finalUrl,
                                "Skipped heading level",
                                "H" + std::to_string(previous) + " followed by H" + std::to_string(heading.level) +
                                    ": " + heading.text});
        }
        previous = heading.level;
    }
    return findings;
}

std::vector<Finding> structuredDataValidity(const PageModel& page, const CrawlIndex& /*index*/) {
    std::vector<Finding> findings;

    size_t blockNumber = 0;
    for (const auto& block : page.structuredData) {
        ++blockNumber;
        std::string label = "block " + std::to_string(blockNumber);

        nlohmann::json parsed = nlohmann::json::parse(block.content, nullptr, false);
        if (parsed.is_discarded()) {
            std::string excerpt = block.content.substr(0, 120);
            findings.push_back({kStructuredDataValidity, Severity::WARNING, page.finalUrl,
                                "Structured data is not well-formed JSON-LD", label + ": " + excerpt});
            continue;
        }

        std::vector<const nlohmann::json*> items;
        if (parsed.is_array()) {
            for (const auto& item : parsed) {
                items.push_back(&item);
            }
        } else {
            items.push_back(&parsed);
        }

        for (const auto* item : items) {
            if (!item->is_object()) {
                findings.push_back({kStructuredDataValidity, Severity::WARNING, page.finalUrl,
                                    "Structured data item is not an object", label});
                continue;
            }
            if (!item->contains("@context")) {
                findings.push_back({kStructuredDataValidity, Severity::INFO, page.finalUrl,
                                    "Structured data without @context", label});
            }
            if (!item->contains("@type") && !item->contains("@graph")) {
                findings.push_back({kStructuredDataValidity, Severity::INFO, page.finalUrl,
                                    "Structured data without @type", label});
            }
        }
    }
    return findings;
}

} // namespace site_audit::audit::checks
