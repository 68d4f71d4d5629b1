#pragma once

#include <string>
#include <vector>
#include "../../../include/site_audit/audit/CrawlIndex.h"
#include "../../../include/site_audit/audit/Finding.h"
#include "../../../include/site_audit/crawler/models/PageModel.h"

namespace site_audit::audit::checks {

inline const std::string kStatusIntegrity = "status-integrity";
inline const std::string kMobileMeta = "mobile-meta";
inline const std::string kDuplicateContent = "duplicate-content";
inline const std::string kMetaQuality = "meta-quality";
inline const std::string kStructuredDataValidity = "structured-data-validity";
inline const std::string kBrokenInternalLink = "broken-internal-link";
inline const std::string kMalformedLink = "malformed-link";
inline const std::string kMalformedMarkup = "malformed-markup";
inline const std::string kHeadingStructure = "heading-structure";
inline const std::string kCanonicalLink = "canonical-link";
// Emitted by the engine itself when a check throws
inline const std::string kCheckFailure = "check-failure";

struct MetaBounds {
    size_t titleMin = 10;
    size_t titleMax = 60;
    size_t descriptionMin = 50;
    size_t descriptionMax = 160;
};

std::vector<Finding> statusIntegrity(const crawler::PageModel& page, const CrawlIndex& index, size_t hopLimit);
std::vector<Finding> mobileMeta(const crawler::PageModel& page, const CrawlIndex& index);
std::vector<Finding> duplicateContent(const crawler::PageModel& page, const CrawlIndex& index);
std::vector<Finding> metaQuality(const crawler::PageModel& page, const CrawlIndex& index, const MetaBounds& bounds);
std::vector<Finding> structuredDataValidity(const crawler::PageModel& page, const CrawlIndex& index);
std::vector<Finding> brokenInternalLink(const crawler::PageModel& page, const CrawlIndex& index);
std::vector<Finding> malformedLink(const crawler::PageModel& page, const CrawlIndex& index);
std::vector<Finding> malformedMarkup(const crawler::PageModel& page, const CrawlIndex& index);
std::vector<Finding> headingStructure(const crawler::PageModel& page, const CrawlIndex& index);
std::vector<Finding> canonicalLink(const crawler::PageModel& page, const CrawlIndex& index);

// 2xx HTML page without a transport error
bool isAuditableHtml(const crawler::PageModel& page);

// Number of UTF-8 code points
size_t characterCount(const std::string& text);

} // namespace site_audit::audit::checks
