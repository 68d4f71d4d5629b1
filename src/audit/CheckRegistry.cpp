#include "../../include/site_audit/audit/CheckRegistry.h"
#include "../../include/Logger.h"
#include "checks/Checks.h"

namespace site_audit::audit {

void CheckRegistry::registerCheck(const std::string& id, CheckFunction check) {
    if (checks_.count(id) > 0) {
        LOG_DEBUG("Replacing check " + id);
    }
    checks_[id] = std::move(check);
}

bool CheckRegistry::removeCheck(const std::string& id) {
    return checks_.erase(id) > 0;
}

bool CheckRegistry::contains(const std::string& id) const {
    return checks_.count(id) > 0;
}

std::vector<std::string> CheckRegistry::ids() const {
    std::vector<std::string> out;
    out.reserve(checks_.size());
    for (const auto& [id, check] : checks_) {
        out.push_back(id);
    }
    return out;
}

void registerDefaultChecks(CheckRegistry& registry, const CrawlConfig& config) {
    using namespace checks;

    size_t hopLimit = config.redirectHopLimit;
    registry.registerCheck(kStatusIntegrity, [hopLimit](const crawler::PageModel& page, const CrawlIndex& index) {
        return statusIntegrity(page, index, hopLimit);
    });

    MetaBounds bounds;
    bounds.titleMin = config.titleMinLength;
    bounds.titleMax = config.titleMaxLength;
    bounds.descriptionMin = config.descriptionMinLength;
    bounds.descriptionMax = config.descriptionMaxLength;
    registry.registerCheck(kMetaQuality, [bounds](const crawler::PageModel& page, const CrawlIndex& index) {
        return metaQuality(page, index, bounds);
    });

    registry.registerCheck(kMobileMeta, mobileMeta);
    registry.registerCheck(kDuplicateContent, duplicateContent);
    registry.registerCheck(kStructuredDataValidity, structuredDataValidity);
    registry.registerCheck(kBrokenInternalLink, brokenInternalLink);
    registry.registerCheck(kMalformedLink, malformedLink);
    registry.registerCheck(kMalformedMarkup, malformedMarkup);
    registry.registerCheck(kHeadingStructure, headingStructure);
    registry.registerCheck(kCanonicalLink, canonicalLink);

    for (const auto& id : config.disabledChecks) {
        if (registry.removeCheck(id)) {
            LOG_INFO("Check disabled by configuration: " + id);
        } else {
            LOG_WARNING("Unknown check in disabledChecks: " + id);
        }
    }
}

CheckRegistry makeDefaultRegistry(const CrawlConfig& config) {
    CheckRegistry registry;
    registerDefaultChecks(registry, config);
    return registry;
}

} // namespace site_audit::audit
