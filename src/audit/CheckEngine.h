#pragma once

#include <vector>
#include "../../include/site_audit/audit/CheckRegistry.h"
#include "../../include/site_audit/audit/CrawlIndex.h"
#include "../../include/site_audit/audit/Finding.h"
#include "../../include/site_audit/crawler/models/PageModel.h"

namespace site_audit::audit {

// Runs every registered check over every page. Pages are spread across a
// few threads; each thread appends to its own list and the lists are
// merged, sorted and de-duplicated at the end.
class CheckEngine {
public:
    explicit CheckEngine(const CheckRegistry& registry, size_t workers = 4);

    std::vector<Finding> run(const std::vector<crawler::PageModel>& pages, const CrawlIndex& index) const;

    // All checks for one page. A throwing check yields a check-failure
    // finding and the remaining checks still run.
    std::vector<Finding> runPage(const crawler::PageModel& page, const CrawlIndex& index) const;

    // Sort by (url, checkId, message, evidence) and drop exact duplicates
    static void finalize(std::vector<Finding>& findings);

private:
    const CheckRegistry& registry_;
    size_t workers_;
};

} // namespace site_audit::audit
