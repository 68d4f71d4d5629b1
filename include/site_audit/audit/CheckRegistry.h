#pragma once

#include <functional>
#include <map>
#include <string>
#include <vector>
#include "CrawlIndex.h"
#include "Finding.h"
#include "../crawler/models/CrawlConfig.h"
#include "../crawler/models/PageModel.h"

namespace site_audit::audit {

// A technical check: a pure function over one page and the read-only
// crawl index. Thresholds are bound when the check is registered.
using CheckFunction = std::function<std::vector<Finding>(const crawler::PageModel&, const CrawlIndex&)>;

// Open set of checks keyed by identifier. Iteration order is the
// identifier order, which keeps engine output reproducible.
class CheckRegistry {
public:
    // Adds or replaces the check registered under id
    void registerCheck(const std::string& id, CheckFunction check);

    bool removeCheck(const std::string& id);

    bool contains(const std::string& id) const;

    std::vector<std::string> ids() const;

    size_t size() const { return checks_.size(); }

    const std::map<std::string, CheckFunction>& checks() const { return checks_; }

private:
    std::map<std::string, CheckFunction> checks_;
};

// Registers every built-in check with thresholds taken from config
void registerDefaultChecks(CheckRegistry& registry, const CrawlConfig& config);

CheckRegistry makeDefaultRegistry(const CrawlConfig& config);

} // namespace site_audit::audit
