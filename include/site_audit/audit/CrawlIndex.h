#pragma once

#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>
#include "../crawler/models/PageModel.h"
#include "../crawler/models/UrlRecord.h"

namespace site_audit::audit {

// Crawl-wide lookup tables shared by all checks. Built once after the
// crawl drains and only read afterwards, so concurrent readers need no
// synchronisation.
class CrawlIndex {
public:
    CrawlIndex() = default;

    static CrawlIndex build(const std::vector<crawler::UrlRecord>& records,
                            const std::vector<crawler::PageModel>& pages,
                            const std::vector<std::string>& internalHosts);

    // Record for a requested URL, nullptr when the crawl never reached it
    const crawler::UrlRecord* find(const std::string& url) const;

    bool isInternal(const std::string& url) const;

    // Other successful pages sharing the same body hash / title / description
    const std::vector<std::string>& urlsWithBodyHash(const std::string& hash) const;
    const std::vector<std::string>& urlsWithTitle(const std::string& title) const;
    const std::vector<std::string>& urlsWithDescription(const std::string& description) const;

    size_t size() const { return records_.size(); }

    // Whitespace-collapsed, lower-cased key used for title/description grouping
    static std::string textKey(const std::string& text);

private:
    std::unordered_map<std::string, crawler::UrlRecord> records_;
    std::unordered_set<std::string> internalHosts_;
    std::unordered_map<std::string, std::vector<std::string>> byBodyHash_;
    std::unordered_map<std::string, std::vector<std::string>> byTitle_;
    std::unordered_map<std::string, std::vector<std::string>> byDescription_;
};

} // namespace site_audit::audit
