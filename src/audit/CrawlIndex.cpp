#include "../../include/site_audit/audit/CrawlIndex.h"
#include "../../include/site_audit/common/UrlNormalizer.h"
#include <algorithm>
#include <cctype>

namespace site_audit::audit {

using crawler::PageModel;
using crawler::UrlRecord;

namespace {

const std::vector<std::string>& emptyList() {
    static const std::vector<std::string> empty;
    return empty;
}

bool isSuccessfulHtml(const PageModel& page) {
    return page.isHtml && page.statusCode >= 200 && page.statusCode < 300 &&
           page.fetchError == crawler::FetchErrorKind::NONE;
}

} // namespace

std::string CrawlIndex::textKey(const std::string& text) {
    std::string key;
    key.reserve(text.size());
    bool pendingSpace = false;
    for (unsigned char c : text) {
        if (std::isspace(c)) {
            pendingSpace = !key.empty();
            continue;
        }
        if (pendingSpace) {
            key += ' ';
            pendingSpace = false;
        }
        key += static_cast<char>(std::tolower(c));
    }
    return key;
}

CrawlIndex CrawlIndex::build(const std::vector<UrlRecord>& records,
                             const std::vector<PageModel>& pages,
                             const std::vector<std::string>& internalHosts) {
    CrawlIndex index;
    for (const auto& record : records) {
        index.records_.emplace(record.url, record);
    }
    for (const auto& host : internalHosts) {
        index.internalHosts_.insert(host);
    }

    for (const auto& page : pages) {
        if (page.statusCode < 200 || page.statusCode >= 300 || page.fetchError != crawler::FetchErrorKind::NONE) {
            continue;
        }
        if (!page.bodyHash.empty()) {
            index.byBodyHash_[page.bodyHash].push_back(page.url);
        }
        if (!isSuccessfulHtml(page)) {
            continue;
        }
        // A redirected URL is the same document as its target
        if (page.title && !textKey(*page.title).empty()) {
            index.byTitle_[textKey(*page.title)].push_back(page.finalUrl);
        }
        if (page.metaDescription && !textKey(*page.metaDescription).empty()) {
            index.byDescription_[textKey(*page.metaDescription)].push_back(page.finalUrl);
        }
    }

    for (auto* group : {&index.byBodyHash_, &index.byTitle_, &index.byDescription_}) {
        for (auto& [key, urls] : *group) {
            std::sort(urls.begin(), urls.end());
            urls.erase(std::unique(urls.begin(), urls.end()), urls.end());
        }
    }
    return index;
}

const UrlRecord* CrawlIndex::find(const std::string& url) const {
    auto it = records_.find(url);
    return it == records_.end() ? nullptr : &it->second;
}

bool CrawlIndex::isInternal(const std::string& url) const {
    return internalHosts_.count(common::UrlNormalizer::extractHost(url)) > 0;
}

const std::vector<std::string>& CrawlIndex::urlsWithBodyHash(const std::string& hash) const {
    auto it = byBodyHash_.find(hash);
    return it == byBodyHash_.end() ? emptyList() : it->second;
}

const std::vector<std::string>& CrawlIndex::urlsWithTitle(const std::string& title) const {
    auto it = byTitle_.find(textKey(title));
    return it == byTitle_.end() ? emptyList() : it->second;
}

const std::vector<std::string>& CrawlIndex::urlsWithDescription(const std::string& description) const {
    auto it = byDescription_.find(textKey(description));
    return it == byDescription_.end() ? emptyList() : it->second;
}

} // namespace site_audit::audit
