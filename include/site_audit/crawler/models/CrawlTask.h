#pragma once

#include <string>

namespace site_audit::crawler {

// A unit of frontier work. Created on discovery, consumed once.
struct CrawlTask {
    std::string url;        // normalized
    size_t depth = 0;
    std::string parentUrl;  // empty for the seed
};

} // namespace site_audit::crawler
