#pragma once

#include <string>
#include <gumbo.h>
#include "../../include/site_audit/common/UrlNormalizer.h"
#include "../../include/site_audit/crawler/models/FetchResult.h"
#include "../../include/site_audit/crawler/models/PageModel.h"

namespace site_audit::crawler {

// Turns a FetchResult into a PageModel. HTML bodies are parsed with gumbo;
// anything else gets a model carrying only status, size and headers.
class PageModelBuilder {
public:
    explicit PageModelBuilder(common::UrlNormalizerOptions options = common::UrlNormalizerOptions());

    // Never throws on bad markup; the result is a best-effort partial model
    PageModel build(const FetchResult& fetch) const;

    static bool isHtml(const std::string& contentType, const std::string& body);

    // Hex hash of the whitespace-collapsed body, empty for an empty body
    static std::string hashBody(const std::string& body);

private:
    struct ExtractionState;

    void parseHtml(const std::string& html, PageModel& model) const;
    void walk(const GumboNode* node, PageModel& model, ExtractionState& state) const;
    void handleElement(const GumboNode* node, PageModel& model, ExtractionState& state) const;
    void addLink(const std::string& raw, PageModel& model, ExtractionState& state) const;
    void addResource(ResourceKind kind, const std::string& raw, PageModel& model, ExtractionState& state) const;

    static void recordUnusable(const std::string& raw, const common::NormalizeResult& result, PageModel& model);
    static std::string textContent(const GumboNode* node);

    common::UrlNormalizer normalizer_;
};

} // namespace site_audit::crawler
