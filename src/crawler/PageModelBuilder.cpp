#include "PageModelBuilder.h"
#include "../../include/Logger.h"
#include <algorithm>
#include <cctype>
#include <functional>
#include <iomanip>
#include <sstream>
#include <unordered_set>

namespace site_audit::crawler {

namespace {

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string collapseWhitespace(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    bool pendingSpace = false;
    for (unsigned char c : text) {
        if (std::isspace(c)) {
            pendingSpace = !out.empty();
            continue;
        }
        if (pendingSpace) {
            out += ' ';
            pendingSpace = false;
        }
        out += static_cast<char>(c);
    }
    return out;
}

const char* attribute(const GumboNode* node, const char* name) {
    const GumboAttribute* attr = gumbo_get_attribute(&node->v.element.attributes, name);
    return attr ? attr->value : nullptr;
}

// rel="alternate stylesheet" style token lists, compared case-insensitively
bool hasRelToken(const GumboNode* node, const std::string& token) {
    const char* rel = attribute(node, "rel");
    if (!rel) {
        return false;
    }
    std::istringstream tokens(toLower(rel));
    std::string part;
    while (tokens >> part) {
        if (part == token) {
            return true;
        }
    }
    return false;
}

int headingLevel(GumboTag tag) {
    switch (tag) {
        case GUMBO_TAG_H1: return 1;
        case GUMBO_TAG_H2: return 2;
        case GUMBO_TAG_H3: return 3;
        case GUMBO_TAG_H4: return 4;
        case GUMBO_TAG_H5: return 5;
        case GUMBO_TAG_H6: return 6;
        default: return 0;
    }
}

} // namespace

struct PageModelBuilder::ExtractionState {
    std::string baseUrl;
    bool baseSeen = false;
    std::unordered_set<std::string> seenLinks;
    std::unordered_set<std::string> seenResources;
};

PageModelBuilder::PageModelBuilder(common::UrlNormalizerOptions options)
    : normalizer_(std::move(options)) {
}

bool PageModelBuilder::isHtml(const std::string& contentType, const std::string& body) {
    std::string type = toLower(contentType);
    if (!type.empty()) {
        return type.find("text/html") != std::string::npos ||
               type.find("application/xhtml+xml") != std::string::npos;
    }
    // No declared type: sniff the start of the body
    size_t start = body.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) {
        return false;
    }
    std::string head = toLower(body.substr(start, 15));
    return head.rfind("<!doctype html", 0) == 0 || head.rfind("<html", 0) == 0;
}

std::string PageModelBuilder::hashBody(const std::string& body) {
    std::string normalized = collapseWhitespace(body);
    if (normalized.empty()) {
        return "";
    }
    std::ostringstream oss;
    oss << std::hex << std::setw(16) << std::setfill('0') << std::hash<std::string>{}(normalized);
    return oss.str();
}

PageModel PageModelBuilder::build(const FetchResult& fetch) const {
    PageModel model;
    model.url = fetch.url;
    model.finalUrl = fetch.finalUrl.empty() ? fetch.url : fetch.finalUrl;
    model.statusCode = fetch.statusCode;
    model.contentType = fetch.contentType();
    model.headers = fetch.headers;
    model.byteSize = fetch.body.size();
    model.fetchLatency = fetch.latency;
    model.redirectChain = fetch.redirectChain;
    model.redirectLoop = fetch.redirectLoop;
    model.fetchError = fetch.error;
    model.fetchErrorMessage = fetch.errorMessage;
    model.attempts = fetch.attempts;
    model.bodyHash = hashBody(fetch.body);

    if (fetch.error != FetchErrorKind::NONE || fetch.body.empty()) {
        return model;
    }

    model.isHtml = isHtml(model.contentType, fetch.body);
    if (!model.isHtml) {
        LOG_DEBUG("Minimal model for non-HTML " + model.finalUrl + " (" + model.contentType + ")");
        return model;
    }

    parseHtml(fetch.body, model);
    LOG_DEBUG("Built page model for " + model.finalUrl + ": " + std::to_string(model.links.size()) +
              " links, " + std::to_string(model.resources.size()) + " resources, " +
              std::to_string(model.markupErrors) + " markup errors");
    return model;
}

void PageModelBuilder::parseHtml(const std::string& html, PageModel& model) const {
    GumboOutput* output = gumbo_parse_with_options(&kGumboDefaultOptions, html.data(), html.size());
    if (!output) {
        LOG_WARNING("Failed to parse HTML for " + model.finalUrl);
        model.parseFailed = true;
        return;
    }

    model.markupErrors = output->errors.length;

    ExtractionState state;
    state.baseUrl = model.finalUrl;
    walk(output->root, model, state);

    gumbo_destroy_output(&kGumboDefaultOptions, output);
}

void PageModelBuilder::walk(const GumboNode* node, PageModel& model, ExtractionState& state) const {
    if (node->type != GUMBO_NODE_ELEMENT && node->type != GUMBO_NODE_TEMPLATE) {
        return;
    }
    handleElement(node, model, state);

    const GumboVector& children = node->v.element.children;
    for (unsigned int i = 0; i < children.length; ++i) {
        walk(static_cast<const GumboNode*>(children.data[i]), model, state);
    }
}

void PageModelBuilder::handleElement(const GumboNode* node, PageModel& model, ExtractionState& state) const {
    GumboTag tag = node->v.element.tag;

    if (int level = headingLevel(tag); level > 0) {
        model.headings.push_back({level, textContent(node)});
        return;
    }

    switch (tag) {
        case GUMBO_TAG_TITLE:
            if (!model.title) {
                model.title = textContent(node);
            }
            break;

        case GUMBO_TAG_BASE:
            if (const char* href = attribute(node, "href"); href && !state.baseSeen) {
                state.baseSeen = true;
                auto resolved = normalizer_.normalize(href, model.finalUrl);
                if (resolved) {
                    state.baseUrl = resolved.value;
                }
            }
            break;

        case GUMBO_TAG_META: {
            const char* name = attribute(node, "name");
            const char* content = attribute(node, "content");
            if (!name || !content) {
                break;
            }
            std::string key = toLower(name);
            if (key == "description" && !model.metaDescription) {
                model.metaDescription = std::string(content);
            } else if (key == "robots" && !model.metaRobots) {
                model.metaRobots = std::string(content);
            } else if (key == "viewport" && !model.viewport) {
                model.viewport = std::string(content);
            }
            break;
        }

        case GUMBO_TAG_LINK: {
            const char* href = attribute(node, "href");
            if (!href) {
                break;
            }
            if (hasRelToken(node, "canonical") && model.canonicalRaw.empty()) {
                model.canonicalRaw = href;
                auto canonical = normalizer_.normalize(href, state.baseUrl);
                if (canonical) {
                    model.canonical = canonical.value;
                }
            } else if (hasRelToken(node, "alternate") && attribute(node, "hreflang")) {
                auto alternate = normalizer_.normalize(href, state.baseUrl);
                if (alternate) {
                    model.hreflangs.push_back({attribute(node, "hreflang"), alternate.value});
                } else {
                    recordUnusable(href, alternate, model);
                }
            } else if (hasRelToken(node, "stylesheet")) {
                addResource(ResourceKind::STYLESHEET, href, model, state);
            }
            break;
        }

        case GUMBO_TAG_A:
        case GUMBO_TAG_AREA:
            if (const char* href = attribute(node, "href")) {
                addLink(href, model, state);
            }
            break;

        case GUMBO_TAG_IMG:
            if (const char* src = attribute(node, "src")) {
                addResource(ResourceKind::IMAGE, src, model, state);
            }
            break;

        case GUMBO_TAG_SCRIPT: {
            if (const char* src = attribute(node, "src")) {
                addResource(ResourceKind::SCRIPT, src, model, state);
                break;
            }
            const char* type = attribute(node, "type");
            if (type && toLower(type) == "application/ld+json") {
                std::string content;
                const GumboVector& children = node->v.element.children;
                for (unsigned int i = 0; i < children.length; ++i) {
                    const auto* child = static_cast<const GumboNode*>(children.data[i]);
                    if (child->type == GUMBO_NODE_TEXT || child->type == GUMBO_NODE_CDATA) {
                        content += child->v.text.text;
                    }
                }
                model.structuredData.push_back({"application/ld+json", content});
            }
            break;
        }

        default:
            break;
    }
}

void PageModelBuilder::addLink(const std::string& raw, PageModel& model, ExtractionState& state) const {
    auto result = normalizer_.normalize(raw, state.baseUrl);
    if (!result) {
        recordUnusable(raw, result, model);
        return;
    }
    if (state.seenLinks.insert(result.value).second) {
        model.links.push_back(result.value);
    }
}

void PageModelBuilder::addResource(ResourceKind kind, const std::string& raw, PageModel& model, ExtractionState& state) const {
    auto result = normalizer_.normalize(raw, state.baseUrl);
    if (!result) {
        recordUnusable(raw, result, model);
        return;
    }
    if (state.seenResources.insert(result.value).second) {
        model.resources.push_back({kind, result.value});
    }
}

void PageModelBuilder::recordUnusable(const std::string& raw, const common::NormalizeResult& result, PageModel& model) {
    // mailto:, tel:, javascript: and friends are dropped from the crawl but still reported
    bool disallowed = result.error == common::NormalizationError::UNSUPPORTED_SCHEME;
    model.malformedLinks.push_back({raw, disallowed ? "disallowed scheme" : result.message, disallowed});
}

std::string PageModelBuilder::textContent(const GumboNode* node) {
    std::string text;
    std::function<void(const GumboNode*)> collect = [&](const GumboNode* current) {
        if (current->type == GUMBO_NODE_TEXT || current->type == GUMBO_NODE_CDATA ||
            current->type == GUMBO_NODE_WHITESPACE) {
            text += current->v.text.text;
            text += ' ';
        } else if (current->type == GUMBO_NODE_ELEMENT) {
            if (current->v.element.tag == GUMBO_TAG_SCRIPT || current->v.element.tag == GUMBO_TAG_STYLE) {
                return;
            }
            const GumboVector& children = current->v.element.children;
            for (unsigned int i = 0; i < children.length; ++i) {
                collect(static_cast<const GumboNode*>(children.data[i]));
            }
        }
    };
    collect(node);
    return collapseWhitespace(text);
}

} // namespace site_audit::crawler
