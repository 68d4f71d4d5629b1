#include "RobotsTxtParser.h"
#include "../../include/Logger.h"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <sstream>

namespace site_audit::crawler {

namespace {

// One day
constexpr double kCrawlDelayCeilingSeconds = 86400.0;

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) {
        return "";
    }
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

// "SiteAuditBot/1.0 (+http://...)" -> "siteauditbot"
std::string productToken(const std::string& userAgent) {
    std::string lower = toLower(userAgent);
    size_t end = lower.find_first_of("/ ;(");
    return end == std::string::npos ? lower : lower.substr(0, end);
}

} // namespace

std::regex RobotsTxtParser::compilePattern(const std::string& pattern) {
    std::string regex = "^";
    for (size_t i = 0; i < pattern.size(); ++i) {
        char c = pattern[i];
        if (c == '*') {
            regex += ".*";
        } else if (c == '$' && i + 1 == pattern.size()) {
            regex += "$";
        } else if (std::string("\\^$.|?+()[]{}").find(c) != std::string::npos) {
            regex += '\\';
            regex += c;
        } else {
            regex += c;
        }
    }
    return std::regex(regex);
}

RobotsRuleSet RobotsTxtParser::parse(const std::string& content) {
    RobotsRuleSet ruleSet;
    std::istringstream stream(content);
    std::string line;
    // A run of User-agent lines opens a group; the first directive closes the run
    bool collectingAgents = false;

    while (std::getline(stream, line)) {
        size_t comment = line.find('#');
        if (comment != std::string::npos) {
            line.erase(comment);
        }
        line = trim(line);
        if (line.empty()) {
            continue;
        }

        size_t colon = line.find(':');
        if (colon == std::string::npos) {
            LOG_DEBUG("Ignoring robots.txt line without a directive: " + line);
            continue;
        }
        std::string field = toLower(trim(line.substr(0, colon)));
        std::string value = trim(line.substr(colon + 1));

        if (field == "user-agent") {
            if (!collectingAgents) {
                ruleSet.groups_.emplace_back();
                collectingAgents = true;
            }
            ruleSet.groups_.back().userAgents.push_back(toLower(value));
            continue;
        }

        collectingAgents = false;
        if (ruleSet.groups_.empty()) {
            // Directives before any User-agent line belong to no group
            continue;
        }
        RobotsGroup& group = ruleSet.groups_.back();

        if (field == "allow" || field == "disallow") {
            if (value.empty()) {
                // "Disallow:" with no path permits everything
                continue;
            }
            RobotsRule rule;
            rule.allow = field == "allow";
            rule.pattern = value;
            try {
                rule.matcher = compilePattern(value);
            } catch (const std::regex_error& e) {
                LOG_WARNING("Skipping robots.txt pattern " + value + ": " + e.what());
                continue;
            }
            group.rules.push_back(std::move(rule));
        } else if (field == "crawl-delay") {
            try {
                double seconds = std::stod(value);
                if (std::isnan(seconds) || seconds < 0) {
                    LOG_DEBUG("Ignoring invalid Crawl-delay value: " + value);
                } else {
                    // Clamped before conversion; the gate applies the configured ceiling
                    seconds = std::min(seconds, kCrawlDelayCeilingSeconds);
                    group.crawlDelay = std::chrono::milliseconds(static_cast<long long>(seconds * 1000));
                }
            } catch (const std::exception&) {
                LOG_DEBUG("Ignoring invalid Crawl-delay value: " + value);
            }
        }
    }

    LOG_DEBUG("Parsed robots.txt with " + std::to_string(ruleSet.groups_.size()) + " groups");
    return ruleSet;
}

const RobotsGroup* RobotsRuleSet::selectGroup(const std::string& userAgent) const {
    std::string token = productToken(userAgent);
    const RobotsGroup* wildcard = nullptr;
    const RobotsGroup* best = nullptr;
    size_t bestLength = 0;

    for (const auto& group : groups_) {
        for (const auto& agent : group.userAgents) {
            if (agent == "*") {
                if (!wildcard) {
                    wildcard = &group;
                }
            } else if (!token.empty() && token.find(agent) != std::string::npos && agent.size() > bestLength) {
                best = &group;
                bestLength = agent.size();
            }
        }
    }
    return best ? best : wildcard;
}

bool RobotsRuleSet::isAllowed(const std::string& pathAndQuery, const std::string& userAgent) const {
    const RobotsGroup* group = selectGroup(userAgent);
    if (!group) {
        return true;
    }

    std::string path = pathAndQuery.empty() ? "/" : pathAndQuery;
    const RobotsRule* winner = nullptr;
    for (const auto& rule : group->rules) {
        if (!std::regex_search(path, rule.matcher)) {
            continue;
        }
        if (!winner || rule.pattern.size() > winner->pattern.size() ||
            (rule.pattern.size() == winner->pattern.size() && rule.allow && !winner->allow)) {
            winner = &rule;
        }
    }

    if (winner && !winner->allow) {
        LOG_DEBUG("robots.txt rule " + winner->pattern + " disallows " + path);
        return false;
    }
    return true;
}

std::optional<std::chrono::milliseconds> RobotsRuleSet::crawlDelay(const std::string& userAgent) const {
    const RobotsGroup* group = selectGroup(userAgent);
    if (!group) {
        return std::nullopt;
    }
    return group->crawlDelay;
}

} // namespace site_audit::crawler
