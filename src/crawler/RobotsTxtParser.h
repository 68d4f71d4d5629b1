#pragma once

#include <chrono>
#include <optional>
#include <regex>
#include <string>
#include <vector>

namespace site_audit::crawler {

struct RobotsRule {
    bool allow = false;
    std::string pattern;   // as written, used for precedence by length
    std::regex matcher;
};

// Rules of one robots.txt group (consecutive User-agent lines plus their
// directives)
struct RobotsGroup {
    std::vector<std::string> userAgents;  // lower-cased
    std::vector<RobotsRule> rules;
    std::optional<std::chrono::milliseconds> crawlDelay;
};

// Parsed robots.txt of a single host. Immutable after parse, safe to share.
class RobotsRuleSet {
public:
    // Most specific rule wins; Allow wins a tie. No matching rule allows.
    bool isAllowed(const std::string& pathAndQuery, const std::string& userAgent) const;

    std::optional<std::chrono::milliseconds> crawlDelay(const std::string& userAgent) const;

    size_t groupCount() const { return groups_.size(); }

private:
    friend class RobotsTxtParser;

    // Group addressed to userAgent, falling back to '*'; nullptr if neither
    const RobotsGroup* selectGroup(const std::string& userAgent) const;

    std::vector<RobotsGroup> groups_;
};

class RobotsTxtParser {
public:
    // Never fails: unknown directives and garbage lines are ignored
    static RobotsRuleSet parse(const std::string& content);

    // Anchored regex for a robots path pattern supporting '*' and a trailing '$'
    static std::regex compilePattern(const std::string& pattern);
};

} // namespace site_audit::crawler
