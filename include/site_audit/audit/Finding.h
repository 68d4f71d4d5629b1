#pragma once

#include <string>
#include <tuple>

namespace site_audit::audit {

enum class Severity {
    INFO = 0,
    WARNING = 1,
    CRITICAL = 2
};

std::string severityToString(Severity severity);

// A single reported issue. Never mutated after emission.
struct Finding {
    std::string checkId;
    Severity severity = Severity::INFO;
    std::string url;
    std::string message;
    std::string evidence;
};

// Ordering used to stabilise the report: (url, checkId, message, evidence)
inline bool findingLess(const Finding& a, const Finding& b) {
    return std::tie(a.url, a.checkId, a.severity, a.message, a.evidence) <
           std::tie(b.url, b.checkId, b.severity, b.message, b.evidence);
}

} // namespace site_audit::audit
