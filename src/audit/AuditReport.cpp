#include "../../include/site_audit/audit/AuditReport.h"
#include "../../include/Logger.h"
#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace site_audit::audit {

namespace {

std::string formatTime(std::chrono::system_clock::time_point tp) {
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    gmtime_r(&t, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

nlohmann::json recordToJson(const crawler::UrlRecord& record) {
    nlohmann::json j;
    j["finalUrl"] = record.finalUrl;
    j["status"] = record.statusCode;
    j["outcome"] = crawler::outcomeKindToString(record.outcome);
    j["depth"] = record.depth;
    j["parent"] = record.parentUrl;
    j["attempts"] = record.attempts;
    j["latencyMs"] = record.latency.count();
    if (!record.redirectChain.empty()) {
        j["redirectChain"] = record.redirectChain;
    }
    if (!record.error.empty()) {
        j["error"] = record.error;
    }
    return j;
}

} // namespace

std::string severityToString(Severity severity) {
    switch (severity) {
        case Severity::INFO: return "info";
        case Severity::WARNING: return "warning";
        case Severity::CRITICAL: return "critical";
        default: return "unknown";
    }
}

std::set<std::string> AuditReport::resolvedUrls() const {
    std::set<std::string> out;
    for (const auto& [url, record] : inventory) {
        if (record.outcome == crawler::OutcomeKind::FETCHED) {
            out.insert(record.finalUrl.empty() ? url : record.finalUrl);
        }
    }
    return out;
}

std::vector<Finding> AuditReport::findingsFor(const std::string& checkId) const {
    std::vector<Finding> out;
    for (const auto& finding : findings) {
        if (finding.checkId == checkId) {
            out.push_back(finding);
        }
    }
    return out;
}

nlohmann::json toJson(const AuditReport& report) {
    nlohmann::json j;
    j["seedUrl"] = report.seedUrl;
    j["startTime"] = formatTime(report.startTime);
    j["endTime"] = formatTime(report.endTime);
    j["durationMs"] = std::chrono::duration_cast<std::chrono::milliseconds>(report.endTime - report.startTime).count();
    j["deadlineReached"] = report.deadlineReached;

    nlohmann::json inventory = nlohmann::json::object();
    for (const auto& [url, record] : report.inventory) {
        inventory[url] = recordToJson(record);
    }
    j["inventory"] = inventory;

    nlohmann::json findings = nlohmann::json::array();
    for (const auto& finding : report.findings) {
        findings.push_back({
            {"checkId", finding.checkId},
            {"severity", severityToString(finding.severity)},
            {"url", finding.url},
            {"message", finding.message},
            {"evidence", finding.evidence}
        });
    }
    j["findings"] = findings;

    const AuditSummary& s = report.summary;
    nlohmann::json summary;
    summary["pagesFetched"] = s.pagesFetched;
    summary["pagesSkippedRobots"] = s.pagesSkippedRobots;
    summary["pagesFailed"] = s.pagesFailed;
    summary["pagesMalformed"] = s.pagesMalformed;
    summary["pagesSkippedBudget"] = s.pagesSkippedBudget;
    summary["totalRequests"] = s.totalRequests;
    summary["retries"] = s.retries;
    summary["robotsUnavailableHosts"] = s.robotsUnavailableHosts;
    summary["enqueueRefusedByBudget"] = s.enqueueRefusedByBudget;
    nlohmann::json bySeverity = nlohmann::json::object();
    for (Severity severity : {Severity::INFO, Severity::WARNING, Severity::CRITICAL}) {
        auto it = s.findingsBySeverity.find(severity);
        bySeverity[severityToString(severity)] = it == s.findingsBySeverity.end() ? 0 : it->second;
    }
    summary["findingsBySeverity"] = bySeverity;
    j["summary"] = summary;

    return j;
}

void writeReport(const AuditReport& report, const std::string& path) {
    std::ofstream out(path, std::ios::trunc);
    if (!out.is_open()) {
        throw std::runtime_error("cannot open report file for writing: " + path);
    }
    out << toJson(report).dump(2) << '\n';
    if (!out) {
        throw std::runtime_error("failed to write report file: " + path);
    }
    LOG_INFO("Report written to " + path);
}

} // namespace site_audit::audit
