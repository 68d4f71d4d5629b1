#include "../include/Logger.h"
#include "../include/site_audit/AuditSession.h"
#include <iostream>

namespace {

void printUsage(const char* program) {
    std::cerr << "Usage: " << program << " <seed-url> [config.json] [report.json]\n"
              << "  LOG_LEVEL=TRACE|DEBUG|INFO|WARNING|ERROR|NONE  log verbosity (default INFO)\n"
              << "  LOG_FILE=<path>                                 also append logs to a file\n";
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc < 2 || std::string(argv[1]) == "--help" || std::string(argv[1]) == "-h") {
        printUsage(argv[0]);
        return argc < 2 ? 2 : 0;
    }

    Logger::getInstance().initFromEnvironment(LogLevel::INFO);

    site_audit::CrawlConfig config;
    try {
        if (argc >= 3) {
            config = site_audit::loadCrawlConfig(argv[2]);
        }
        config.seedUrl = argv[1];
        config.validate();
    } catch (const site_audit::ConfigError& e) {
        std::cerr << "Configuration error: " << e.what() << std::endl;
        return 2;
    }

    try {
        site_audit::AuditSession session(config);
        auto report = session.run();

        const auto& s = report.summary;
        std::cout << "Audit of " << report.seedUrl << "\n"
                  << "  pages fetched:          " << s.pagesFetched << "\n"
                  << "  pages skipped (robots): " << s.pagesSkippedRobots << "\n"
                  << "  pages skipped (budget): " << s.pagesSkippedBudget << "\n"
                  << "  pages failed:           " << s.pagesFailed << "\n"
                  << "  malformed:              " << s.pagesMalformed << "\n"
                  << "  requests / retries:     " << s.totalRequests << " / " << s.retries << "\n";
        for (auto severity : {site_audit::audit::Severity::CRITICAL,
                              site_audit::audit::Severity::WARNING,
                              site_audit::audit::Severity::INFO}) {
            auto it = s.findingsBySeverity.find(severity);
            std::cout << "  findings (" << site_audit::audit::severityToString(severity) << "): "
                      << (it == s.findingsBySeverity.end() ? 0 : it->second) << "\n";
        }

        if (argc >= 4) {
            site_audit::audit::writeReport(report, argv[3]);
        } else {
            std::cout << site_audit::audit::toJson(report).dump(2) << std::endl;
        }
    } catch (const site_audit::ConfigError& e) {
        std::cerr << "Configuration error: " << e.what() << std::endl;
        return 2;
    } catch (const std::exception& e) {
        LOG_ERROR(std::string("Audit failed: ") + e.what());
        return 1;
    }

    Logger::getInstance().close();
    return 0;
}
