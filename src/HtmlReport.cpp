#include "GuardDog/HtmlReport.hpp"

#include "GuardDog/Crypto.hpp"

#include <fstream>
#include <iomanip>
#include <sstream>
#include <system_error>

namespace fs = std::filesystem;

namespace guarddog {

namespace {

const char *kStyle = R"(
    body { font-family: system-ui, -apple-system, "Segoe UI", sans-serif; margin: 2rem; background: #fdfdfd; color: #222; }
    h1 { margin-bottom: 0.25rem; }
    .meta { color: #666; font-size: 0.9rem; margin-bottom: 1.5rem; }
    .summary { margin-bottom: 1.5rem; padding: 1rem; border-radius: 0.5rem; }
    .summary-OK { background: #e8f5e9; border: 1px solid #c8e6c9; }
    .summary-WARN { background: #fff8e1; border: 1px solid #ffe082; }
    .summary-HIGH, .summary-VERIFICATION_FAILED { background: #ffebee; border: 1px solid #ef9a9a; }
    .summary-UNKNOWN { background: #eceff1; border: 1px solid #cfd8dc; }
    .checks { display: flex; flex-direction: column; gap: 1rem; }
    .check { padding: 1rem; border-radius: 0.5rem; border: 1px solid #ddd; background: #fff; }
    .check h2 { margin-top: 0; margin-bottom: 0.25rem; }
    .check-status { font-size: 0.85rem; text-transform: uppercase; letter-spacing: 0.05em; }
    .status-OK { color: #2e7d32; }
    .status-WARN { color: #f9a825; }
    .status-HIGH { color: #c62828; }
    .status-UNKNOWN { color: #455a64; }
    .section-title { font-weight: 600; margin-top: 0.75rem; margin-bottom: 0.25rem; }
    table.evidence { border-collapse: collapse; font-size: 0.9rem; }
    table.evidence td { border: 1px solid #e0e0e0; padding: 0.3rem 0.6rem; vertical-align: top; }
    table.evidence td.label { background: #f7f7f7; font-weight: 600; }
    ul.diagnostics { color: #666; font-size: 0.85rem; }
)";

std::string localTime(std::time_t value, const char *format) {
    std::tm tm{};
#ifdef _WIN32
    localtime_s(&tm, &value);
#else
    localtime_r(&value, &tm);
#endif
    std::ostringstream oss;
    oss << std::put_time(&tm, format);
    return oss.str();
}

} // namespace

HtmlReport::HtmlReport(const RunSummary &summary) : summary_(summary) {}

std::string HtmlReport::escape(const std::string &value) {
    std::string escaped;
    escaped.reserve(value.size());
    for (char ch : value) {
        switch (ch) {
        case '&':
            escaped += "&amp;";
            break;
        case '<':
            escaped += "&lt;";
            break;
        case '>':
            escaped += "&gt;";
            break;
        case '"':
            escaped += "&quot;";
            break;
        case '\'':
            escaped += "&#x27;";
            break;
        default:
            escaped += ch;
        }
    }
    return escaped;
}

std::string HtmlReport::fileNameFor(std::time_t startedAt) {
    return "GuardDog_Report_" + localTime(startedAt, "%Y%m%d_%H%M%S") + ".html";
}

std::string HtmlReport::bannerMessage(const RunSummary &summary) {
    switch (summary.overallStatus) {
    case OverallStatus::VerificationFailed:
        return "GuardDog stopped before running any checks because its own files could not be verified. "
               "This copy may have been modified; obtain a fresh copy from a trusted source.";
    case OverallStatus::High:
        return "GuardDog found some important security issues that you should fix soon.";
    case OverallStatus::Warn:
        return "GuardDog found some things that could be improved to make this computer safer.";
    case OverallStatus::Unknown:
        if (summary.checks.empty()) {
            return "GuardDog did not run any checks.";
        }
        return "GuardDog could not verify everything. Some checks were blocked or unclear.";
    case OverallStatus::Ok:
        return "GuardDog did not find any obvious high-risk issues in the checks it ran.";
    }
    return "";
}

std::string HtmlReport::render() const {
    const std::string overall = toString(summary_.overallStatus);
    std::ostringstream html;
    html << "<!DOCTYPE html>\n"
         << "<html lang='en'>\n"
         << "<head>\n"
         << "  <meta charset='utf-8'>\n"
         << "  <title>GuardDog Security Check Report</title>\n"
         << "  <style>" << kStyle << "  </style>\n"
         << "</head>\n"
         << "<body>\n"
         << "  <h1>GuardDog Security Check Report</h1>\n"
         << "  <div class='meta'>Generated at " << escape(localTime(summary_.startedAt, "%Y-%m-%d %H:%M:%S"));
    if (!summary_.hostId.empty()) {
        html << " on " << escape(summary_.hostId);
    }
    html << "</div>\n"
         << "  <div class='summary summary-" << escape(overall) << "'>\n"
         << "    <p><strong>Overall: " << escape(overall) << "</strong></p>\n"
         << "    <p>" << escape(bannerMessage(summary_)) << "</p>\n";

    if (!summary_.verdict.passed()) {
        html << "    <div class='section-title'>Integrity verification failed</div>\n"
             << "    <table class='evidence'>\n"
             << "      <tr><td class='label'>Reason</td><td>" << escape(toString(summary_.verdict.reason))
             << "</td></tr>\n";
        if (!summary_.verdict.path.empty()) {
            html << "      <tr><td class='label'>File</td><td>" << escape(summary_.verdict.path) << "</td></tr>\n";
        }
        html << "      <tr><td class='label'>Detail</td><td>" << escape(summary_.verdict.detail) << "</td></tr>\n"
             << "    </table>\n";
    }
    html << "  </div>\n";

    if (summary_.verdict.passed()) {
        html << "  <div class='checks'>\n";
        for (const auto &check : summary_.checks) {
            const std::string status = toString(check.status);
            html << "    <section class='check' id='" << escape(check.id) << "'>\n"
                 << "      <h2>" << escape(check.title) << "</h2>\n"
                 << "      <div class='check-status status-" << escape(status) << "'>Status: " << escape(status)
                 << "</div>\n";
            if (!check.summary.empty()) {
                html << "      <p>" << escape(check.summary) << "</p>\n";
            }
            if (!check.details.empty()) {
                html << "      <div class='section-title'>Details</div>\n"
                     << "      <table class='evidence'>\n";
                for (const auto &detail : check.details) {
                    html << "        <tr><td class='label'>" << escape(detail.label) << "</td><td>"
                         << escape(detail.value) << "</td></tr>\n";
                }
                html << "      </table>\n";
            }
            if (!check.remediation.empty()) {
                html << "      <div class='section-title'>What you can do</div>\n"
                     << "      <ol>\n";
                for (const auto &step : check.remediation) {
                    html << "        <li>" << escape(step) << "</li>\n";
                }
                html << "      </ol>\n";
            }
            html << "    </section>\n";
        }
        html << "  </div>\n";
    }

    if (!summary_.diagnostics.empty()) {
        html << "  <div class='section-title'>Diagnostics</div>\n"
             << "  <ul class='diagnostics'>\n";
        for (const auto &note : summary_.diagnostics) {
            html << "    <li>" << escape(note) << "</li>\n";
        }
        html << "  </ul>\n";
    }
    html << "</body>\n"
         << "</html>\n";
    return html.str();
}

fs::path HtmlReport::write(const fs::path &directory) const {
    std::error_code ec;
    fs::create_directories(directory, ec);
    if (ec) {
        throw IoError("Unable to create report directory " + directory.string() + ": " + ec.message());
    }

    const fs::path target = directory / fileNameFor(summary_.startedAt);
    fs::path temporary = target;
    temporary += ".partial";
    {
        std::ofstream out(temporary, std::ios::binary | std::ios::trunc);
        if (!out) {
            throw IoError("Unable to open " + temporary.string() + " for writing");
        }
        out << render();
        out.flush();
        if (!out) {
            out.close();
            fs::remove(temporary, ec);
            throw IoError("Unable to write report to " + temporary.string());
        }
    }

    fs::rename(temporary, target, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(temporary, ignored);
        throw IoError("Unable to move report into place at " + target.string() + ": " + ec.message());
    }
    return target;
}

} // namespace guarddog
