//
// Created by gregorian-rayne on 10/11/26.
//

#include "cta/report/report_renderer.hpp"
#include "cta/analysis/correlation_engine.hpp"
#include "cta/version.hpp"

#include <nlohmann/json.hpp>

#include <iomanip>
#include <ostream>
#include <sstream>

namespace cta::report
{
    namespace {

        using json = nlohmann::json;

        constexpr auto RULE = "─────────────────────────────────────────────────";

        /**
         * ANSI styling that collapses to nothing when colour is off.
         */
        class Style {
        public:
            explicit Style(const bool enabled) : enabled_(enabled) {}

            [[nodiscard]] const char* bold() const { return enabled_ ? "\033[1m" : ""; }
            [[nodiscard]] const char* dim() const { return enabled_ ? "\033[2m" : ""; }
            [[nodiscard]] const char* red() const { return enabled_ ? "\033[31m" : ""; }
            [[nodiscard]] const char* green() const { return enabled_ ? "\033[32m" : ""; }
            [[nodiscard]] const char* yellow() const { return enabled_ ? "\033[33m" : ""; }
            [[nodiscard]] const char* reset() const { return enabled_ ? "\033[0m" : ""; }

        private:
            bool enabled_;
        };

        void print_event_line(std::ostream& out, const DeletionEvent& event, const Style& style) {
            out << event.file_path << " deleted in "
                << style.dim() << event.short_hash() << style.reset()
                << " (" << event.commit_date.to_string() << ")";
            if (event.pr_id) {
                out << " via #" << *event.pr_id;
            }
        }

        void print_attention_section(
            std::ostream& out,
            const AuditReport& report,
            const ReportContext& context,
            const Style& style
        ) {
            const auto issues = analysis::issues_with_status(report, IssueStatus::FullyDeletedOpen);
            if (issues.empty()) {
                return;
            }

            out << style.bold() << style.red()
                << "Out-of-sync issues (test deleted but issue still open):"
                << style.reset() << "\n\n";

            for (const auto* issue : issues) {
                for (const auto& event : issue->events) {
                    out << "  • Issue #" << issue->issue_id << ": ";
                    print_event_line(out, event, style);
                    out << "\n";
                }
                out << "    " << context.issue_url(issue->issue_id) << "\n\n";
            }
        }

        void print_partial_section(
            std::ostream& out,
            const AuditReport& report,
            const ReportContext& context,
            const Style& style
        ) {
            const auto issues = analysis::issues_with_status(report, IssueStatus::PartiallyDeleted);
            if (issues.empty()) {
                return;
            }

            out << style.bold() << style.yellow()
                << "Partially cleaned issues (some crash tests remain):"
                << style.reset() << "\n\n";

            for (const auto* issue : issues) {
                out << "  • Issue #" << issue->issue_id << ": "
                    << issue->events.size() << " deleted, "
                    << issue->remaining_count << " remaining\n";
                for (const auto& event : issue->events) {
                    out << "      ";
                    print_event_line(out, event, style);
                    out << "\n";
                }
                out << "    " << context.issue_url(issue->issue_id) << "\n\n";
            }
        }

        void print_summary(
            std::ostream& out,
            const AuditStatistics& stats,
            const ReportContext& context,
            const Style& style
        ) {
            const std::size_t total = stats.total_issues;

            out << RULE << "\n";
            out << style.bold() << "Summary:" << style.reset() << "\n";
            out << "  Total deleted tests: " << stats.total_deleted_files << "\n";
            out << "  Total tracked issues: " << total << "\n";
            out << "  Total open issues in " << context.tracker_name() << ": "
                << context.open_issue_total << "\n\n";

            out << "  " << style.red() << "Issues still open: " << style.reset()
                << stats.open_issues << " (" << format_share(stats.open_issues, total) << "%)\n";
            out << "  " << style.green() << "Issues properly closed: " << style.reset()
                << stats.closed_issues << " (" << format_share(stats.closed_issues, total) << "%)\n";
            out << "  " << style.yellow() << "Issues partially cleaned: " << style.reset()
                << stats.partial_issues << " (" << format_share(stats.partial_issues, total) << "%)";
            if (stats.partial_issues > 0) {
                out << ", " << stats.partial_remaining_files << " test(s) remaining";
            }
            out << "\n";
            out << RULE << "\n";
        }

        void print_recommendation(std::ostream& out, const AuditStatistics& stats, const Style& style) {
            if (stats.open_issues == 0) {
                out << "\n" << style.green()
                    << "All deleted crash tests have properly closed issues!"
                    << style.reset() << "\n";
                return;
            }

            out << "\n" << style.red() << "Found " << stats.open_issues
                << " out-of-sync issue(s) that need attention." << style.reset() << "\n";
            out << "\nThese issues should either:\n";
            out << "  1. Be reopened (if the crash test was removed by mistake)\n";
            out << "  2. Be closed (if the issue is actually fixed)\n";
        }

        json event_to_json(const DeletionEvent& event) {
            json j;
            j["file_path"] = event.file_path;
            j["commit"] = event.commit_hash;
            j["date"] = event.commit_date.to_string();
            j["pr"] = event.pr_id ? json(*event.pr_id) : json(nullptr);
            return j;
        }

    }  // namespace

    std::string ReportContext::issue_url(const IssueId id) const {
        std::string base = web_url;
        while (!base.empty() && base.back() == '/') {
            base.pop_back();
        }
        return base + "/" + owner + "/" + repo + "/issues/" + std::to_string(id);
    }

    std::string format_share(const std::size_t count, const std::size_t total) {
        const double pct = total == 0
                               ? 0.0
                               : static_cast<double>(count) / static_cast<double>(total) * 100.0;
        std::ostringstream ss;
        ss << std::fixed << std::setprecision(1) << pct;
        return ss.str();
    }

    void render_text_report(const AuditReport& report, const ReportContext& context, std::ostream& out) {
        const Style style(context.use_color);

        print_attention_section(out, report, context, style);
        print_partial_section(out, report, context, style);
        print_summary(out, report.statistics, context, style);
        print_recommendation(out, report.statistics, style);
    }

    std::string render_json_report(const AuditReport& report, const ReportContext& context) {
        json doc;
        doc["tool"] = {{"name", PROJECT_SHORT_NAME}, {"version", VERSION_STRING}};
        doc["tracker"] = context.tracker_name();
        doc["open_issue_total"] = context.open_issue_total;

        json issues = json::array();
        for (const auto& [id, issue] : report.issues) {
            json entry;
            entry["issue"] = id;
            entry["status"] = to_string(issue.status);
            entry["url"] = context.issue_url(id);
            entry["remaining_count"] = issue.remaining_count;

            json events = json::array();
            for (const auto& event : issue.events) {
                events.push_back(event_to_json(event));
            }
            entry["deleted_files"] = std::move(events);
            issues.push_back(std::move(entry));
        }
        doc["issues"] = std::move(issues);

        const auto& s = report.statistics;
        doc["statistics"] = {
            {"total_issues", s.total_issues},
            {"total_deleted_files", s.total_deleted_files},
            {"open_issues", s.open_issues},
            {"closed_issues", s.closed_issues},
            {"partial_issues", s.partial_issues},
            {"open_deleted_files", s.open_deleted_files},
            {"closed_deleted_files", s.closed_deleted_files},
            {"partial_deleted_files", s.partial_deleted_files},
            {"partial_remaining_files", s.partial_remaining_files}
        };

        return doc.dump(2);
    }

}  // namespace cta::report
