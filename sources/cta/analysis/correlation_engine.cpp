//
// Created by gregorian-rayne on 10/10/26.
//

#include "cta/analysis/correlation_engine.hpp"
#include "cta/extract/metadata_extractor.hpp"

#include <ranges>
#include <unordered_map>

namespace cta::analysis
{
    namespace {

        std::unordered_map<IssueId, std::size_t> count_remaining(const std::vector<std::string>& current_files) {
            std::unordered_map<IssueId, std::size_t> counts;
            for (const auto& path : current_files) {
                if (const auto id = extract::extract_issue_id(path)) {
                    ++counts[*id];
                }
            }
            return counts;
        }

        void tally(AuditStatistics& stats, const IssueClassification& issue) {
            const std::size_t deleted = issue.events.size();

            ++stats.total_issues;
            stats.total_deleted_files += deleted;

            switch (issue.status) {
                case IssueStatus::FullyDeletedOpen:
                    ++stats.open_issues;
                    stats.open_deleted_files += deleted;
                    break;
                case IssueStatus::FullyDeletedClosed:
                    ++stats.closed_issues;
                    stats.closed_deleted_files += deleted;
                    break;
                case IssueStatus::PartiallyDeleted:
                    ++stats.partial_issues;
                    stats.partial_deleted_files += deleted;
                    stats.partial_remaining_files += issue.remaining_count;
                    break;
            }
        }

    }  // namespace

    AuditReport classify(
        const std::vector<DeletionEvent>& events,
        const tracker::OpenIssueSnapshot& open_issues,
        const std::vector<std::string>& current_files
    ) {
        AuditReport report;

        for (const auto& event : events) {
            auto& issue = report.issues[event.issue_id];
            issue.issue_id = event.issue_id;
            issue.events.push_back(event);
        }

        const auto remaining = count_remaining(current_files);

        for (auto& [id, issue] : report.issues) {
            if (const auto it = remaining.find(id); it != remaining.end()) {
                issue.remaining_count = it->second;
            }

            if (issue.remaining_count > 0) {
                issue.status = IssueStatus::PartiallyDeleted;
            } else if (open_issues.contains(id)) {
                issue.status = IssueStatus::FullyDeletedOpen;
            } else {
                issue.status = IssueStatus::FullyDeletedClosed;
            }

            tally(report.statistics, issue);
        }

        return report;
    }

    std::vector<const IssueClassification*> issues_with_status(
        const AuditReport& report,
        const IssueStatus status
    ) {
        std::vector<const IssueClassification*> out;
        for (const auto& issue : report.issues | std::views::values) {
            if (issue.status == status) {
                out.push_back(&issue);
            }
        }
        return out;
    }

}  // namespace cta::analysis
