//
// Created by gregorian-rayne on 10/2/26.
//

#ifndef CRASHTESTAUDIT_TYPES_HPP
#define CRASHTESTAUDIT_TYPES_HPP

/**
 * @file types.hpp
 * @brief Core data structures for the crash test audit.
 *
 * - Basic Types: Duration, Timestamp, IssueId, CalendarDate
 * - History Data: DeletionEvent
 * - Classification Data: IssueStatus, IssueClassification, AuditStatistics,
 *   AuditReport
 *
 * Records produced by the scanner are immutable values; they are copied or
 * moved into the correlation engine, never shared.
 */

#include "cta/result.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace cta {

    namespace fs = std::filesystem;

    // ============================================================================
    // Basic Types
    // ============================================================================

    using Duration = std::chrono::nanoseconds;

    using Timestamp = std::chrono::system_clock::time_point;

    /**
     * Tracker-assigned issue (or pull request) number.
     */
    using IssueId = std::uint64_t;

    /**
     * A UTC calendar date, compared chronologically.
     */
    struct CalendarDate {
        std::chrono::year_month_day ymd{};

        /**
         * Parses a strict "YYYY-MM-DD" date. Impossible dates such as
         * 2024-02-30 are rejected.
         */
        [[nodiscard]] static Result<CalendarDate, Error> parse(std::string_view text);

        /**
         * Builds a date from a calendar triple without validation.
         */
        [[nodiscard]] static CalendarDate from_ymd(int year, unsigned month, unsigned day);

        /**
         * UTC date of a Unix timestamp (seconds).
         */
        [[nodiscard]] static CalendarDate from_unix_seconds(std::int64_t seconds);

        [[nodiscard]] std::string to_string() const;

        auto operator<=>(const CalendarDate&) const = default;
    };

    // ============================================================================
    // History Data
    // ============================================================================

    /**
     * A crash test file removed between a first-parent commit and its parent.
     */
    struct DeletionEvent {
        std::string file_path;
        IssueId issue_id = 0;
        std::string commit_hash;
        CalendarDate commit_date;
        std::optional<IssueId> pr_id;

        [[nodiscard]] std::string short_hash() const {
            return commit_hash.substr(0, 8);
        }

        bool operator==(const DeletionEvent&) const = default;
    };

    // ============================================================================
    // Classification Data
    // ============================================================================

    /**
     * Outcome of correlating one issue's deletions with tracker state.
     */
    enum class IssueStatus {
        FullyDeletedOpen,    // every file gone, issue still open: needs attention
        FullyDeletedClosed,  // every file gone, issue closed: in sync
        PartiallyDeleted     // some files remain, whatever the issue state
    };

    inline const char* to_string(IssueStatus status) noexcept {
        switch (status) {
            case IssueStatus::FullyDeletedOpen:   return "fully-deleted-open";
            case IssueStatus::FullyDeletedClosed: return "fully-deleted-closed";
            case IssueStatus::PartiallyDeleted:   return "partially-deleted";
        }
        return "unknown";
    }

    struct IssueClassification {
        IssueId issue_id = 0;
        std::vector<DeletionEvent> events;
        std::size_t remaining_count = 0;
        IssueStatus status = IssueStatus::FullyDeletedClosed;

        bool operator==(const IssueClassification&) const = default;
    };

    /**
     * Per-bucket totals for summary reporting.
     */
    struct AuditStatistics {
        std::size_t total_issues = 0;
        std::size_t total_deleted_files = 0;

        std::size_t open_issues = 0;
        std::size_t closed_issues = 0;
        std::size_t partial_issues = 0;

        std::size_t open_deleted_files = 0;
        std::size_t closed_deleted_files = 0;
        std::size_t partial_deleted_files = 0;

        std::size_t partial_remaining_files = 0;

        bool operator==(const AuditStatistics&) const = default;
    };

    /**
     * Classified audit, keyed and ordered by issue id.
     */
    struct AuditReport {
        std::map<IssueId, IssueClassification> issues;
        AuditStatistics statistics;

        bool operator==(const AuditReport&) const = default;
    };

}  // namespace cta

#endif //CRASHTESTAUDIT_TYPES_HPP
