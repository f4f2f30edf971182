//
// Created by gregorian-rayne on 10/10/26.
//

#include "cta/analysis/correlation_engine.hpp"

#include <gtest/gtest.h>
#include <ranges>

namespace cta::analysis
{
    namespace {

        DeletionEvent deletion(const std::string& path, const IssueId issue, const std::string& commit) {
            DeletionEvent event;
            event.file_path = path;
            event.issue_id = issue;
            event.commit_hash = commit;
            event.commit_date = CalendarDate::from_ymd(2024, 2, 10);
            return event;
        }

        tracker::OpenIssueSnapshot open_set(tracker::IssueSet ids) {
            return tracker::OpenIssueSnapshot(std::move(ids), Timestamp{});
        }

    }  // namespace

    TEST(CorrelationEngineTest, ClassifiesEachBucket) {
        const std::vector<DeletionEvent> events = {
            deletion("tests/crashes/100.rs", 100, "c1"),
            deletion("tests/crashes/200-foo.rs", 200, "c2"),
            deletion("tests/crashes/300.rs", 300, "c3"),
        };
        const std::vector<std::string> current = {"tests/crashes/200-bar.rs", "tests/crashes/999.rs"};

        const auto report = classify(events, open_set({100}), current);

        ASSERT_EQ(report.issues.size(), 3u);
        EXPECT_EQ(report.issues.at(100).status, IssueStatus::FullyDeletedOpen);
        EXPECT_EQ(report.issues.at(100).remaining_count, 0u);
        EXPECT_EQ(report.issues.at(200).status, IssueStatus::PartiallyDeleted);
        EXPECT_EQ(report.issues.at(200).remaining_count, 1u);
        EXPECT_EQ(report.issues.at(300).status, IssueStatus::FullyDeletedClosed);
    }

    TEST(CorrelationEngineTest, RemainingFilesTakePrecedenceOverOpenState) {
        const std::vector<DeletionEvent> events = {deletion("tests/crashes/200-foo.rs", 200, "c1")};
        const std::vector<std::string> current = {"tests/crashes/200-bar.rs", "tests/crashes/200-baz.rs"};

        const auto report = classify(events, open_set({200}), current);

        ASSERT_EQ(report.issues.size(), 1u);
        EXPECT_EQ(report.issues.at(200).status, IssueStatus::PartiallyDeleted);
        EXPECT_EQ(report.issues.at(200).remaining_count, 2u);
    }

    TEST(CorrelationEngineTest, GroupsEventsInScanOrder) {
        const std::vector<DeletionEvent> events = {
            deletion("tests/crashes/500-b.rs", 500, "newer"),
            deletion("tests/crashes/7.rs", 7, "newer"),
            deletion("tests/crashes/500-a.rs", 500, "older"),
        };

        const auto report = classify(events, open_set({500}), {});

        const auto& issue = report.issues.at(500);
        ASSERT_EQ(issue.events.size(), 2u);
        EXPECT_EQ(issue.events[0].commit_hash, "newer");
        EXPECT_EQ(issue.events[1].commit_hash, "older");
        EXPECT_EQ(issue.status, IssueStatus::FullyDeletedOpen);
    }

    TEST(CorrelationEngineTest, IteratesInAscendingIssueOrder) {
        const std::vector<DeletionEvent> events = {
            deletion("tests/crashes/30.rs", 30, "c"),
            deletion("tests/crashes/4.rs", 4, "c"),
            deletion("tests/crashes/200.rs", 200, "c"),
        };

        const auto report = classify(events, open_set({}), {});

        std::vector<IssueId> order;
        for (const auto& id : report.issues | std::views::keys) {
            order.push_back(id);
        }
        EXPECT_EQ(order, (std::vector<IssueId>{4, 30, 200}));
    }

    TEST(CorrelationEngineTest, PartitionsEveryIssueExactlyOnce) {
        const std::vector<DeletionEvent> events = {
            deletion("tests/crashes/1.rs", 1, "a"),
            deletion("tests/crashes/2.rs", 2, "a"),
            deletion("tests/crashes/3-x.rs", 3, "b"),
            deletion("tests/crashes/3-y.rs", 3, "b"),
            deletion("tests/crashes/4.rs", 4, "c"),
        };
        const std::vector<std::string> current = {"tests/crashes/3-z.rs", "tests/crashes/notes.rs"};

        const auto report = classify(events, open_set({1, 4, 99}), current);

        const auto open = issues_with_status(report, IssueStatus::FullyDeletedOpen);
        const auto closed = issues_with_status(report, IssueStatus::FullyDeletedClosed);
        const auto partial = issues_with_status(report, IssueStatus::PartiallyDeleted);

        EXPECT_EQ(open.size() + closed.size() + partial.size(), report.issues.size());
        ASSERT_EQ(open.size(), 2u);
        EXPECT_EQ(open[0]->issue_id, 1u);
        EXPECT_EQ(open[1]->issue_id, 4u);
        ASSERT_EQ(closed.size(), 1u);
        EXPECT_EQ(closed[0]->issue_id, 2u);
        ASSERT_EQ(partial.size(), 1u);
        EXPECT_EQ(partial[0]->issue_id, 3u);
    }

    TEST(CorrelationEngineTest, Statistics) {
        const std::vector<DeletionEvent> events = {
            deletion("tests/crashes/1.rs", 1, "a"),
            deletion("tests/crashes/2.rs", 2, "a"),
            deletion("tests/crashes/3-x.rs", 3, "b"),
            deletion("tests/crashes/3-y.rs", 3, "b"),
        };
        const std::vector<std::string> current = {"tests/crashes/3-z.rs", "tests/crashes/3-w.rs"};

        const auto stats = classify(events, open_set({1}), current).statistics;

        EXPECT_EQ(stats.total_issues, 3u);
        EXPECT_EQ(stats.total_deleted_files, 4u);
        EXPECT_EQ(stats.open_issues, 1u);
        EXPECT_EQ(stats.closed_issues, 1u);
        EXPECT_EQ(stats.partial_issues, 1u);
        EXPECT_EQ(stats.open_deleted_files, 1u);
        EXPECT_EQ(stats.closed_deleted_files, 1u);
        EXPECT_EQ(stats.partial_deleted_files, 2u);
        EXPECT_EQ(stats.partial_remaining_files, 2u);
    }

    TEST(CorrelationEngineTest, NoEventsGiveEmptyReport) {
        const auto report = classify({}, open_set({1, 2, 3}), {"tests/crashes/1.rs"});

        EXPECT_TRUE(report.issues.empty());
        EXPECT_EQ(report.statistics, AuditStatistics{});
    }

    TEST(CorrelationEngineTest, IsIdempotent) {
        const std::vector<DeletionEvent> events = {
            deletion("tests/crashes/12.rs", 12, "a"),
            deletion("tests/crashes/8-x.rs", 8, "b"),
            deletion("tests/crashes/8-y.rs", 8, "c"),
        };
        const std::vector<std::string> current = {"tests/crashes/8-z.rs"};
        const auto snapshot = open_set({12, 8});

        EXPECT_EQ(classify(events, snapshot, current), classify(events, snapshot, current));
    }

}  // namespace cta::analysis
