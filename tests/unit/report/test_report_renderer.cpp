//
// Created by gregorian-rayne on 10/11/26.
//

#include "cta/report/report_renderer.hpp"
#include "cta/analysis/correlation_engine.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <sstream>

namespace cta::report
{
    class ReportRendererTest : public ::testing::Test {
    protected:
        void SetUp() override {
            DeletionEvent open_event;
            open_event.file_path = "tests/crashes/100.rs";
            open_event.issue_id = 100;
            open_event.commit_hash = "abcdef0123456789abcdef0123456789abcdef01";
            open_event.commit_date = CalendarDate::from_ymd(2024, 2, 10);
            open_event.pr_id = 555;

            DeletionEvent partial_event;
            partial_event.file_path = "tests/crashes/200-foo.rs";
            partial_event.issue_id = 200;
            partial_event.commit_hash = "1234567890abcdef1234567890abcdef12345678";
            partial_event.commit_date = CalendarDate::from_ymd(2024, 3, 10);

            DeletionEvent closed_event = partial_event;
            closed_event.file_path = "tests/crashes/300.rs";
            closed_event.issue_id = 300;

            report_ = analysis::classify(
                {open_event, partial_event, closed_event},
                tracker::OpenIssueSnapshot({100, 4242}, Timestamp{}),
                {"tests/crashes/200-bar.rs"}
            );

            context_.open_issue_total = 2;
        }

        [[nodiscard]] std::string text() const {
            std::ostringstream out;
            render_text_report(report_, context_, out);
            return out.str();
        }

        AuditReport report_;
        ReportContext context_;
    };

    TEST(ReportContextTest, IssueUrl) {
        ReportContext context;
        EXPECT_EQ(context.issue_url(123), "https://github.com/rust-lang/rust/issues/123");

        context.web_url = "https://github.example.com/";
        context.owner = "acme";
        context.repo = "compiler";
        EXPECT_EQ(context.issue_url(9), "https://github.example.com/acme/compiler/issues/9");
        EXPECT_EQ(context.tracker_name(), "acme/compiler");
    }

    TEST(FormatShareTest, OneDecimal) {
        EXPECT_EQ(format_share(1, 2), "50.0");
        EXPECT_EQ(format_share(1, 3), "33.3");
        EXPECT_EQ(format_share(2, 3), "66.7");
        EXPECT_EQ(format_share(3, 3), "100.0");
        EXPECT_EQ(format_share(0, 0), "0.0");
    }

    TEST_F(ReportRendererTest, ListsOutOfSyncIssues) {
        const std::string out = text();

        EXPECT_NE(out.find("Out-of-sync issues (test deleted but issue still open):"), std::string::npos);
        EXPECT_NE(out.find("  • Issue #100: tests/crashes/100.rs deleted in abcdef01 (2024-02-10) via #555"),
                  std::string::npos);
        EXPECT_NE(out.find("    https://github.com/rust-lang/rust/issues/100"), std::string::npos);
    }

    TEST_F(ReportRendererTest, ListsPartiallyCleanedIssues) {
        const std::string out = text();

        EXPECT_NE(out.find("Partially cleaned issues (some crash tests remain):"), std::string::npos);
        EXPECT_NE(out.find("  • Issue #200: 1 deleted, 1 remaining"), std::string::npos);
        EXPECT_NE(out.find("tests/crashes/200-foo.rs deleted in 12345678 (2024-03-10)\n"), std::string::npos);
    }

    TEST_F(ReportRendererTest, ClosedIssuesAreOnlyCounted) {
        const std::string out = text();

        EXPECT_EQ(out.find("Issue #300"), std::string::npos);
        EXPECT_NE(out.find("  Issues properly closed: 1 (33.3%)"), std::string::npos);
    }

    TEST_F(ReportRendererTest, Summary) {
        const std::string out = text();

        EXPECT_NE(out.find("Summary:"), std::string::npos);
        EXPECT_NE(out.find("  Total deleted tests: 3"), std::string::npos);
        EXPECT_NE(out.find("  Total tracked issues: 3"), std::string::npos);
        EXPECT_NE(out.find("  Total open issues in rust-lang/rust: 2"), std::string::npos);
        EXPECT_NE(out.find("  Issues still open: 1 (33.3%)"), std::string::npos);
        EXPECT_NE(out.find("  Issues partially cleaned: 1 (33.3%), 1 test(s) remaining"), std::string::npos);
    }

    TEST_F(ReportRendererTest, RecommendsActionWhenOutOfSync) {
        const std::string out = text();

        EXPECT_NE(out.find("Found 1 out-of-sync issue(s) that need attention."), std::string::npos);
        EXPECT_NE(out.find("  1. Be reopened (if the crash test was removed by mistake)"), std::string::npos);
        EXPECT_NE(out.find("  2. Be closed (if the issue is actually fixed)"), std::string::npos);
    }

    TEST_F(ReportRendererTest, AllClearMessage) {
        report_ = analysis::classify(report_.issues.at(300).events, tracker::OpenIssueSnapshot(), {});

        const std::string out = text();

        EXPECT_EQ(out.find("Out-of-sync issues"), std::string::npos);
        EXPECT_EQ(out.find("Partially cleaned issues"), std::string::npos);
        EXPECT_NE(out.find("All deleted crash tests have properly closed issues!"), std::string::npos);
        EXPECT_NE(out.find("  Issues properly closed: 1 (100.0%)"), std::string::npos);
    }

    TEST_F(ReportRendererTest, NoColorWithoutRequest) {
        EXPECT_EQ(text().find('\033'), std::string::npos);

        context_.use_color = true;
        EXPECT_NE(text().find("\033[31m"), std::string::npos);
    }

    TEST_F(ReportRendererTest, JsonDocument) {
        const auto doc = nlohmann::json::parse(render_json_report(report_, context_));

        EXPECT_EQ(doc["tool"]["name"], "cta");
        EXPECT_EQ(doc["tracker"], "rust-lang/rust");
        EXPECT_EQ(doc["open_issue_total"], 2);

        const auto& issues = doc["issues"];
        ASSERT_EQ(issues.size(), 3u);
        EXPECT_EQ(issues[0]["issue"], 100);
        EXPECT_EQ(issues[0]["status"], "fully-deleted-open");
        EXPECT_EQ(issues[0]["url"], "https://github.com/rust-lang/rust/issues/100");
        EXPECT_EQ(issues[0]["deleted_files"][0]["pr"], 555);
        EXPECT_EQ(issues[0]["deleted_files"][0]["date"], "2024-02-10");
        EXPECT_EQ(issues[0]["deleted_files"][0]["commit"], "abcdef0123456789abcdef0123456789abcdef01");

        EXPECT_EQ(issues[1]["issue"], 200);
        EXPECT_EQ(issues[1]["status"], "partially-deleted");
        EXPECT_EQ(issues[1]["remaining_count"], 1);
        EXPECT_TRUE(issues[1]["deleted_files"][0]["pr"].is_null());

        EXPECT_EQ(issues[2]["status"], "fully-deleted-closed");

        EXPECT_EQ(doc["statistics"]["total_issues"], 3);
        EXPECT_EQ(doc["statistics"]["open_issues"], 1);
        EXPECT_EQ(doc["statistics"]["partial_remaining_files"], 1);
    }

    TEST_F(ReportRendererTest, JsonOfEmptyReport) {
        const auto doc = nlohmann::json::parse(render_json_report(AuditReport{}, context_));

        EXPECT_TRUE(doc["issues"].is_array());
        EXPECT_TRUE(doc["issues"].empty());
        EXPECT_EQ(doc["statistics"]["total_issues"], 0);
    }

}  // namespace cta::report
