//
// Created by gregorian-rayne on 10/9/26.
//

#include "cta/tracker/snapshot_cache.hpp"
#include "cta/utils/time_utils.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <fstream>

namespace cta::tracker
{
    class SnapshotCacheTest : public ::testing::Test {
    protected:
        void SetUp() override {
            temp_dir_ = fs::temp_directory_path() / "cta_snapshot_cache_test";
            fs::remove_all(temp_dir_);
        }

        void TearDown() override {
            fs::remove_all(temp_dir_);
        }

        void write_cache(const std::string& content) const {
            fs::create_directories(temp_dir_);
            std::ofstream out(cache_path());
            out << content;
        }

        [[nodiscard]] fs::path cache_path() const {
            return temp_dir_ / "open_issues.json";
        }

        fs::path temp_dir_;
    };

    TEST_F(SnapshotCacheTest, SaveCreatesDirectoryAndLoadsBack) {
        const Timestamp captured{std::chrono::seconds{1705314600}};
        const OpenIssueSnapshot snapshot({311, 100, 205}, captured);
        const SnapshotCache cache(cache_path());

        EXPECT_FALSE(cache.exists());
        ASSERT_TRUE(cache.save(snapshot).is_ok());
        EXPECT_TRUE(cache.exists());

        const auto loaded = cache.load();
        ASSERT_TRUE(loaded.is_ok()) << loaded.error().to_string();
        EXPECT_EQ(loaded.value().sorted_ids(), (std::vector<IssueId>{100, 205, 311}));
        EXPECT_EQ(loaded.value().captured_at(), captured);
    }

    TEST_F(SnapshotCacheTest, WritesDocumentedFormat) {
        const SnapshotCache cache(cache_path());
        ASSERT_TRUE(cache.save(OpenIssueSnapshot({3, 1, 2}, Timestamp{std::chrono::seconds{1705314600}})).is_ok());

        std::ifstream in(cache_path());
        const auto doc = nlohmann::json::parse(in);

        EXPECT_EQ(doc["timestamp"], "2024-01-15T10:30:00Z");
        EXPECT_EQ(doc["issue_count"], 3);
        EXPECT_EQ(doc["issue_numbers"], nlohmann::json::array({1, 2, 3}));
    }

    TEST_F(SnapshotCacheTest, LoadsCacheWithOffsetTimestamp) {
        write_cache(R"({"timestamp": "2024-01-15T12:30:00.5+02:00", "issue_count": 1, "issue_numbers": [7]})");

        const auto loaded = SnapshotCache(cache_path()).load();

        ASSERT_TRUE(loaded.is_ok()) << loaded.error().to_string();
        EXPECT_EQ(loaded.value().captured_at(), Timestamp{std::chrono::seconds{1705314600}});
        EXPECT_TRUE(loaded.value().contains(7));
    }

    TEST_F(SnapshotCacheTest, MissingFileIsNotFound) {
        const auto loaded = SnapshotCache(cache_path()).load();

        ASSERT_TRUE(loaded.is_err());
        EXPECT_EQ(loaded.error().code(), ErrorCode::NotFound);
    }

    TEST_F(SnapshotCacheTest, CountMismatchIsParseError) {
        write_cache(R"({"timestamp": "2024-01-15T10:30:00Z", "issue_count": 3, "issue_numbers": [1, 2]})");

        const auto loaded = SnapshotCache(cache_path()).load();

        ASSERT_TRUE(loaded.is_err());
        EXPECT_EQ(loaded.error().code(), ErrorCode::ParseError);
    }

    TEST_F(SnapshotCacheTest, RejectsMalformedDocuments) {
        const std::vector<std::string> documents = {
            "not json at all",
            "[1, 2, 3]",
            R"({"issue_count": 0, "issue_numbers": []})",
            R"({"timestamp": "yesterday", "issue_count": 0, "issue_numbers": []})",
            R"({"timestamp": "2024-01-15T10:30:00Z", "issue_numbers": []})",
            R"({"timestamp": "2024-01-15T10:30:00Z", "issue_count": 1, "issue_numbers": ["1"]})",
            R"({"timestamp": "2024-01-15T10:30:00Z", "issue_count": 1, "issue_numbers": 1})",
        };

        for (const auto& content : documents) {
            const auto decoded = decode_snapshot(content, "test");
            ASSERT_TRUE(decoded.is_err()) << content;
            EXPECT_EQ(decoded.error().code(), ErrorCode::ParseError) << content;
        }
    }

    TEST_F(SnapshotCacheTest, RemoveIsIdempotent) {
        const SnapshotCache cache(cache_path());
        ASSERT_TRUE(cache.save(OpenIssueSnapshot({1}, Timestamp{})).is_ok());

        EXPECT_TRUE(cache.remove().is_ok());
        EXPECT_FALSE(cache.exists());
        EXPECT_TRUE(cache.remove().is_ok());
    }

}  // namespace cta::tracker
