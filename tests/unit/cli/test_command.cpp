//
// Created by gregorian-rayne on 10/14/26.
//

#include "cta/cli/commands/command.hpp"
#include "cta/cli/commands/support.hpp"
#include "cta/cli/formatter.hpp"
#include "cta/tracker/snapshot_cache.hpp"
#include "support/temp_repository.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <fstream>

namespace cta::cli
{
    using cta::testing::TempRepository;

    namespace {

        std::vector<ArgDef> sample_defs() {
            return {
                {"from", 0, "Start date", false, true, "", "DATE"},
                {"config", 'c', "Config file", false, true, "", "FILE"},
                {"refresh-cache", 0, "Refresh", false, false, "", ""},
                {"per-page", 'p', "Page size", false, true, "100", "N"},
            };
        }

    }  // namespace

    // =============================================================================
    // Argument Parsing
    // =============================================================================

    TEST(ParseArgumentsTest, LongOptionsAndPositionals) {
        const auto result = parse_arguments(
            {"/src/rust", "--from", "2024-01-01", "--refresh-cache", "--config=ci.toml"}, sample_defs()
        );

        ASSERT_TRUE(result.success) << result.error;
        EXPECT_EQ(result.args.positional(), (std::vector<std::string>{"/src/rust"}));
        EXPECT_EQ(result.args.get("from"), "2024-01-01");
        EXPECT_EQ(result.args.get("config"), "ci.toml");
        EXPECT_TRUE(result.args.get_flag("refresh-cache"));
    }

    TEST(ParseArgumentsTest, ShortOptions) {
        const auto result = parse_arguments({"-c", "a.toml", "-p50", "-vq"}, sample_defs());

        ASSERT_TRUE(result.success) << result.error;
        EXPECT_EQ(result.args.get("config"), "a.toml");
        EXPECT_EQ(result.args.get("per-page"), "50");
        EXPECT_TRUE(result.args.get_flag("verbose"));
        EXPECT_TRUE(result.args.get_flag("quiet"));
    }

    TEST(ParseArgumentsTest, DefaultsApply) {
        const auto result = parse_arguments({}, sample_defs());

        ASSERT_TRUE(result.success);
        EXPECT_EQ(result.args.get_or("per-page", "0"), "100");
        EXPECT_FALSE(result.args.get("from").has_value());
        EXPECT_EQ(result.args.get_or("from", "none"), "none");
    }

    TEST(ParseArgumentsTest, CommonFlags) {
        const auto result = parse_arguments({"--json", "--debug", "--help"}, sample_defs());

        ASSERT_TRUE(result.success);
        EXPECT_TRUE(result.args.get_flag("json"));
        EXPECT_TRUE(result.args.get_flag("debug"));
        EXPECT_TRUE(result.args.get_flag("help"));
    }

    TEST(ParseArgumentsTest, DoubleDashEndsOptions) {
        const auto result = parse_arguments({"--", "--from"}, sample_defs());

        ASSERT_TRUE(result.success);
        EXPECT_EQ(result.args.positional(), (std::vector<std::string>{"--from"}));
        EXPECT_FALSE(result.args.has("from"));
    }

    TEST(ParseArgumentsTest, Errors) {
        EXPECT_FALSE(parse_arguments({"--unknown"}, sample_defs()).success);
        EXPECT_FALSE(parse_arguments({"-x"}, sample_defs()).success);
        EXPECT_FALSE(parse_arguments({"--from"}, sample_defs()).success);
        EXPECT_FALSE(parse_arguments({"--refresh-cache=yes"}, sample_defs()).success);

        const auto missing = parse_arguments({"--from"}, sample_defs());
        EXPECT_EQ(missing.error, "Option --from requires a value");
    }

    // =============================================================================
    // Registry
    // =============================================================================

    TEST(CommandRegistryTest, BuiltInCommandsAreRegistered) {
        const auto& registry = CommandRegistry::instance();

        ASSERT_NE(registry.find("audit"), nullptr);
        ASSERT_NE(registry.find("cache"), nullptr);
        EXPECT_EQ(registry.find("analyze"), nullptr);

        const auto commands = registry.list();
        ASSERT_EQ(commands.size(), 2u);
        EXPECT_EQ(commands[0]->name(), "audit");
        EXPECT_EQ(commands[1]->name(), "cache");
    }

    // =============================================================================
    // Support
    // =============================================================================

    TEST(CommandSupportTest, TokenFromFlagWinsOverEnvironment) {
        ::setenv(TOKEN_ENV_VAR, "from-env", 1);

        auto parsed = parse_arguments({"--github-token", "from-flag"}, tracker_arguments());
        ASSERT_TRUE(parsed.success);
        EXPECT_EQ(resolve_token(parsed.args), "from-flag");

        parsed = parse_arguments({}, tracker_arguments());
        EXPECT_EQ(resolve_token(parsed.args), "from-env");

        ::setenv(TOKEN_ENV_VAR, "", 1);
        EXPECT_FALSE(resolve_token(parsed.args).has_value());
        ::unsetenv(TOKEN_ENV_VAR);
    }

    TEST(CommandSupportTest, TrackerOptionsFollowConfig) {
        auto config = config::AuditConfig::default_config();
        config.tracker.owner = "acme";
        config.tracker.per_page = 25;
        config.tracker.timeout_seconds = 7;

        const auto options = make_tracker_options(config, std::string("tok"));

        EXPECT_EQ(options.owner, "acme");
        EXPECT_EQ(options.per_page, 25u);
        EXPECT_EQ(options.timeout, std::chrono::seconds{7});
        EXPECT_EQ(options.token, "tok");
    }

    TEST(FormatterTest, FormatCount) {
        EXPECT_EQ(format_count(7), "7");
        EXPECT_EQ(format_count(1234), "1,234");
        EXPECT_EQ(format_count(1234567), "1,234,567");
    }

    // =============================================================================
    // Running Commands
    // =============================================================================

    class RunCommandTest : public ::testing::Test {
    protected:
        void SetUp() override {
            colors::set_enabled(false);
            repo_ = std::make_unique<TempRepository>("cli");
            repo_->write("tests/crashes/100.rs");
            repo_->write("tests/crashes/200-foo.rs");
            repo_->write("tests/crashes/200-bar.rs");
            repo_->commit("initial import", cta::testing::JAN_10);

            config_path_ = repo_->path().parent_path() / ("cta_cli_config_" + std::to_string(::getpid()) + ".toml");
            cache_dir_ = repo_->path().parent_path() / ("cta_cli_cache_" + std::to_string(::getpid()));
            std::ofstream(config_path_) << "[cache]\ndirectory = \"" << cache_dir_.string() << "\"\n";
        }

        void TearDown() override {
            fs::remove(config_path_);
            fs::remove_all(cache_dir_);
        }

        [[nodiscard]] static Command& audit() {
            return *CommandRegistry::instance().find("audit");
        }

        [[nodiscard]] static Command& cache() {
            return *CommandRegistry::instance().find("cache");
        }

        std::unique_ptr<TempRepository> repo_;
        fs::path config_path_;
        fs::path cache_dir_;
    };

    TEST_F(RunCommandTest, UsageErrors) {
        EXPECT_EQ(run_command(audit(), {}), EXIT_USAGE);
        EXPECT_EQ(run_command(audit(), {"a", "b"}), EXIT_USAGE);
        EXPECT_EQ(run_command(audit(), {repo_->path().string(), "--from", "2024-02-30"}), EXIT_USAGE);
        EXPECT_EQ(run_command(audit(), {repo_->path().string(), "--to", "soon"}), EXIT_USAGE);
        EXPECT_EQ(run_command(audit(), {repo_->path().string(), "--from", "2024-03-01", "--to", "2024-02-01"}),
                  EXIT_USAGE);
        EXPECT_EQ(run_command(audit(), {repo_->path().string(), "--bogus"}), EXIT_USAGE);
        EXPECT_EQ(run_command(cache(), {}), EXIT_USAGE);
        EXPECT_EQ(run_command(cache(), {"purge"}), EXIT_USAGE);
    }

    TEST_F(RunCommandTest, HelpSucceeds) {
        ::testing::internal::CaptureStdout();
        const int code = run_command(audit(), {"--help"});
        const std::string out = ::testing::internal::GetCapturedStdout();

        EXPECT_EQ(code, EXIT_OK);
        EXPECT_NE(out.find("--refresh-cache"), std::string::npos);
        EXPECT_NE(out.find("--github-token"), std::string::npos);
    }

    TEST_F(RunCommandTest, MissingRepositoryPathFails) {
        EXPECT_EQ(run_command(audit(), {"/nonexistent/cta/repo", "-q", "--config", config_path_.string()}),
                  EXIT_ERROR);
    }

    TEST_F(RunCommandTest, NonRepositoryFails) {
        const fs::path plain = cache_dir_ / "plain";
        fs::create_directories(plain);

        EXPECT_EQ(run_command(audit(), {plain.string(), "-q", "--config", config_path_.string()}), EXIT_ERROR);
    }

    TEST_F(RunCommandTest, NoDeletionsNeedsNoTracker) {
        ::testing::internal::CaptureStdout();
        const int code = run_command(audit(), {repo_->path().string(), "--config", config_path_.string()});
        const std::string out = ::testing::internal::GetCapturedStdout();

        EXPECT_EQ(code, EXIT_OK);
        EXPECT_NE(out.find("No deleted crash test files found in the specified range."), std::string::npos);
        EXPECT_FALSE(fs::exists(cache_dir_ / "open_issues.json"));
    }

    TEST_F(RunCommandTest, AuditUsesCachedSnapshot) {
        repo_->remove("tests/crashes/100.rs");
        repo_->remove("tests/crashes/200-foo.rs");
        repo_->commit("Auto merge of #555 - a:b, r=c", cta::testing::FEB_10);

        const tracker::SnapshotCache snapshot_cache(cache_dir_ / "open_issues.json");
        ASSERT_TRUE(snapshot_cache.save(tracker::OpenIssueSnapshot({100}, std::chrono::system_clock::now())).is_ok());

        ::testing::internal::CaptureStdout();
        const int code = run_command(audit(), {repo_->path().string(), "--config", config_path_.string()});
        const std::string out = ::testing::internal::GetCapturedStdout();

        EXPECT_EQ(code, EXIT_OK);
        EXPECT_NE(out.find("Found 2 deleted crash test files"), std::string::npos);
        EXPECT_NE(out.find("Using cached data"), std::string::npos);
        EXPECT_NE(out.find("Issue #100: tests/crashes/100.rs deleted in"), std::string::npos);
        EXPECT_NE(out.find("Issue #200: 1 deleted, 1 remaining"), std::string::npos);
        EXPECT_NE(out.find("Found 1 out-of-sync issue(s) that need attention."), std::string::npos);
    }

    TEST_F(RunCommandTest, AuditJsonKeepsStdoutClean) {
        repo_->remove("tests/crashes/100.rs");
        repo_->commit("remove 100", cta::testing::FEB_10);

        const tracker::SnapshotCache snapshot_cache(cache_dir_ / "open_issues.json");
        ASSERT_TRUE(snapshot_cache.save(tracker::OpenIssueSnapshot({}, std::chrono::system_clock::now())).is_ok());

        ::testing::internal::CaptureStdout();
        const int code = run_command(audit(), {repo_->path().string(), "--json", "--config", config_path_.string()});
        const std::string out = ::testing::internal::GetCapturedStdout();

        ASSERT_EQ(code, EXIT_OK);
        const auto doc = nlohmann::json::parse(out);
        ASSERT_EQ(doc["issues"].size(), 1u);
        EXPECT_EQ(doc["issues"][0]["status"], "fully-deleted-closed");
    }

    TEST_F(RunCommandTest, CacheStatusAndClear) {
        const tracker::SnapshotCache snapshot_cache(cache_dir_ / "open_issues.json");
        ASSERT_TRUE(snapshot_cache.save(tracker::OpenIssueSnapshot({1, 2, 3}, std::chrono::system_clock::now())).is_ok());

        ::testing::internal::CaptureStdout();
        const int status = run_command(cache(), {"status", "--json", "--config", config_path_.string()});
        const auto doc = nlohmann::json::parse(::testing::internal::GetCapturedStdout());

        EXPECT_EQ(status, EXIT_OK);
        EXPECT_EQ(doc["exists"], true);
        EXPECT_EQ(doc["issue_count"], 3);

        EXPECT_EQ(run_command(cache(), {"clear", "-q", "--config", config_path_.string()}), EXIT_OK);
        EXPECT_FALSE(snapshot_cache.exists());
        EXPECT_EQ(run_command(cache(), {"clear", "-q", "--config", config_path_.string()}), EXIT_OK);
    }

}  // namespace cta::cli
