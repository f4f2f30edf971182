//
// Created by gregorian-rayne on 10/15/26.
//

#include "cta/cli/commands/command.hpp"
#include "cta/cli/commands/support.hpp"
#include "cta/cli/progress.hpp"
#include "cta/cli/formatter.hpp"

#include "cta/cta.hpp"

#include <iostream>
#include <optional>

namespace cta::cli
{
    namespace {

        std::optional<CalendarDate> parse_date_arg(const ParsedArgs& args, const std::string& name) {
            const auto text = args.get(name);
            if (!text) {
                return std::nullopt;
            }
            auto date = CalendarDate::parse(*text);
            if (date.is_err()) {
                return std::nullopt;
            }
            return date.value();
        }

        std::string describe_status(const IssueClassification& issue) {
            switch (issue.status) {
                case IssueStatus::FullyDeletedOpen:
                    return colorize("is still OPEN", colors::RED);
                case IssueStatus::FullyDeletedClosed:
                    return colorize("is closed", colors::GREEN);
                case IssueStatus::PartiallyDeleted:
                    return colorize("is partially cleaned (" + std::to_string(issue.remaining_count) +
                                    " remaining)", colors::YELLOW);
            }
            return "";
        }

    }  // namespace

    /**
     * Audit command - correlates deleted crash tests with open issues.
     */
    class AuditCommand final : public Command {
    public:
        [[nodiscard]] std::string_view name() const noexcept override {
            return "audit";
        }

        [[nodiscard]] std::string_view description() const noexcept override {
            return "Find crash tests that were deleted while their issue is still open";
        }

        [[nodiscard]] std::string usage() const override {
            return "Usage: cta [audit] <REPO_PATH> [OPTIONS]\n"
                   "\n"
                   "Examples:\n"
                   "  cta ~/src/rust\n"
                   "  cta audit ~/src/rust --from 2024-01-01 --to 2024-06-30\n"
                   "  cta ~/src/rust --refresh-cache --github-token $TOKEN\n"
                   "  cta ~/src/rust --json > audit.json";
        }

        [[nodiscard]] std::vector<ArgDef> arguments() const override {
            auto defs = std::vector<ArgDef>{
                {"from", 0, "Stop at commits before this date (inclusive start)", false, true, "", "YYYY-MM-DD"},
                {"to", 0, "Skip commits after this date (inclusive end)", false, true, "", "YYYY-MM-DD"},
                {"refresh-cache", 0, "Fetch open issues even if a cache exists", false, false, "", ""},
            };
            for (auto& def : tracker_arguments()) {
                defs.push_back(std::move(def));
            }
            return defs;
        }

        [[nodiscard]] std::string validate(const ParsedArgs& args) const override {
            if (args.positional().empty()) {
                return "No repository path specified";
            }
            if (args.positional().size() > 1) {
                return "Unexpected argument: " + args.positional()[1];
            }

            for (const std::string key : {"from", "to"}) {
                if (const auto text = args.get(key)) {
                    if (auto date = CalendarDate::parse(*text); date.is_err()) {
                        return "Invalid --" + key + " date '" + *text + "': " + date.error().message();
                    }
                }
            }

            const auto from = parse_date_arg(args, "from");
            const auto to = parse_date_arg(args, "to");
            if (from && to && *from > *to) {
                return "Start date must be before end date";
            }

            return "";
        }

        [[nodiscard]] int execute(const ParsedArgs& args) override {
            apply_common_options(args);

            auto cfg = load_config(args);
            if (cfg.is_err()) {
                print_error(cfg.error().to_string());
                return EXIT_ERROR;
            }
            const auto& config = cfg.value();
            print_debug("Effective configuration:\n" + config.to_string());

            const fs::path repo_path = args.positional()[0];
            if (std::error_code ec; !fs::exists(repo_path, ec)) {
                print_error(Error::config_error("Repository path does not exist", repo_path.string()).to_string());
                return EXIT_ERROR;
            }
            if (std::error_code ec; !fs::is_directory(repo_path, ec)) {
                print_error(Error::config_error("Repository path is not a directory", repo_path.string()).to_string());
                return EXIT_ERROR;
            }

            git::ScanOptions options;
            options.pathspec = config.pathspec();
            options.from_date = parse_date_arg(args, "from");
            options.to_date = parse_date_arg(args, "to");

            print("Scanning " + repo_path.string() + " (" + options.pathspec + ")...");
            if (options.from_date) {
                print("Date range: " + options.from_date->to_string() + " to " +
                      (options.to_date ? options.to_date->to_string() : std::string("present")));
            }
            print("");

            auto scan = run_scan(repo_path, options);
            if (scan.is_err()) {
                print_error(scan.error().to_string());
                return EXIT_ERROR;
            }
            const auto& scanned = scan.value();

            print("Found " + format_count(scanned.events.size()) + " deleted crash test files");
            print("");

            report::ReportContext context;
            context.owner = config.tracker.owner;
            context.repo = config.tracker.repo;
            context.web_url = config.tracker.web_url;
            context.use_color = !is_json() && colors::enabled();

            if (scanned.events.empty()) {
                print("No deleted crash test files found in the specified range.");
                if (is_json()) {
                    std::cout << report::render_json_report(AuditReport{}, context) << "\n";
                }
                return EXIT_OK;
            }

            const tracker::GitHubIssueTracker tracker(make_tracker_options(config, resolve_token(args)));
            if (!tracker.authenticated()) {
                print_verbose("Note: Using unauthenticated API (60 requests/hour limit)");
                print_verbose(std::string("Set ") + TOKEN_ENV_VAR +
                              " for higher limits (5,000 requests/hour)");
                print_verbose("");
            }

            auto lease = fetch_snapshot(tracker, config, args.get_flag("refresh-cache"));
            if (lease.is_err()) {
                print_error(lease.error().to_string());
                return EXIT_ERROR;
            }
            const auto& snapshot = lease.value().snapshot;
            context.open_issue_total = snapshot.size();

            if (lease.value().source == tracker::SnapshotSource::Cache) {
                print("Using cached data (updated " + time_utils::format_age(lease.value().age) + " ago)");
                print("Use --refresh-cache to update");
            } else {
                print("Cached " + format_count(snapshot.size()) + " open issues");
            }
            print("");

            auto current = git::list_current_files(repo_path, config.repository.crash_dir,
                                                   config.repository.file_pattern);
            if (current.is_err()) {
                print_error(current.error().to_string());
                return EXIT_ERROR;
            }
            print_verbose(format_count(current.value().size()) + " crash test files still present");

            const AuditReport report = analysis::classify(scanned.events, snapshot, current.value());

            print("Checking deleted files against open issues...");
            for (const auto& [id, issue] : report.issues) {
                print_verbose("  Issue #" + std::to_string(id) + " " + describe_status(issue));
            }
            print("");

            if (is_json()) {
                std::cout << report::render_json_report(report, context) << "\n";
            } else if (!is_quiet()) {
                report::render_text_report(report, context, std::cout);
            }

            return EXIT_OK;
        }

    private:
        Result<git::ScanResult, Error> run_scan(const fs::path& repo_path, const git::ScanOptions& options) const {
            Spinner spinner("Scanning first-parent history", !is_quiet());

            auto scan = git::scan_deletions(repo_path, options, [&](const std::size_t commits) {
                spinner.set_message("Examined " + format_count(commits) + " deletion commits...");
                spinner.tick();
            });

            if (scan.is_err()) {
                spinner.fail("Failed");
                return scan;
            }

            spinner.stop();
            const auto& result = scan.value();
            print_verbose("Examined " + format_count(result.deletion_commits) +
                          " commits that delete crash tests");
            if (result.stopped_at_date_boundary) {
                print_verbose("Stopped at the --from date boundary");
            }
            return scan;
        }

        Result<tracker::SnapshotLease, Error> fetch_snapshot(
            const tracker::IIssueTracker& tracker,
            const config::AuditConfig& config,
            const bool refresh
        ) const {
            tracker::SnapshotProvider provider(tracker, tracker::SnapshotCache(config.cache_path()));

            provider.set_warning_handler([this](const Error& error) {
                print_warning("Ignoring unreadable cache: " + error.to_string());
            });

            // Created on the first page so that a cache hit prints nothing.
            std::optional<Spinner> spinner;
            provider.set_page_progress([&](const tracker::PageProgress& p) {
                if (!spinner) {
                    print_verbose("Fetching open issues from " + tracker.describe() + "...");
                    spinner.emplace("Fetching open issues from " + tracker.describe(),
                                    !is_quiet() && !is_verbose());
                }
                print_verbose("  Fetched page " + std::to_string(p.page) + " (" +
                              std::to_string(p.page_items) + " issues, " +
                              format_count(p.total_so_far) + " total so far)");
                spinner->set_message("Fetched " + format_count(p.total_so_far) + " open issues");
                spinner->tick();
            });

            if (refresh) {
                print_verbose("Refreshing cache...");
            }

            auto lease = provider.get_snapshot(refresh);
            if (spinner) {
                if (lease.is_err()) {
                    spinner->fail("Failed");
                } else {
                    spinner->stop();
                }
            }
            return lease;
        }
    };

    namespace {
        struct AuditCommandRegistrar {
            AuditCommandRegistrar() {
                CommandRegistry::instance().register_command(
                    std::make_unique<AuditCommand>()
                );
            }
        } audit_registrar;
    }

}  // namespace cta::cli
