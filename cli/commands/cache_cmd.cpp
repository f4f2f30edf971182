//
// Created by gregorian-rayne on 10/16/26.
//

#include "cta/cli/commands/command.hpp"
#include "cta/cli/commands/support.hpp"
#include "cta/cli/progress.hpp"
#include "cta/cli/formatter.hpp"

#include "cta/cta.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <iostream>
#include <optional>

namespace cta::cli
{
    /**
     * Cache command - inspects and maintains the open issue snapshot cache.
     */
    class CacheCommand final : public Command {
    public:
        [[nodiscard]] std::string_view name() const noexcept override {
            return "cache";
        }

        [[nodiscard]] std::string_view description() const noexcept override {
            return "Inspect, refresh or clear the cached open issue snapshot";
        }

        [[nodiscard]] std::string usage() const override {
            return "Usage: cta cache <subcommand> [OPTIONS]\n"
                   "\n"
                   "Subcommands:\n"
                   "  status     Show the cache location, size and age\n"
                   "  refresh    Fetch open issues and rewrite the cache\n"
                   "  clear      Delete the cache file\n"
                   "\n"
                   "Examples:\n"
                   "  cta cache status\n"
                   "  cta cache refresh --github-token $TOKEN\n"
                   "  cta cache clear --config ci.toml";
        }

        [[nodiscard]] std::vector<ArgDef> arguments() const override {
            return tracker_arguments();
        }

        [[nodiscard]] std::string validate(const ParsedArgs& args) const override {
            if (args.positional().empty()) {
                return "No subcommand specified. Use 'cta cache status|refresh|clear'";
            }

            const std::string& subcommand = args.positional()[0];
            if (subcommand != "status" && subcommand != "refresh" && subcommand != "clear") {
                return "Unknown subcommand: " + subcommand;
            }

            if (args.positional().size() > 1) {
                return "Unexpected argument: " + args.positional()[1];
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

            const std::string& subcommand = args.positional()[0];
            const tracker::SnapshotCache cache(cfg.value().cache_path());

            if (subcommand == "status") {
                return cmd_status(cache);
            }
            if (subcommand == "refresh") {
                return cmd_refresh(cfg.value(), cache, resolve_token(args));
            }
            return cmd_clear(cache);
        }

    private:
        int cmd_status(const tracker::SnapshotCache& cache) const {
            if (!cache.exists()) {
                if (is_json()) {
                    nlohmann::json doc;
                    doc["path"] = cache.path().string();
                    doc["exists"] = false;
                    std::cout << doc.dump(2) << "\n";
                } else {
                    print("No cache at " + cache.path().string());
                }
                return EXIT_OK;
            }

            auto snapshot = cache.load();
            if (snapshot.is_err()) {
                print_error(snapshot.error().to_string());
                return EXIT_ERROR;
            }

            const auto& snap = snapshot.value();
            const Duration age = snap.age(std::chrono::system_clock::now());

            if (is_json()) {
                nlohmann::json doc;
                doc["path"] = cache.path().string();
                doc["exists"] = true;
                doc["issue_count"] = snap.size();
                doc["timestamp"] = time_utils::format_rfc3339(snap.captured_at());
                doc["age_seconds"] = std::max<long long>(
                    0, std::chrono::duration_cast<std::chrono::seconds>(age).count()
                );
                std::cout << doc.dump(2) << "\n";
                return EXIT_OK;
            }

            print(colorize("Cache: ", colors::BOLD) + cache.path().string());
            print("  Open issues: " + format_count(snap.size()));
            print("  Updated:     " + format_timestamp(snap.captured_at()) +
                  " (" + time_utils::format_age(age) + " ago)");
            return EXIT_OK;
        }

        int cmd_refresh(
            const config::AuditConfig& config,
            const tracker::SnapshotCache& cache,
            std::optional<std::string> token
        ) const {
            const tracker::GitHubIssueTracker tracker(make_tracker_options(config, std::move(token)));
            if (!tracker.authenticated()) {
                print_verbose("Note: Using unauthenticated API (60 requests/hour limit)");
            }

            const tracker::SnapshotProvider provider(tracker, cache);

            auto lease = [&] {
                Spinner spinner("Fetching open issues from " + tracker.describe(), !is_quiet() && !is_json());
                auto result = provider.get_snapshot(true);
                if (result.is_err()) {
                    spinner.fail("Failed");
                } else {
                    spinner.success(format_count(result.value().snapshot.size()) + " open issues");
                }
                return result;
            }();

            if (lease.is_err()) {
                print_error(lease.error().to_string());
                return EXIT_ERROR;
            }

            print("Cached " + format_count(lease.value().snapshot.size()) + " open issues in " +
                  cache.path().string());
            return EXIT_OK;
        }

        int cmd_clear(const tracker::SnapshotCache& cache) const {
            if (!cache.exists()) {
                print("No cache at " + cache.path().string());
                return EXIT_OK;
            }

            if (auto removed = cache.remove(); removed.is_err()) {
                print_error(removed.error().to_string());
                return EXIT_ERROR;
            }

            print("Removed " + cache.path().string());
            return EXIT_OK;
        }
    };

    namespace {
        struct CacheCommandRegistrar {
            CacheCommandRegistrar() {
                CommandRegistry::instance().register_command(
                    std::make_unique<CacheCommand>()
                );
            }
        } cache_registrar;
    }

}  // namespace cta::cli
