//
// Created by gregorian-rayne on 10/15/26.
//

#include "cta/cli/commands/support.hpp"

#include <cstdlib>

namespace cta::cli
{
    std::vector<ArgDef> tracker_arguments() {
        return {
            {"config", 'c', "TOML configuration file", false, true, "", "FILE"},
            {"github-token", 0, "GitHub access token (or set GITHUB_TOKEN)", false, true, "", "TOKEN"},
        };
    }

    Result<config::AuditConfig, Error> load_config(const ParsedArgs& args) {
        if (const auto path = args.get("config")) {
            return config::AuditConfig::load_from_file(*path);
        }

        if (std::error_code ec; fs::is_regular_file(config::DEFAULT_CONFIG_FILE, ec)) {
            return config::AuditConfig::load_from_file(config::DEFAULT_CONFIG_FILE);
        }

        return Result<config::AuditConfig, Error>::success(config::AuditConfig::default_config());
    }

    std::optional<std::string> resolve_token(const ParsedArgs& args) {
        if (auto token = args.get("github-token"); token && !token->empty()) {
            return token;
        }
        if (const char* env = std::getenv(TOKEN_ENV_VAR); env != nullptr && *env != '\0') {
            return std::string(env);
        }
        return std::nullopt;
    }

    tracker::GitHubTrackerOptions make_tracker_options(
        const config::AuditConfig& config,
        std::optional<std::string> token
    ) {
        tracker::GitHubTrackerOptions options;
        options.api_url = config.tracker.api_url;
        options.owner = config.tracker.owner;
        options.repo = config.tracker.repo;
        options.per_page = static_cast<unsigned>(config.tracker.per_page);
        options.timeout = std::chrono::seconds(config.tracker.timeout_seconds);
        options.token = std::move(token);
        return options;
    }

}  // namespace cta::cli
