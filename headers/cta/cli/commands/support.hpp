//
// Created by gregorian-rayne on 10/15/26.
//

#ifndef CTA_COMMAND_SUPPORT_HPP
#define CTA_COMMAND_SUPPORT_HPP

/**
 * @file support.hpp
 * @brief Pieces shared by the commands that talk to the tracker.
 */

#include "cta/cli/commands/command.hpp"
#include "cta/config/config.hpp"
#include "cta/tracker/issue_tracker.hpp"
#include "cta/result.hpp"

#include <optional>
#include <string>
#include <vector>

namespace cta::cli
{
    /**
     * Environment variable consulted when --github-token is absent.
     */
    inline constexpr auto TOKEN_ENV_VAR = "GITHUB_TOKEN";

    /**
     * --config and --github-token definitions.
     */
    [[nodiscard]] std::vector<ArgDef> tracker_arguments();

    /**
     * Loads --config if given, else DEFAULT_CONFIG_FILE when present in the
     * working directory, else the defaults.
     */
    [[nodiscard]] Result<config::AuditConfig, Error> load_config(const ParsedArgs& args);

    /**
     * --github-token, else the GITHUB_TOKEN environment variable. Empty
     * values count as absent.
     */
    [[nodiscard]] std::optional<std::string> resolve_token(const ParsedArgs& args);

    [[nodiscard]] tracker::GitHubTrackerOptions make_tracker_options(
        const config::AuditConfig& config,
        std::optional<std::string> token
    );

}  // namespace cta::cli

#endif //CTA_COMMAND_SUPPORT_HPP
