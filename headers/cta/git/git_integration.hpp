//
// Created by gregorian-rayne on 10/5/26.
//

#ifndef CTA_GIT_INTEGRATION_HPP
#define CTA_GIT_INTEGRATION_HPP

/**
 * @file git_integration.hpp
 * @brief Read-only access to a git repository through the git executable.
 *
 * Provides:
 * - Buffered execution of git commands with a timeout
 * - Streamed execution, where the caller may stop the command early
 * - Repository probing (is it a work tree, where is its root, what is HEAD)
 *
 * Arguments are passed to git directly (no shell), so pathspecs containing
 * glob characters reach git unexpanded.
 */

#include "cta/result.hpp"
#include "cta/error.hpp"
#include "cta/types.hpp"

#include <chrono>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace cta::git
{
    /**
     * Command execution result.
     */
    struct CommandResult {
        int exit_code = 0;
        std::string stdout_output;    // empty for streamed commands
        std::string stderr_output;
        Duration execution_time = Duration::zero();
        bool stopped_by_caller = false;
    };

    /**
     * Receives stdout chunks of a streamed command. Returning false stops
     * the command: the process is terminated and reaped.
     */
    using OutputHandler = std::function<bool(std::string_view chunk)>;

    /**
     * Sentinel timeout meaning "wait as long as the command runs".
     */
    inline constexpr Duration NO_TIMEOUT = Duration::zero();

    /**
     * Executes a git command and buffers its output.
     *
     * @param args Command arguments (without "git" prefix).
     * @param working_dir Working directory for the command.
     * @param timeout Maximum execution time, or NO_TIMEOUT.
     * @return The command result; a non-zero exit code is not an error here.
     */
    [[nodiscard]] Result<CommandResult, Error> execute_git(
        const std::vector<std::string>& args,
        const fs::path& working_dir,
        Duration timeout = std::chrono::seconds(30)
    );

    /**
     * Executes a git command, handing stdout to @p on_output as it arrives.
     *
     * @return The command result with stdout_output left empty.
     */
    [[nodiscard]] Result<CommandResult, Error> stream_git(
        const std::vector<std::string>& args,
        const fs::path& working_dir,
        const OutputHandler& on_output,
        Duration timeout = NO_TIMEOUT
    );

    /**
     * Checks if a directory is inside a git work tree.
     */
    [[nodiscard]] bool is_git_repository(const fs::path& dir);

    /**
     * Gets the top-level directory of the work tree containing @p dir.
     */
    [[nodiscard]] Result<fs::path, Error> get_repository_root(const fs::path& dir);

    /**
     * Resolves HEAD to a full commit hash.
     *
     * Fails with RepositoryError for an unborn branch.
     */
    [[nodiscard]] Result<std::string, Error> get_head(const fs::path& repo_dir);

    /**
     * Opens a repository for reading: checks the path is a git work tree
     * and resolves its tip. Returns the tip commit hash.
     */
    [[nodiscard]] Result<std::string, Error> open_repository(const fs::path& repo_dir);

}  // namespace cta::git

#endif //CTA_GIT_INTEGRATION_HPP
