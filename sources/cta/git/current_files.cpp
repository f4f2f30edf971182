//
// Created by gregorian-rayne on 10/7/26.
//

#include "cta/git/current_files.hpp"
#include "cta/git/git_integration.hpp"
#include "cta/utils/string_utils.hpp"

#include <algorithm>

#include <fnmatch.h>

namespace cta::git
{
    bool matches_pattern(const std::string_view relative_path, const std::string_view file_pattern) {
        const std::string path(relative_path);
        const std::string pattern(file_pattern);
        return ::fnmatch(pattern.c_str(), path.c_str(), 0) == 0;
    }

    Result<std::vector<std::string>, Error> list_current_files(
        const fs::path& repo_path,
        const std::string_view crash_dir,
        const std::string_view file_pattern
    ) {
        auto head = open_repository(repo_path);
        if (head.is_err()) {
            return Result<std::vector<std::string>, Error>::failure(head.error());
        }

        std::string prefix(string_utils::trim_right(crash_dir));
        while (!prefix.empty() && prefix.back() == '/') {
            prefix.pop_back();
        }
        prefix += '/';

        auto result = execute_git(
            {"ls-tree", "-r", "--name-only", "-z", "--full-tree", head.value(), "--", prefix},
            repo_path,
            NO_TIMEOUT
        );

        if (result.is_err()) {
            return Result<std::vector<std::string>, Error>::failure(result.error());
        }

        if (result.value().exit_code != 0) {
            return Result<std::vector<std::string>, Error>::failure(
                Error::repository_error(
                    "git ls-tree failed: " + std::string(string_utils::trim(result.value().stderr_output)),
                    repo_path.string()
                )
            );
        }

        std::vector<std::string> files;
        for (const auto entry : string_utils::split(result.value().stdout_output, '\0')) {
            if (entry.empty() || !string_utils::starts_with(entry, prefix)) {
                continue;
            }
            if (matches_pattern(entry.substr(prefix.size()), file_pattern)) {
                files.emplace_back(entry);
            }
        }

        std::ranges::sort(files);
        return Result<std::vector<std::string>, Error>::success(std::move(files));
    }

}  // namespace cta::git
