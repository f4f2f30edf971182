//
// Created by gregorian-rayne on 10/7/26.
//

#ifndef CTA_CURRENT_FILES_HPP
#define CTA_CURRENT_FILES_HPP

#include "cta/result.hpp"
#include "cta/error.hpp"
#include "cta/types.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace cta::git
{
    /**
     * Lists the files under @p crash_dir in the HEAD tree whose path relative
     * to @p crash_dir matches @p file_pattern.
     *
     * Matching follows git's plain pathspec globbing: '*' also matches '/'.
     * Paths are returned repository-relative and sorted ascending.
     */
    [[nodiscard]] Result<std::vector<std::string>, Error> list_current_files(
        const fs::path& repo_path,
        std::string_view crash_dir,
        std::string_view file_pattern
    );

    /**
     * Glob match with fnmatch(3) semantics and no FNM_PATHNAME.
     */
    [[nodiscard]] bool matches_pattern(std::string_view relative_path, std::string_view file_pattern);

}  // namespace cta::git

#endif //CTA_CURRENT_FILES_HPP
