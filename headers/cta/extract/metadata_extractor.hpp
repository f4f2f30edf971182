//
// Created by gregorian-rayne on 10/4/26.
//

#ifndef CTA_METADATA_EXTRACTOR_HPP
#define CTA_METADATA_EXTRACTOR_HPP

/**
 * @file metadata_extractor.hpp
 * @brief Derives tracker identifiers from crash test paths and merge commit
 * messages.
 *
 * Crash tests are named after the issue they reproduce:
 * - "tests/crashes/12345.rs"      -> issue 12345
 * - "tests/crashes/12345-foo.rs"  -> issue 12345
 * - "tests/crashes/foo.rs"        -> no issue
 *
 * Merge bot commits carry the pull request number:
 * - "Auto merge of #147900 - user:branch, r=reviewer" -> PR 147900
 *
 * A miss is not an error: files outside the naming convention are simply not
 * correlated, so both functions return std::nullopt.
 */

#include "cta/types.hpp"

#include <optional>
#include <string_view>

namespace cta::extract
{
    /**
     * Marker written by the merge bot in front of the pull request number.
     */
    inline constexpr std::string_view AUTO_MERGE_MARKER = "Auto merge of #";

    /**
     * Extracts the issue number from a crash test file path.
     *
     * Uses the file stem (base name without its last extension). The whole
     * stem must be an unsigned integer, or the part before the first hyphen
     * must be.
     */
    [[nodiscard]] std::optional<IssueId> extract_issue_id(std::string_view path);

    /**
     * Extracts the pull request number that follows AUTO_MERGE_MARKER.
     */
    [[nodiscard]] std::optional<IssueId> extract_pr_id(std::string_view commit_message);

}  // namespace cta::extract

#endif //CTA_METADATA_EXTRACTOR_HPP
