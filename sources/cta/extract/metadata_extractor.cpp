//
// Created by gregorian-rayne on 10/4/26.
//

#include "cta/extract/metadata_extractor.hpp"
#include "cta/utils/string_utils.hpp"

namespace cta::extract
{
    namespace {

        /**
         * Base name of a slash separated path without its last extension.
         * Mirrors std::filesystem::path::stem() for repository paths, which
         * always use '/' regardless of the host platform.
         */
        std::string_view file_stem(const std::string_view path) {
            std::string_view name = path;
            if (const auto slash = name.find_last_of('/'); slash != std::string_view::npos) {
                name = name.substr(slash + 1);
            }
            if (name == "." || name == "..") {
                return name;
            }
            if (const auto dot = name.find_last_of('.'); dot != std::string_view::npos && dot > 0) {
                name = name.substr(0, dot);
            }
            return name;
        }

    }  // namespace

    std::optional<IssueId> extract_issue_id(const std::string_view path) {
        const std::string_view stem = file_stem(path);

        if (auto whole = string_utils::parse_uint64(stem)) {
            return whole;
        }

        if (const auto dash = stem.find('-'); dash != std::string_view::npos) {
            return string_utils::parse_uint64(stem.substr(0, dash));
        }

        return std::nullopt;
    }

    std::optional<IssueId> extract_pr_id(const std::string_view commit_message) {
        const auto start = commit_message.find(AUTO_MERGE_MARKER);
        if (start == std::string_view::npos) {
            return std::nullopt;
        }

        const std::string_view rest = commit_message.substr(start + AUTO_MERGE_MARKER.size());
        std::size_t len = 0;
        while (len < rest.size() && string_utils::is_ascii_digit(rest[len])) {
            ++len;
        }

        return string_utils::parse_uint64(rest.substr(0, len));
    }

}  // namespace cta::extract
