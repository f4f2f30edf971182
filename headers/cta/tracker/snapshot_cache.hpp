//
// Created by gregorian-rayne on 10/9/26.
//

#ifndef CTA_SNAPSHOT_CACHE_HPP
#define CTA_SNAPSHOT_CACHE_HPP

/**
 * @file snapshot_cache.hpp
 * @brief On-disk persistence of the open issue snapshot.
 *
 * File format:
 * @code
 * {
 *   "timestamp": "2024-01-15T10:30:00Z",
 *   "issue_count": 3,
 *   "issue_numbers": [100, 205, 311]
 * }
 * @endcode
 *
 * There is no expiry. The caller decides when to refresh and reports the
 * snapshot age.
 */

#include "cta/result.hpp"
#include "cta/error.hpp"
#include "cta/tracker/snapshot.hpp"

#include <string_view>

namespace cta::tracker
{
    class SnapshotCache {
    public:
        explicit SnapshotCache(fs::path path);

        [[nodiscard]] const fs::path& path() const noexcept { return path_; }

        [[nodiscard]] bool exists() const;

        /**
         * Loads the snapshot. Fails with NotFound, IoError, or ParseError for
         * a missing field, a non-integer id or a count that disagrees with
         * the list.
         */
        [[nodiscard]] Result<OpenIssueSnapshot, Error> load() const;

        /**
         * Writes the snapshot, creating the cache directory if needed.
         */
        [[nodiscard]] Result<void, Error> save(const OpenIssueSnapshot& snapshot) const;

        /**
         * Deletes the cache file. Removing a missing file succeeds.
         */
        [[nodiscard]] Result<void, Error> remove() const;

    private:
        fs::path path_;
    };

    /**
     * Decodes the cache document held in @p content.
     *
     * @param origin Label for error context (usually the file path).
     */
    [[nodiscard]] Result<OpenIssueSnapshot, Error> decode_snapshot(std::string_view content, const std::string& origin);

}  // namespace cta::tracker

#endif //CTA_SNAPSHOT_CACHE_HPP
