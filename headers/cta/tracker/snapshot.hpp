//
// Created by gregorian-rayne on 10/8/26.
//

#ifndef CTA_SNAPSHOT_HPP
#define CTA_SNAPSHOT_HPP

/**
 * @file snapshot.hpp
 * @brief Point-in-time set of open issue numbers.
 */

#include "cta/types.hpp"

#include <unordered_set>
#include <vector>

namespace cta::tracker
{
    using IssueSet = std::unordered_set<IssueId>;

    /**
     * Immutable once built. A refresh produces a new snapshot; two snapshots
     * are never merged.
     */
    class OpenIssueSnapshot {
    public:
        OpenIssueSnapshot() = default;
        OpenIssueSnapshot(IssueSet ids, Timestamp captured_at);

        [[nodiscard]] bool contains(const IssueId id) const { return ids_.contains(id); }

        [[nodiscard]] std::size_t size() const noexcept { return ids_.size(); }

        [[nodiscard]] bool empty() const noexcept { return ids_.empty(); }

        [[nodiscard]] Timestamp captured_at() const noexcept { return captured_at_; }

        /**
         * Time elapsed since capture, relative to @p now.
         */
        [[nodiscard]] Duration age(Timestamp now) const;

        /**
         * Ids in ascending order, as persisted in the cache.
         */
        [[nodiscard]] std::vector<IssueId> sorted_ids() const;

        [[nodiscard]] const IssueSet& ids() const noexcept { return ids_; }

    private:
        IssueSet ids_;
        Timestamp captured_at_{};
    };

}  // namespace cta::tracker

#endif //CTA_SNAPSHOT_HPP
