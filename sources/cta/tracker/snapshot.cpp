//
// Created by gregorian-rayne on 10/8/26.
//

#include "cta/tracker/snapshot.hpp"

#include <algorithm>

namespace cta::tracker
{
    OpenIssueSnapshot::OpenIssueSnapshot(IssueSet ids, const Timestamp captured_at)
        : ids_(std::move(ids))
        , captured_at_(captured_at) {}

    Duration OpenIssueSnapshot::age(const Timestamp now) const {
        return std::chrono::duration_cast<Duration>(now - captured_at_);
    }

    std::vector<IssueId> OpenIssueSnapshot::sorted_ids() const {
        std::vector<IssueId> out(ids_.begin(), ids_.end());
        std::ranges::sort(out);
        return out;
    }

}  // namespace cta::tracker
