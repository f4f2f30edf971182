//
// Created by gregorian-rayne on 10/9/26.
//

#ifndef CTA_SNAPSHOT_PROVIDER_HPP
#define CTA_SNAPSHOT_PROVIDER_HPP

/**
 * @file snapshot_provider.hpp
 * @brief Cache-or-fetch access to the open issue snapshot.
 *
 * Rules:
 * - force_refresh: fetch, persist, return. Any failure is fatal.
 * - a cache that loads is used as is; the tracker is not contacted.
 * - otherwise fetch, persist, return. A cache that exists but fails to load
 *   is reported through the warning callback first.
 */

#include "cta/result.hpp"
#include "cta/error.hpp"
#include "cta/tracker/issue_tracker.hpp"
#include "cta/tracker/snapshot.hpp"
#include "cta/tracker/snapshot_cache.hpp"

#include <functional>
#include <string>

namespace cta::tracker
{
    enum class SnapshotSource {
        Cache,
        Remote
    };

    inline const char* to_string(const SnapshotSource source) noexcept {
        switch (source) {
            case SnapshotSource::Cache:  return "cache";
            case SnapshotSource::Remote: return "remote";
        }
        return "unknown";
    }

    /**
     * A snapshot together with how stale it is and where it came from.
     */
    struct SnapshotLease {
        OpenIssueSnapshot snapshot;
        Duration age = Duration::zero();
        SnapshotSource source = SnapshotSource::Remote;
    };

    using Clock = std::function<Timestamp()>;
    using WarningCallback = std::function<void(const Error&)>;

    class SnapshotProvider {
    public:
        SnapshotProvider(const IIssueTracker& tracker, SnapshotCache cache, Clock clock = nullptr);

        [[nodiscard]] Result<SnapshotLease, Error> get_snapshot(bool force_refresh) const;

        void set_page_progress(PageProgressCallback progress) { page_progress_ = std::move(progress); }

        void set_warning_handler(WarningCallback on_warning) { on_warning_ = std::move(on_warning); }

        [[nodiscard]] const SnapshotCache& cache() const noexcept { return cache_; }

    private:
        [[nodiscard]] Result<SnapshotLease, Error> fetch_and_store() const;

        [[nodiscard]] Timestamp now() const;

        const IIssueTracker& tracker_;
        SnapshotCache cache_;
        Clock clock_;
        PageProgressCallback page_progress_;
        WarningCallback on_warning_;
    };

}  // namespace cta::tracker

#endif //CTA_SNAPSHOT_PROVIDER_HPP
