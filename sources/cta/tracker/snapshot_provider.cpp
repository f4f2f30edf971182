//
// Created by gregorian-rayne on 10/9/26.
//

#include "cta/tracker/snapshot_provider.hpp"

namespace cta::tracker
{
    SnapshotProvider::SnapshotProvider(const IIssueTracker& tracker, SnapshotCache cache, Clock clock)
        : tracker_(tracker)
        , cache_(std::move(cache))
        , clock_(std::move(clock)) {}

    Timestamp SnapshotProvider::now() const {
        return clock_ ? clock_() : std::chrono::system_clock::now();
    }

    Result<SnapshotLease, Error> SnapshotProvider::get_snapshot(const bool force_refresh) const {
        if (force_refresh) {
            return fetch_and_store();
        }

        if (cache_.exists()) {
            auto cached = cache_.load();
            if (cached.is_ok()) {
                SnapshotLease lease;
                lease.age = cached.value().age(now());
                lease.snapshot = std::move(cached).value();
                lease.source = SnapshotSource::Cache;
                return Result<SnapshotLease, Error>::success(std::move(lease));
            }

            if (on_warning_) {
                on_warning_(cached.error());
            }
        }

        return fetch_and_store();
    }

    Result<SnapshotLease, Error> SnapshotProvider::fetch_and_store() const {
        auto ids = tracker_.fetch_open_issues(page_progress_);
        if (ids.is_err()) {
            return Result<SnapshotLease, Error>::failure(ids.error());
        }

        SnapshotLease lease;
        lease.snapshot = OpenIssueSnapshot(std::move(ids).value(), now());
        lease.source = SnapshotSource::Remote;

        if (auto saved = cache_.save(lease.snapshot); saved.is_err()) {
            return Result<SnapshotLease, Error>::failure(saved.error());
        }

        return Result<SnapshotLease, Error>::success(std::move(lease));
    }

}  // namespace cta::tracker
