//
// Created by gregorian-rayne on 10/10/26.
//

#ifndef CTA_CORRELATION_ENGINE_HPP
#define CTA_CORRELATION_ENGINE_HPP

/**
 * @file correlation_engine.hpp
 * @brief Reconciles deletion events with tracker state.
 *
 * For every issue named by at least one deletion event:
 * 1. remaining_count = current files whose name yields the same issue id
 * 2. remaining_count > 0          -> PartiallyDeleted
 *    otherwise, issue still open  -> FullyDeletedOpen
 *    otherwise                    -> FullyDeletedClosed
 *
 * Pure computation: no filesystem, no network. Identical inputs give
 * identical reports.
 */

#include "cta/types.hpp"
#include "cta/tracker/snapshot.hpp"

#include <string>
#include <vector>

namespace cta::analysis
{
    /**
     * Groups, classifies and tallies.
     *
     * @param events Deletion events in scan order.
     * @param open_issues Snapshot of open issue ids.
     * @param current_files Paths still present under the monitored prefix.
     */
    [[nodiscard]] AuditReport classify(
        const std::vector<DeletionEvent>& events,
        const tracker::OpenIssueSnapshot& open_issues,
        const std::vector<std::string>& current_files
    );

    /**
     * Classifications of one bucket, in ascending issue order.
     */
    [[nodiscard]] std::vector<const IssueClassification*> issues_with_status(
        const AuditReport& report,
        IssueStatus status
    );

}  // namespace cta::analysis

#endif //CTA_CORRELATION_ENGINE_HPP
