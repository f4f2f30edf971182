//
// Created by gregorian-rayne on 10/6/26.
//

#ifndef CTA_DELETION_SCANNER_HPP
#define CTA_DELETION_SCANNER_HPP

/**
 * @file deletion_scanner.hpp
 * @brief Walks first-parent history and collects crash test deletions.
 *
 * The walk is a streamed `git log` restricted to the monitored pathspec.
 * Each commit record is folded into a DeletionCollector, which applies the
 * date window and extracts identifiers. Records arrive newest first; the
 * collector's from-date rule depends on that order.
 *
 * The path-limited log only shows commits that delete a monitored file, so
 * with a from-date the boundary is located first on the unfiltered
 * first-parent chain and the log is cut there.
 */

#include "cta/result.hpp"
#include "cta/error.hpp"
#include "cta/types.hpp"

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace cta::git
{
    /**
     * Deletion commits between two progress notifications.
     */
    inline constexpr std::size_t PROGRESS_INTERVAL = 1000;

    struct ScanOptions {
        std::string pathspec = "tests/crashes/*.rs";
        std::optional<CalendarDate> from_date;
        std::optional<CalendarDate> to_date;
    };

    /**
     * One commit of the log stream.
     */
    struct CommitRecord {
        std::string hash;
        std::int64_t commit_time = 0;    // committer time, Unix seconds
        std::vector<std::string> parents;
        std::string message;
        std::vector<std::string> deleted_paths;
    };

    struct ScanResult {
        std::vector<DeletionEvent> events;
        std::size_t deletion_commits = 0;    // commits of the log that delete a monitored file
        bool stopped_at_date_boundary = false;
    };

    /**
     * Called with the running deletion commit count every PROGRESS_INTERVAL
     * deletion commits.
     */
    using ScanProgressCallback = std::function<void(std::size_t deletion_commits)>;

    enum class VisitOutcome {
        Continue,
        Stop
    };

    /**
     * Parses one record of the log stream (without its leading separator).
     *
     * Header fields are separated by 0x1F and terminated by 0x1D:
     * hash, committer time, space separated parents, raw message. The
     * name-status lines follow; only "D\t<path>" lines are kept.
     */
    [[nodiscard]] Result<CommitRecord, Error> parse_commit_record(std::string_view raw);

    /**
     * Splits the log stream into records. Chunks may end anywhere, including
     * inside a multi-byte path.
     */
    class CommitLogReader {
    public:
        static constexpr char RECORD_SEPARATOR = '\x1e';

        void feed(std::string_view chunk);

        /**
         * Next complete record, if the stream already holds the separator
         * that ends it.
         */
        [[nodiscard]] std::optional<std::string> next_record();

        /**
         * The trailing record once the stream has ended.
         */
        [[nodiscard]] std::optional<std::string> take_remaining();

    private:
        std::string buffer_;
        std::size_t consumed_ = 0;
    };

    /**
     * Fold over commit records, newest first.
     *
     * - A commit dated before from_date stops the walk; nothing older is
     *   looked at.
     * - A commit dated after to_date is skipped; the walk goes on.
     * - Root commits are skipped.
     * - Deleted paths without an issue id are dropped.
     */
    class DeletionCollector {
    public:
        explicit DeletionCollector(ScanOptions options, ScanProgressCallback progress = nullptr);

        VisitOutcome visit(const CommitRecord& commit);

        [[nodiscard]] std::size_t deletion_commits() const noexcept { return result_.deletion_commits; }

        /**
         * Marks the walk as cut at the from-date boundary by an earlier pass.
         */
        void mark_stopped_at_date_boundary() noexcept { result_.stopped_at_date_boundary = true; }

        [[nodiscard]] ScanResult finish() &&;

    private:
        ScanOptions options_;
        ScanProgressCallback progress_;
        ScanResult result_;
    };

    /**
     * Scans first-parent history of the repository at @p repo_path.
     *
     * @return The deletion events in traversal order, or RepositoryError if
     *         the path is not a readable repository or the log is malformed.
     */
    [[nodiscard]] Result<ScanResult, Error> scan_deletions(
        const fs::path& repo_path,
        const ScanOptions& options,
        const ScanProgressCallback& progress = nullptr
    );

    /**
     * Walks the unfiltered first-parent chain from @p tip and returns the
     * first commit dated before @p from_date, or nullopt if there is none.
     */
    [[nodiscard]] Result<std::optional<std::string>, Error> find_date_boundary(
        const fs::path& repo_path,
        const std::string& tip,
        const CalendarDate& from_date
    );

    /**
     * Arguments of the log command used by scan_deletions. A @p boundary
     * commit and its ancestors are excluded from the walk.
     */
    [[nodiscard]] std::vector<std::string> build_log_arguments(
        const std::string& pathspec,
        const std::string& tip = "HEAD",
        const std::optional<std::string>& boundary = std::nullopt
    );

}  // namespace cta::git

#endif //CTA_DELETION_SCANNER_HPP
