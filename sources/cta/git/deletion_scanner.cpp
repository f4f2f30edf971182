//
// Created by gregorian-rayne on 10/6/26.
//

#include "cta/git/deletion_scanner.hpp"
#include "cta/git/git_integration.hpp"
#include "cta/extract/metadata_extractor.hpp"
#include "cta/utils/string_utils.hpp"

#include <charconv>

namespace cta::git
{
    namespace {

        constexpr char FIELD_SEPARATOR = '\x1f';
        constexpr char HEADER_TERMINATOR = '\x1d';

        /**
         * Undoes git's C-style quoting of unusual paths ("a\tb" -> a<TAB>b).
         * core.quotePath=false keeps non-ASCII bytes verbatim, so only
         * control characters, quotes and backslashes arrive escaped.
         */
        std::string unquote_path(const std::string_view path) {
            if (path.size() < 2 || path.front() != '"' || path.back() != '"') {
                return std::string(path);
            }

            const std::string_view body = path.substr(1, path.size() - 2);
            std::string out;
            out.reserve(body.size());

            for (std::size_t i = 0; i < body.size(); ++i) {
                if (body[i] != '\\' || i + 1 >= body.size()) {
                    out += body[i];
                    continue;
                }

                const char esc = body[++i];
                switch (esc) {
                    case 'a': out += '\a'; break;
                    case 'b': out += '\b'; break;
                    case 'f': out += '\f'; break;
                    case 'n': out += '\n'; break;
                    case 'r': out += '\r'; break;
                    case 't': out += '\t'; break;
                    case 'v': out += '\v'; break;
                    case '0': case '1': case '2': case '3': {
                        int value = esc - '0';
                        for (int k = 0; k < 2 && i + 1 < body.size() &&
                                        body[i + 1] >= '0' && body[i + 1] <= '7'; ++k) {
                            value = value * 8 + (body[++i] - '0');
                        }
                        out += static_cast<char>(value);
                        break;
                    }
                    default: out += esc; break;
                }
            }
            return out;
        }

        Result<CommitRecord, Error> malformed(std::string message, std::string_view hash) {
            return Result<CommitRecord, Error>::failure(
                Error::repository_error(std::move(message),
                                        hash.empty() ? "<unknown commit>" : "commit " + std::string(hash))
            );
        }

    }  // namespace

    // =============================================================================
    // Record Parsing
    // =============================================================================

    Result<CommitRecord, Error> parse_commit_record(const std::string_view raw) {
        const auto header_end = raw.find(HEADER_TERMINATOR);
        const std::string_view header = raw.substr(0, header_end);

        // The message may itself contain separators; it is everything after
        // the third one.
        const auto hash_end = header.find(FIELD_SEPARATOR);
        const std::string_view hash = string_utils::trim(header.substr(0, hash_end));

        if (header_end == std::string_view::npos) {
            return malformed("Truncated commit record in git log output", hash);
        }

        const auto time_end = hash_end == std::string_view::npos
                                  ? std::string_view::npos
                                  : header.find(FIELD_SEPARATOR, hash_end + 1);
        const auto parents_end = time_end == std::string_view::npos
                                     ? std::string_view::npos
                                     : header.find(FIELD_SEPARATOR, time_end + 1);

        if (parents_end == std::string_view::npos || hash.empty()) {
            return malformed("Malformed commit header in git log output", hash);
        }

        CommitRecord record;
        record.hash = std::string(hash);

        const std::string_view time_text = header.substr(hash_end + 1, time_end - hash_end - 1);
        const auto [ptr, ec] = std::from_chars(time_text.data(), time_text.data() + time_text.size(),
                                               record.commit_time);
        if (time_text.empty() || ec != std::errc{} || ptr != time_text.data() + time_text.size()) {
            return malformed("Invalid commit timestamp '" + std::string(time_text) + "'", hash);
        }

        const std::string_view parents_text = header.substr(time_end + 1, parents_end - time_end - 1);
        for (const auto parent : string_utils::split(parents_text, ' ')) {
            if (!parent.empty()) {
                record.parents.emplace_back(parent);
            }
        }

        record.message = std::string(header.substr(parents_end + 1));

        for (const auto line : string_utils::split(raw.substr(header_end + 1), '\n')) {
            if (!string_utils::starts_with(line, "D\t")) {
                continue;
            }
            std::string_view path = line.substr(2);
            if (!path.empty() && path.back() == '\r') {
                path.remove_suffix(1);
            }
            if (!path.empty()) {
                record.deleted_paths.push_back(unquote_path(path));
            }
        }

        return Result<CommitRecord, Error>::success(std::move(record));
    }

    // =============================================================================
    // CommitLogReader
    // =============================================================================

    void CommitLogReader::feed(const std::string_view chunk) {
        if (consumed_ > 0 && consumed_ * 2 >= buffer_.size()) {
            buffer_.erase(0, consumed_);
            consumed_ = 0;
        }
        buffer_.append(chunk);
    }

    std::optional<std::string> CommitLogReader::next_record() {
        while (true) {
            const auto start = buffer_.find(RECORD_SEPARATOR, consumed_);
            if (start == std::string::npos) {
                return std::nullopt;
            }
            const auto end = buffer_.find(RECORD_SEPARATOR, start + 1);
            if (end == std::string::npos) {
                consumed_ = start;
                return std::nullopt;
            }

            std::string record = buffer_.substr(start + 1, end - start - 1);
            consumed_ = end;
            if (!string_utils::trim(record).empty()) {
                return record;
            }
        }
    }

    std::optional<std::string> CommitLogReader::take_remaining() {
        const auto start = buffer_.find(RECORD_SEPARATOR, consumed_);
        if (start == std::string::npos) {
            buffer_.clear();
            consumed_ = 0;
            return std::nullopt;
        }

        std::string record = buffer_.substr(start + 1);
        buffer_.clear();
        consumed_ = 0;

        if (string_utils::trim(record).empty()) {
            return std::nullopt;
        }
        return record;
    }

    // =============================================================================
    // DeletionCollector
    // =============================================================================

    DeletionCollector::DeletionCollector(ScanOptions options, ScanProgressCallback progress)
        : options_(std::move(options))
        , progress_(std::move(progress)) {}

    VisitOutcome DeletionCollector::visit(const CommitRecord& commit) {
        ++result_.deletion_commits;

        if (progress_ && result_.deletion_commits % PROGRESS_INTERVAL == 0) {
            progress_(result_.deletion_commits);
        }

        const CalendarDate commit_date = CalendarDate::from_unix_seconds(commit.commit_time);

        if (options_.from_date && commit_date < *options_.from_date) {
            result_.stopped_at_date_boundary = true;
            return VisitOutcome::Stop;
        }

        if (options_.to_date && commit_date > *options_.to_date) {
            return VisitOutcome::Continue;
        }

        if (commit.parents.empty()) {
            return VisitOutcome::Continue;
        }

        for (const auto& path : commit.deleted_paths) {
            const auto issue_id = extract::extract_issue_id(path);
            if (!issue_id) {
                continue;
            }

            DeletionEvent event;
            event.file_path = path;
            event.issue_id = *issue_id;
            event.commit_hash = commit.hash;
            event.commit_date = commit_date;
            event.pr_id = extract::extract_pr_id(commit.message);
            result_.events.push_back(std::move(event));
        }

        return VisitOutcome::Continue;
    }

    ScanResult DeletionCollector::finish() && {
        return std::move(result_);
    }

    // =============================================================================
    // Scanner
    // =============================================================================

    Result<std::optional<std::string>, Error> find_date_boundary(
        const fs::path& repo_path,
        const std::string& tip,
        const CalendarDate& from_date
    ) {
        std::string pending;
        std::optional<std::string> boundary;
        std::optional<Error> failure;

        // One "<committer time> <hash>" line per commit, newest first.
        auto consume_line = [&](const std::string_view line) {
            const std::string_view trimmed = string_utils::trim(line);
            if (trimmed.empty()) {
                return true;
            }

            const auto space = trimmed.find(' ');
            std::int64_t commit_time = 0;
            const auto [ptr, ec] = std::from_chars(trimmed.data(), trimmed.data() + trimmed.size(), commit_time);
            if (space == std::string_view::npos || ec != std::errc{} || ptr != trimmed.data() + space) {
                failure = Error::repository_error("Malformed git rev-list output",
                                                  std::string(string_utils::excerpt(trimmed, 80)));
                return false;
            }

            if (CalendarDate::from_unix_seconds(commit_time) < from_date) {
                boundary = std::string(string_utils::trim(trimmed.substr(space + 1)));
                return false;
            }
            return true;
        };

        const OutputHandler on_output = [&](const std::string_view chunk) {
            pending.append(chunk);
            std::size_t start = 0;
            for (auto end = pending.find('\n'); end != std::string::npos; end = pending.find('\n', start)) {
                if (!consume_line(std::string_view(pending).substr(start, end - start))) {
                    return false;
                }
                start = end + 1;
            }
            pending.erase(0, start);
            return true;
        };

        auto run = stream_git({"rev-list", "--first-parent", "--timestamp", tip}, repo_path, on_output);
        if (run.is_err()) {
            return Result<std::optional<std::string>, Error>::failure(run.error());
        }

        if (!run.value().stopped_by_caller) {
            if (run.value().exit_code != 0) {
                return Result<std::optional<std::string>, Error>::failure(
                    Error::repository_error(
                        "git rev-list failed: " + std::string(string_utils::trim(run.value().stderr_output)),
                        repo_path.string()
                    )
                );
            }
            consume_line(pending);
        }

        if (failure) {
            return Result<std::optional<std::string>, Error>::failure(*failure);
        }
        return Result<std::optional<std::string>, Error>::success(std::move(boundary));
    }

    std::vector<std::string> build_log_arguments(
        const std::string& pathspec,
        const std::string& tip,
        const std::optional<std::string>& boundary
    ) {
        std::vector<std::string> args = {
            "-c", "core.quotePath=false",
            "-c", "log.showSignature=false",
            "log",
            "--first-parent",
            "--diff-merges=first-parent",
            "--no-renames",
            "--no-color",
            "--name-status",
            "--diff-filter=D",
            "--format=%x1e%H%x1f%ct%x1f%P%x1f%B%x1d",
            tip
        };
        if (boundary) {
            args.push_back("^" + *boundary);
        }
        args.emplace_back("--");
        args.push_back(pathspec);
        return args;
    }

    Result<ScanResult, Error> scan_deletions(
        const fs::path& repo_path,
        const ScanOptions& options,
        const ScanProgressCallback& progress
    ) {
        auto head = open_repository(repo_path);
        if (head.is_err()) {
            return Result<ScanResult, Error>::failure(head.error());
        }

        DeletionCollector collector(options, progress);

        std::optional<std::string> boundary;
        if (options.from_date) {
            auto found = find_date_boundary(repo_path, head.value(), *options.from_date);
            if (found.is_err()) {
                return Result<ScanResult, Error>::failure(found.error());
            }
            boundary = std::move(found).value();
            if (boundary) {
                collector.mark_stopped_at_date_boundary();
            }
        }

        CommitLogReader reader;
        std::optional<Error> failure;

        auto consume = [&](const std::string& raw) {
            auto record = parse_commit_record(raw);
            if (record.is_err()) {
                failure = record.error();
                return false;
            }
            return collector.visit(record.value()) == VisitOutcome::Continue;
        };

        const OutputHandler on_output = [&](const std::string_view chunk) {
            reader.feed(chunk);
            while (auto raw = reader.next_record()) {
                if (!consume(*raw)) {
                    return false;
                }
            }
            return true;
        };

        auto run = stream_git(build_log_arguments(options.pathspec, head.value(), boundary), repo_path, on_output);
        if (run.is_err()) {
            return Result<ScanResult, Error>::failure(run.error());
        }

        if (failure) {
            return Result<ScanResult, Error>::failure(*failure);
        }

        if (!run.value().stopped_by_caller) {
            if (run.value().exit_code != 0) {
                return Result<ScanResult, Error>::failure(
                    Error::repository_error(
                        "git log failed: " + std::string(string_utils::trim(run.value().stderr_output)),
                        repo_path.string()
                    )
                );
            }

            if (auto raw = reader.take_remaining(); raw && !consume(*raw) && failure) {
                return Result<ScanResult, Error>::failure(*failure);
            }
        }

        return Result<ScanResult, Error>::success(std::move(collector).finish());
    }

}  // namespace cta::git
