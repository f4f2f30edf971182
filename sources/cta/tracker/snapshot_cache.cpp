//
// Created by gregorian-rayne on 10/9/26.
//

#include "cta/tracker/snapshot_cache.hpp"
#include "cta/utils/json_utils.hpp"
#include "cta/utils/time_utils.hpp"

namespace cta::tracker
{
    namespace {

        Result<OpenIssueSnapshot, Error> invalid(const std::string& message, const std::string& origin) {
            return Result<OpenIssueSnapshot, Error>::failure(Error::parse_error(message, origin));
        }

        Result<OpenIssueSnapshot, Error> decode_document(const json_utils::json& doc, const std::string& origin) {
            if (!doc.is_object()) {
                return invalid("Cache file is not a JSON object", origin);
            }

            auto timestamp = json_utils::get<std::string>(doc, "timestamp");
            if (timestamp.is_err()) {
                return Result<OpenIssueSnapshot, Error>::failure(
                    Error::parse_error("Cache file has no valid timestamp", origin)
                );
            }

            auto captured_at = time_utils::parse_rfc3339(timestamp.value());
            if (captured_at.is_err()) {
                return Result<OpenIssueSnapshot, Error>::failure(captured_at.error().with_context(origin));
            }

            if (!doc.contains("issue_count") || !doc["issue_count"].is_number_unsigned()) {
                return invalid("Cache file has no valid issue_count", origin);
            }
            const auto issue_count = doc["issue_count"].get<std::uint64_t>();

            if (!doc.contains("issue_numbers") || !doc["issue_numbers"].is_array()) {
                return invalid("Cache file has no issue_numbers array", origin);
            }

            const auto& numbers = doc["issue_numbers"];
            if (numbers.size() != issue_count) {
                return invalid(
                    "Cache issue_count " + std::to_string(issue_count) +
                    " disagrees with " + std::to_string(numbers.size()) + " listed issues",
                    origin
                );
            }

            IssueSet ids;
            ids.reserve(numbers.size());
            for (const auto& number : numbers) {
                if (!number.is_number_unsigned()) {
                    return invalid("Cache issue_numbers contains a non-integer entry", origin);
                }
                ids.insert(number.get<IssueId>());
            }

            return Result<OpenIssueSnapshot, Error>::success(OpenIssueSnapshot(std::move(ids), captured_at.value()));
        }

    }  // namespace

    Result<OpenIssueSnapshot, Error> decode_snapshot(const std::string_view content, const std::string& origin) {
        auto doc = json_utils::parse(content, origin);
        if (doc.is_err()) {
            return Result<OpenIssueSnapshot, Error>::failure(doc.error());
        }
        return decode_document(doc.value(), origin);
    }

    SnapshotCache::SnapshotCache(fs::path path)
        : path_(std::move(path)) {}

    bool SnapshotCache::exists() const {
        std::error_code ec;
        return fs::is_regular_file(path_, ec);
    }

    Result<OpenIssueSnapshot, Error> SnapshotCache::load() const {
        auto doc = json_utils::read_file(path_);
        if (doc.is_err()) {
            return Result<OpenIssueSnapshot, Error>::failure(doc.error());
        }
        return decode_document(doc.value(), path_.string());
    }

    Result<void, Error> SnapshotCache::save(const OpenIssueSnapshot& snapshot) const {
        const auto ids = snapshot.sorted_ids();

        json_utils::json doc;
        doc["timestamp"] = time_utils::format_rfc3339(snapshot.captured_at());
        doc["issue_count"] = ids.size();
        doc["issue_numbers"] = ids;

        return json_utils::write_file(path_, doc);
    }

    Result<void, Error> SnapshotCache::remove() const {
        std::error_code ec;
        fs::remove(path_, ec);
        if (ec) {
            return Result<void, Error>::failure(
                Error::io_error("Failed to remove cache file", path_.string() + ": " + ec.message())
            );
        }
        return Result<void, Error>::success();
    }

}  // namespace cta::tracker
