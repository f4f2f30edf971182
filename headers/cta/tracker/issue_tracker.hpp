//
// Created by gregorian-rayne on 10/8/26.
//

#ifndef CTA_ISSUE_TRACKER_HPP
#define CTA_ISSUE_TRACKER_HPP

/**
 * @file issue_tracker.hpp
 * @brief Remote issue tracker access.
 *
 * The audit only needs the set of open issue numbers. IIssueTracker is the
 * seam: production code talks to GitHub over libcurl, tests substitute an
 * in-memory tracker.
 */

#include "cta/result.hpp"
#include "cta/error.hpp"
#include "cta/tracker/snapshot.hpp"

#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace cta::tracker
{
    /**
     * Progress of a paginated fetch, reported once per page.
     */
    struct PageProgress {
        std::size_t page = 0;
        std::size_t page_items = 0;
        std::size_t total_so_far = 0;
    };

    using PageProgressCallback = std::function<void(const PageProgress&)>;

    /**
     * Base interface for issue trackers.
     */
    class IIssueTracker {
    public:
        virtual ~IIssueTracker() = default;

        /**
         * Human readable tracker location, e.g. "rust-lang/rust".
         */
        [[nodiscard]] virtual std::string describe() const = 0;

        /**
         * Fetches the number of every open issue.
         *
         * The result is complete or an error; a failure on any page fails
         * the whole fetch with TrackerError.
         */
        [[nodiscard]] virtual Result<IssueSet, Error> fetch_open_issues(
            const PageProgressCallback& progress
        ) const = 0;
    };

    struct GitHubTrackerOptions {
        std::string api_url = "https://api.github.com";
        std::string owner = "rust-lang";
        std::string repo = "rust";
        std::optional<std::string> token;
        unsigned per_page = 100;
        std::chrono::seconds timeout{30};
    };

    /**
     * GitHub REST client for the issues endpoint.
     *
     * Follows the Link header's rel="next" URL until the last page. The
     * issues endpoint also lists pull requests; their numbers are kept.
     */
    class GitHubIssueTracker final : public IIssueTracker {
    public:
        explicit GitHubIssueTracker(GitHubTrackerOptions options);

        [[nodiscard]] std::string describe() const override;

        [[nodiscard]] Result<IssueSet, Error> fetch_open_issues(
            const PageProgressCallback& progress
        ) const override;

        [[nodiscard]] std::string first_page_url() const;

        [[nodiscard]] bool authenticated() const noexcept {
            return options_.token.has_value() && !options_.token->empty();
        }

        [[nodiscard]] const GitHubTrackerOptions& options() const noexcept { return options_; }

    private:
        struct HttpResponse {
            long status = 0;
            std::string body;
            std::optional<std::string> link_header;
        };

        [[nodiscard]] Result<HttpResponse, Error> http_get(const std::string& url, std::size_t page) const;

        GitHubTrackerOptions options_;
    };

    /**
     * Extracts the "number" of every element of an issues page.
     *
     * @param body The response body, a JSON array.
     * @param page Page number used in error context.
     */
    [[nodiscard]] Result<std::vector<IssueId>, Error> parse_issue_page(std::string_view body, std::size_t page);

    /**
     * Returns the rel="next" target of an RFC 8288 Link header, if any.
     */
    [[nodiscard]] std::optional<std::string> parse_next_link(std::string_view link_header);

}  // namespace cta::tracker

#endif //CTA_ISSUE_TRACKER_HPP
