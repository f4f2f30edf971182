//
// Created by gregorian-rayne on 10/8/26.
//

#include "cta/tracker/issue_tracker.hpp"
#include "cta/utils/json_utils.hpp"
#include "cta/utils/string_utils.hpp"
#include "cta/version.hpp"

#include <curl/curl.h>

#include <memory>
#include <mutex>

namespace cta::tracker
{
    namespace {

        constexpr std::size_t ERROR_BODY_EXCERPT = 200;

        struct CurlDeleter {
            void operator()(CURL* handle) const noexcept { curl_easy_cleanup(handle); }
        };

        struct SlistDeleter {
            void operator()(curl_slist* list) const noexcept { curl_slist_free_all(list); }
        };

        using CurlHandle = std::unique_ptr<CURL, CurlDeleter>;
        using HeaderList = std::unique_ptr<curl_slist, SlistDeleter>;

        void ensure_curl_initialized() {
            static std::once_flag flag;
            std::call_once(flag, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
        }

        std::size_t write_body(const char* data, const std::size_t size, const std::size_t nmemb, void* userdata) {
            auto* body = static_cast<std::string*>(userdata);
            body->append(data, size * nmemb);
            return size * nmemb;
        }

        /**
         * Keeps the Link header of the final response. Header lines of
         * earlier responses (redirects) are discarded on each status line.
         */
        std::size_t write_header(const char* data, const std::size_t size, const std::size_t nmemb, void* userdata) {
            auto* link = static_cast<std::optional<std::string>*>(userdata);
            const std::string_view line(data, size * nmemb);

            if (string_utils::starts_with(line, "HTTP/")) {
                link->reset();
            } else if (const auto colon = line.find(':'); colon != std::string_view::npos) {
                if (string_utils::to_lower(string_utils::trim(line.substr(0, colon))) == "link") {
                    *link = std::string(string_utils::trim(line.substr(colon + 1)));
                }
            }
            return size * nmemb;
        }

        HeaderList append_header(HeaderList list, const std::string& header) {
            curl_slist* raw = curl_slist_append(list.get(), header.c_str());
            if (raw == nullptr) {
                return list;
            }
            (void)list.release();
            return HeaderList(raw);
        }

        std::string page_context(const std::size_t page) {
            return "page " + std::to_string(page);
        }

    }  // namespace

    // =============================================================================
    // Response Parsing
    // =============================================================================

    Result<std::vector<IssueId>, Error> parse_issue_page(const std::string_view body, const std::size_t page) {
        auto doc = json_utils::parse(body, page_context(page));
        if (doc.is_err()) {
            return Result<std::vector<IssueId>, Error>::failure(
                Error::tracker_error("Malformed issue list response", doc.error().context().value_or(page_context(page)))
            );
        }

        const auto& items = doc.value();
        if (!items.is_array()) {
            return Result<std::vector<IssueId>, Error>::failure(
                Error::tracker_error("Issue list response is not a JSON array", page_context(page))
            );
        }

        std::vector<IssueId> ids;
        ids.reserve(items.size());

        for (const auto& item : items) {
            if (!item.is_object() || !item.contains("number") || !item["number"].is_number_unsigned()) {
                return Result<std::vector<IssueId>, Error>::failure(
                    Error::tracker_error("Issue entry without an integer number", page_context(page))
                );
            }
            ids.push_back(item["number"].get<IssueId>());
        }

        return Result<std::vector<IssueId>, Error>::success(std::move(ids));
    }

    std::optional<std::string> parse_next_link(const std::string_view link_header) {
        for (const auto entry : string_utils::split(link_header, ',')) {
            const auto open = entry.find('<');
            const auto close = entry.find('>', open == std::string_view::npos ? 0 : open);
            if (open == std::string_view::npos || close == std::string_view::npos) {
                continue;
            }

            for (const auto param : string_utils::split(entry.substr(close + 1), ';')) {
                const auto p = string_utils::trim(param);
                if (p == "rel=\"next\"" || p == "rel=next") {
                    return std::string(entry.substr(open + 1, close - open - 1));
                }
            }
        }
        return std::nullopt;
    }

    // =============================================================================
    // GitHubIssueTracker
    // =============================================================================

    GitHubIssueTracker::GitHubIssueTracker(GitHubTrackerOptions options)
        : options_(std::move(options)) {
        while (!options_.api_url.empty() && options_.api_url.back() == '/') {
            options_.api_url.pop_back();
        }
    }

    std::string GitHubIssueTracker::describe() const {
        return options_.owner + "/" + options_.repo;
    }

    std::string GitHubIssueTracker::first_page_url() const {
        return options_.api_url + "/repos/" + options_.owner + "/" + options_.repo +
               "/issues?state=open&per_page=" + std::to_string(options_.per_page);
    }

    Result<GitHubIssueTracker::HttpResponse, Error> GitHubIssueTracker::http_get(
        const std::string& url,
        const std::size_t page
    ) const {
        ensure_curl_initialized();

        const CurlHandle curl(curl_easy_init());
        if (!curl) {
            return Result<HttpResponse, Error>::failure(
                Error::tracker_error("Failed to initialize HTTP client", page_context(page))
            );
        }

        HeaderList headers;
        headers = append_header(std::move(headers), "Accept: application/vnd.github+json");
        headers = append_header(std::move(headers), "X-GitHub-Api-Version: 2022-11-28");
        headers = append_header(std::move(headers),
                                std::string("User-Agent: ") + PROJECT_SHORT_NAME + "/" + VERSION_STRING);
        if (authenticated()) {
            headers = append_header(std::move(headers), "Authorization: Bearer " + *options_.token);
        }

        HttpResponse response;
        char error_buffer[CURL_ERROR_SIZE] = {};

        curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
        curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
        curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_body);
        curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response.body);
        curl_easy_setopt(curl.get(), CURLOPT_HEADERFUNCTION, write_header);
        curl_easy_setopt(curl.get(), CURLOPT_HEADERDATA, &response.link_header);
        curl_easy_setopt(curl.get(), CURLOPT_ERRORBUFFER, error_buffer);
        curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, static_cast<long>(options_.timeout.count()));
        curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_SSL_VERIFYPEER, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_SSL_VERIFYHOST, 2L);
        curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);

        const CURLcode res = curl_easy_perform(curl.get());
        if (res != CURLE_OK) {
            const std::string detail = error_buffer[0] != '\0' ? error_buffer : curl_easy_strerror(res);
            return Result<HttpResponse, Error>::failure(
                Error::tracker_error("Failed to fetch open issues", page_context(page) + ": " + detail)
            );
        }

        curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.status);
        return Result<HttpResponse, Error>::success(std::move(response));
    }

    Result<IssueSet, Error> GitHubIssueTracker::fetch_open_issues(const PageProgressCallback& progress) const {
        IssueSet ids;
        std::optional<std::string> next = first_page_url();
        std::size_t page = 0;

        while (next) {
            ++page;

            auto response = http_get(*next, page);
            if (response.is_err()) {
                return Result<IssueSet, Error>::failure(response.error());
            }

            const auto& http = response.value();
            if (http.status < 200 || http.status >= 300) {
                return Result<IssueSet, Error>::failure(
                    Error::tracker_error(
                        "GitHub API returned HTTP " + std::to_string(http.status),
                        page_context(page) + ": " + string_utils::excerpt(http.body, ERROR_BODY_EXCERPT)
                    )
                );
            }

            auto page_ids = parse_issue_page(http.body, page);
            if (page_ids.is_err()) {
                return Result<IssueSet, Error>::failure(page_ids.error());
            }

            ids.insert(page_ids.value().begin(), page_ids.value().end());

            if (progress) {
                progress(PageProgress{page, page_ids.value().size(), ids.size()});
            }

            next = http.link_header ? parse_next_link(*http.link_header) : std::nullopt;
        }

        return Result<IssueSet, Error>::success(std::move(ids));
    }

}  // namespace cta::tracker
