//
// Created by gregorian-rayne on 10/11/26.
//

#ifndef CTA_REPORT_RENDERER_HPP
#define CTA_REPORT_RENDERER_HPP

/**
 * @file report_renderer.hpp
 * @brief Text and JSON rendering of a classified audit.
 */

#include "cta/types.hpp"

#include <iosfwd>
#include <string>

namespace cta::report
{
    /**
     * Tracker details the report needs beyond the classification itself.
     */
    struct ReportContext {
        std::string owner = "rust-lang";
        std::string repo = "rust";
        std::string web_url = "https://github.com";
        std::size_t open_issue_total = 0;
        bool use_color = false;

        [[nodiscard]] std::string issue_url(IssueId id) const;
        [[nodiscard]] std::string tracker_name() const { return owner + "/" + repo; }
    };

    /**
     * Percentage of @p count in @p total with one decimal ("50.0"). A zero
     * total yields "0.0".
     */
    [[nodiscard]] std::string format_share(std::size_t count, std::size_t total);

    /**
     * Writes the human readable report:
     * 1. issues needing attention, with the issue URL
     * 2. partially cleaned issues and their remaining file counts
     * 3. summary with per-bucket percentages
     * 4. closing recommendation
     */
    void render_text_report(const AuditReport& report, const ReportContext& context, std::ostream& out);

    /**
     * Serializes the report as an indented JSON document.
     */
    [[nodiscard]] std::string render_json_report(const AuditReport& report, const ReportContext& context);

}  // namespace cta::report

#endif //CTA_REPORT_RENDERER_HPP
