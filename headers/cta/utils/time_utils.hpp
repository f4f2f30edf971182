//
// Created by gregorian-rayne on 10/3/26.
//

#ifndef CRASHTESTAUDIT_TIME_UTILS_HPP
#define CRASHTESTAUDIT_TIME_UTILS_HPP

/**
 * @file time_utils.hpp
 * @brief Timestamp formatting and parsing for the snapshot cache.
 */

#include "cta/result.hpp"
#include "cta/types.hpp"

#include <string>
#include <string_view>

namespace cta::time_utils {

    /**
     * Formats a timestamp as RFC 3339 UTC with second precision,
     * e.g. "2024-01-15T10:30:00Z".
     */
    [[nodiscard]] std::string format_rfc3339(Timestamp ts);

    /**
     * Parses an RFC 3339 timestamp.
     *
     * Accepts optional fractional seconds and either "Z" or a numeric
     * "+HH:MM"/"-HH:MM" offset.
     */
    [[nodiscard]] Result<Timestamp, Error> parse_rfc3339(std::string_view text);

    /**
     * Formats an age for staleness reporting: "1 second", "5 minutes",
     * "3 hours", "2 days". Negative ages are treated as zero.
     */
    [[nodiscard]] std::string format_age(Duration age);

}  // namespace cta::time_utils

#endif //CRASHTESTAUDIT_TIME_UTILS_HPP
