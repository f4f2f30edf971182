//
// Created by gregorian-rayne on 10/14/26.
//

#ifndef CTA_FORMATTER_HPP
#define CTA_FORMATTER_HPP

/**
 * @file formatter.hpp
 * @brief Output formatting utilities for CLI.
 *
 * Provides consistent formatting for:
 * - Colors and styles
 * - Counts and timestamps
 */

#include "cta/types.hpp"

#include <string>
#include <string_view>

namespace cta::cli
{
    /**
     * Terminal color codes.
     */
    namespace colors {

        extern const char* RESET;
        extern const char* BOLD;
        extern const char* DIM;

        extern const char* RED;
        extern const char* GREEN;
        extern const char* YELLOW;
        extern const char* CYAN;

        /**
         * Returns true if colors should be used.
         */
        bool enabled();

        /**
         * Enable/disable colors globally.
         */
        void set_enabled(bool enable);

    }  // namespace colors

    /**
     * Wraps text in a color code when colors are enabled.
     */
    [[nodiscard]] std::string colorize(std::string_view text, const char* color);

    /**
     * Formats a count with comma separators.
     */
    [[nodiscard]] std::string format_count(std::size_t count);

    /**
     * Formats a timestamp in local time ("2024-01-15 10:30:00").
     */
    [[nodiscard]] std::string format_timestamp(Timestamp ts);

}  // namespace cta::cli

#endif //CTA_FORMATTER_HPP
