//
// Created by gregorian-rayne on 10/3/26.
//

#ifndef CRASHTESTAUDIT_STRING_UTILS_HPP
#define CRASHTESTAUDIT_STRING_UTILS_HPP

/**
 * @file string_utils.hpp
 * @brief String helpers shared by the git plumbing, the extractors and the
 * tracker client.
 */

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace cta::string_utils {

    inline std::string_view trim_left(std::string_view s) noexcept {
        const auto it = std::ranges::find_if(s, [](const unsigned char c) {
            return !std::isspace(c);
        });
        return s.substr(static_cast<std::size_t>(it - s.begin()));
    }

    inline std::string_view trim_right(std::string_view s) noexcept {
        const auto it = std::find_if(s.rbegin(), s.rend(), [](const unsigned char c) {
            return !std::isspace(c);
        });
        return s.substr(0, static_cast<std::size_t>(s.rend() - it));
    }

    inline std::string_view trim(const std::string_view s) noexcept {
        return trim_left(trim_right(s));
    }

    /**
     * Splits a string by a delimiter. Empty fields are kept.
     */
    inline std::vector<std::string_view> split(std::string_view s, const char delimiter) {
        std::vector<std::string_view> result;
        std::size_t start = 0;
        std::size_t end = s.find(delimiter);

        while (end != std::string_view::npos) {
            result.push_back(s.substr(start, end - start));
            start = end + 1;
            end = s.find(delimiter, start);
        }

        result.push_back(s.substr(start));
        return result;
    }

    inline bool starts_with(const std::string_view s, const std::string_view prefix) noexcept {
        return s.size() >= prefix.size() && s.substr(0, prefix.size()) == prefix;
    }

    inline bool contains(const std::string_view s, const std::string_view needle) noexcept {
        return s.find(needle) != std::string_view::npos;
    }

    inline std::string to_lower(const std::string_view s) {
        std::string result(s);
        std::ranges::transform(result, result.begin(),
                               [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return result;
    }

    inline bool is_ascii_digit(const char c) noexcept {
        return c >= '0' && c <= '9';
    }

    /**
     * Parses the whole of @p s as an unsigned 64-bit integer.
     *
     * Only ASCII digits are accepted: no sign, no whitespace, no radix
     * prefix. Values that overflow return std::nullopt.
     */
    inline std::optional<std::uint64_t> parse_uint64(const std::string_view s) noexcept {
        if (s.empty() || !std::ranges::all_of(s, is_ascii_digit)) {
            return std::nullopt;
        }
        std::uint64_t value = 0;
        const auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
        if (ec != std::errc{} || ptr != s.data() + s.size()) {
            return std::nullopt;
        }
        return value;
    }

    /**
     * Returns at most @p max_len characters of @p s, appending "..." when cut.
     */
    inline std::string excerpt(const std::string_view s, const std::size_t max_len) {
        if (s.size() <= max_len) {
            return std::string(s);
        }
        return std::string(s.substr(0, max_len)) + "...";
    }

}  // namespace cta::string_utils

#endif //CRASHTESTAUDIT_STRING_UTILS_HPP
