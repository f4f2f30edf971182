//
// Created by gregorian-rayne on 10/2/26.
//

#include "cta/types.hpp"

#include <charconv>
#include <iomanip>
#include <sstream>

namespace cta
{
    namespace {

        bool parse_digits(const std::string_view text, int& out) {
            if (text.empty()) {
                return false;
            }
            for (const char c : text) {
                if (c < '0' || c > '9') {
                    return false;
                }
            }
            const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), out);
            return ec == std::errc{} && ptr == text.data() + text.size();
        }

    }  // namespace

    Result<CalendarDate, Error> CalendarDate::parse(const std::string_view text) {
        // YYYY-MM-DD
        if (text.size() != 10 || text[4] != '-' || text[7] != '-') {
            return Result<CalendarDate, Error>::failure(
                Error::invalid_argument("Date must use the YYYY-MM-DD format", std::string(text))
            );
        }

        int year = 0;
        int month = 0;
        int day = 0;
        if (!parse_digits(text.substr(0, 4), year) ||
            !parse_digits(text.substr(5, 2), month) ||
            !parse_digits(text.substr(8, 2), day)) {
            return Result<CalendarDate, Error>::failure(
                Error::invalid_argument("Date must use the YYYY-MM-DD format", std::string(text))
            );
        }

        const CalendarDate date = from_ymd(year, static_cast<unsigned>(month), static_cast<unsigned>(day));
        if (!date.ymd.ok()) {
            return Result<CalendarDate, Error>::failure(
                Error::invalid_argument("Not a valid calendar date", std::string(text))
            );
        }
        return Result<CalendarDate, Error>::success(date);
    }

    CalendarDate CalendarDate::from_ymd(const int year, const unsigned month, const unsigned day) {
        return CalendarDate{
            std::chrono::year_month_day{
                std::chrono::year{year},
                std::chrono::month{month},
                std::chrono::day{day}
            }
        };
    }

    CalendarDate CalendarDate::from_unix_seconds(const std::int64_t seconds) {
        const std::chrono::sys_seconds tp{std::chrono::seconds{seconds}};
        return CalendarDate{std::chrono::year_month_day{std::chrono::floor<std::chrono::days>(tp)}};
    }

    std::string CalendarDate::to_string() const {
        std::ostringstream ss;
        ss << std::setfill('0')
           << std::setw(4) << static_cast<int>(ymd.year()) << '-'
           << std::setw(2) << static_cast<unsigned>(ymd.month()) << '-'
           << std::setw(2) << static_cast<unsigned>(ymd.day());
        return ss.str();
    }

}  // namespace cta
