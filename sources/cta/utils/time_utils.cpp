//
// Created by gregorian-rayne on 10/3/26.
//

#include "cta/utils/time_utils.hpp"
#include "cta/utils/string_utils.hpp"

#include <iomanip>
#include <sstream>

namespace cta::time_utils
{
    namespace {

        std::optional<int> two_digits(const std::string_view text, const std::size_t pos) {
            if (pos + 2 > text.size()) {
                return std::nullopt;
            }
            const auto value = string_utils::parse_uint64(text.substr(pos, 2));
            if (!value) {
                return std::nullopt;
            }
            return static_cast<int>(*value);
        }

        std::string plural(const long long count, const std::string_view unit) {
            std::string out = std::to_string(count);
            out += ' ';
            out += unit;
            if (count != 1) {
                out += 's';
            }
            return out;
        }

        Result<Timestamp, Error> malformed(const std::string_view text) {
            return Result<Timestamp, Error>::failure(
                Error::parse_error("Malformed RFC 3339 timestamp", std::string(text))
            );
        }

    }  // namespace

    std::string format_rfc3339(const Timestamp ts) {
        using namespace std::chrono;

        const auto secs = floor<seconds>(ts);
        const auto day_point = floor<days>(secs);
        const year_month_day ymd{day_point};
        const hh_mm_ss hms{secs - day_point};

        std::ostringstream ss;
        ss << std::setfill('0')
           << std::setw(4) << static_cast<int>(ymd.year()) << '-'
           << std::setw(2) << static_cast<unsigned>(ymd.month()) << '-'
           << std::setw(2) << static_cast<unsigned>(ymd.day()) << 'T'
           << std::setw(2) << hms.hours().count() << ':'
           << std::setw(2) << hms.minutes().count() << ':'
           << std::setw(2) << hms.seconds().count() << 'Z';
        return ss.str();
    }

    Result<Timestamp, Error> parse_rfc3339(const std::string_view text) {
        using namespace std::chrono;

        if (text.size() < 20) {
            return malformed(text);
        }

        auto date = CalendarDate::parse(text.substr(0, 10));
        if (date.is_err()) {
            return malformed(text);
        }

        if (const char sep = text[10]; sep != 'T' && sep != 't' && sep != ' ') {
            return malformed(text);
        }

        const auto hour = two_digits(text, 11);
        const auto minute = two_digits(text, 14);
        const auto second = two_digits(text, 17);
        if (!hour || !minute || !second || text[13] != ':' || text[16] != ':' ||
            *hour > 23 || *minute > 59 || *second > 60) {
            return malformed(text);
        }

        std::size_t pos = 19;
        if (pos < text.size() && text[pos] == '.') {
            ++pos;
            const std::size_t frac_start = pos;
            while (pos < text.size() && string_utils::is_ascii_digit(text[pos])) {
                ++pos;
            }
            if (pos == frac_start) {
                return malformed(text);
            }
        }

        if (pos >= text.size()) {
            return malformed(text);
        }

        seconds offset{0};
        if (const char zone = text[pos]; zone == 'Z' || zone == 'z') {
            ++pos;
        } else if (zone == '+' || zone == '-') {
            const auto off_h = two_digits(text, pos + 1);
            const auto off_m = two_digits(text, pos + 4);
            if (!off_h || !off_m || pos + 3 >= text.size() || text[pos + 3] != ':') {
                return malformed(text);
            }
            offset = hours{*off_h} + minutes{*off_m};
            if (zone == '-') {
                offset = -offset;
            }
            pos += 6;
        } else {
            return malformed(text);
        }

        if (pos != text.size()) {
            return malformed(text);
        }

        const sys_seconds local = sys_days{date.value().ymd} +
                                  hours{*hour} + minutes{*minute} + seconds{*second};
        return Result<Timestamp, Error>::success(time_point_cast<Timestamp::duration>(local - offset));
    }

    std::string format_age(const Duration age) {
        const auto secs = std::max<long long>(
            0, std::chrono::duration_cast<std::chrono::seconds>(age).count()
        );

        if (secs < 60) {
            return plural(secs, "second");
        }
        if (secs < 3600) {
            return plural(secs / 60, "minute");
        }
        if (secs < 86400) {
            return plural(secs / 3600, "hour");
        }
        return plural(secs / 86400, "day");
    }

}  // namespace cta::time_utils
