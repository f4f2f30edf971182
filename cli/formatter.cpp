//
// Created by gregorian-rayne on 10/14/26.
//

#include "cta/cli/formatter.hpp"
#include "cta/cli/progress.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace cta::cli
{
    // ============================================================================
    // Colors
    // ============================================================================

    namespace colors {

        static bool g_colors_enabled = true;

        const char* RESET = "\033[0m";
        const char* BOLD = "\033[1m";
        const char* DIM = "\033[2m";

        const char* RED = "\033[31m";
        const char* GREEN = "\033[32m";
        const char* YELLOW = "\033[33m";
        const char* CYAN = "\033[36m";

        bool enabled() {
            return g_colors_enabled && is_tty();
        }

        void set_enabled(const bool enable) {
            g_colors_enabled = enable;
        }

    }  // namespace colors

    // ============================================================================
    // Formatting Functions
    // ============================================================================

    std::string colorize(const std::string_view text, const char* color) {
        if (!colors::enabled()) {
            return std::string(text);
        }
        return std::string(color) + std::string(text) + colors::RESET;
    }

    std::string format_count(const std::size_t count) {
        std::string result = std::to_string(count);

        // Add comma separators
        int insert_pos = static_cast<int>(result.length()) - 3;
        while (insert_pos > 0) {
            result.insert(static_cast<std::size_t>(insert_pos), ",");
            insert_pos -= 3;
        }

        return result;
    }

    std::string format_timestamp(const Timestamp ts) {
        const auto time_t_val = std::chrono::system_clock::to_time_t(ts);
        std::tm time_info{};
        localtime_r(&time_t_val, &time_info);

        std::ostringstream ss;
        ss << std::put_time(&time_info, "%Y-%m-%d %H:%M:%S");
        return ss.str();
    }

}  // namespace cta::cli
