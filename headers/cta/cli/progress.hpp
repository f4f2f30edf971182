//
// Created by gregorian-rayne on 10/14/26.
//

#ifndef CTA_PROGRESS_HPP
#define CTA_PROGRESS_HPP

/**
 * @file progress.hpp
 * @brief Progress indicators for long running CLI steps.
 *
 * Indicators draw on stderr so that report output on stdout can be piped.
 * When stderr is not a terminal they degrade to plain lines.
 */

#include <string>
#include <string_view>

namespace cta::cli
{
    /**
     * Spinner for operations of unknown length (history scan, issue fetch).
     */
    class Spinner {
    public:
        explicit Spinner(std::string_view message, bool enabled = true);
        ~Spinner();

        Spinner(const Spinner&) = delete;
        Spinner& operator=(const Spinner&) = delete;

        /**
         * Advances the animation by one frame.
         */
        void tick();

        /**
         * Updates the status message; in non-TTY mode it is printed as a line.
         */
        void set_message(std::string_view msg);

        /**
         * Marks the operation as succeeded.
         */
        void success(std::string_view msg = "Done");

        /**
         * Marks the operation as failed.
         */
        void fail(std::string_view msg = "Failed");

        /**
         * Clears the spinner without a final status.
         */
        void stop();

    private:
        void render() const;
        static void clear_line();

        std::string message_;
        std::size_t frame_ = 0;
        bool enabled_ = true;
        bool stopped_ = false;
        bool is_tty_ = true;

        static constexpr const char* FRAMES[] = {"⠋", "⠙", "⠹", "⠸", "⠼", "⠴", "⠦", "⠧", "⠇", "⠏"};
        static constexpr std::size_t FRAME_COUNT = 10;
    };

    /**
     * Checks if stdout is a terminal.
     */
    [[nodiscard]] bool is_tty();

    /**
     * Checks if stderr is a terminal.
     */
    [[nodiscard]] bool is_stderr_tty();

}  // namespace cta::cli

#endif //CTA_PROGRESS_HPP
