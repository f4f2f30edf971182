//
// Created by gregorian-rayne on 10/14/26.
//

#include "cta/cli/progress.hpp"

#include <iostream>

#include <unistd.h>

namespace cta::cli
{
    bool is_tty() {
        return isatty(fileno(stdout)) != 0;
    }

    bool is_stderr_tty() {
        return isatty(fileno(stderr)) != 0;
    }

    // ============================================================================
    // Spinner Implementation
    // ============================================================================

    Spinner::Spinner(const std::string_view message, const bool enabled)
        : message_(message)
        , enabled_(enabled)
        , is_tty_(is_stderr_tty())
    {
        if (!enabled_) {
            stopped_ = true;
            return;
        }
        if (is_tty_) {
            render();
        } else {
            std::cerr << message_ << "...\n";
        }
    }

    Spinner::~Spinner() {
        if (!stopped_) {
            stop();
        }
    }

    void Spinner::tick() {
        if (stopped_) return;
        frame_ = (frame_ + 1) % FRAME_COUNT;
        if (is_tty_) {
            render();
        }
    }

    void Spinner::set_message(const std::string_view msg) {
        message_ = msg;
        if (stopped_) return;
        if (is_tty_) {
            render();
        } else {
            std::cerr << "  " << message_ << "\n";
        }
    }

    void Spinner::success(const std::string_view msg) {
        if (stopped_) return;
        stopped_ = true;
        if (is_tty_) {
            clear_line();
            std::cerr << "\r✓ " << message_;
            if (!msg.empty() && msg != "Done") {
                std::cerr << ": " << msg;
            }
            std::cerr << "\n" << std::flush;
        } else {
            std::cerr << message_ << ": " << msg << "\n";
        }
    }

    void Spinner::fail(const std::string_view msg) {
        if (stopped_) return;
        stopped_ = true;
        if (is_tty_) {
            clear_line();
            std::cerr << "\r✗ " << message_;
            if (!msg.empty()) {
                std::cerr << ": " << msg;
            }
            std::cerr << "\n" << std::flush;
        } else {
            std::cerr << message_ << ": " << msg << "\n";
        }
    }

    void Spinner::stop() {
        if (stopped_) return;
        stopped_ = true;
        if (is_tty_) {
            clear_line();
            std::cerr << "\r" << std::flush;
        }
    }

    void Spinner::render() const {
        clear_line();
        std::cerr << "\r" << FRAMES[frame_] << " " << message_ << std::flush;
    }

    void Spinner::clear_line() {
        std::cerr << "\r\033[K";
    }

}  // namespace cta::cli
