//
// Created by gregorian-rayne on 10/2/26.
//

#ifndef CRASHTESTAUDIT_ERROR_HPP
#define CRASHTESTAUDIT_ERROR_HPP

/**
 * @file error.hpp
 * @brief Error types for the crash test audit.
 *
 * Every fallible operation returns Result<T, Error>. An Error carries a
 * category, a human readable message and an optional context string that
 * identifies the failing operation (a path, a commit hash, a page number).
 *
 * Error categories:
 * - InvalidArgument: a value supplied by the caller is malformed
 * - NotFound: a file or object does not exist
 * - ParseError: input data could not be decoded
 * - IoError: file system operation failed
 * - ConfigError: configuration or command line validation failed
 * - RepositoryError: the repository could not be opened or read
 * - TrackerError: fetching open issues from the tracker failed
 * - InternalError: unexpected internal error
 *
 * A filename or commit message that does not follow the crash test naming
 * convention is not an error; the extractors return std::nullopt instead.
 *
 * Usage:
 * @code
 *     auto scan = git::scan_deletions(repo, options);
 *     if (scan.is_err()) {
 *         std::cerr << scan.error() << std::endl;
 *         // Output: [RepositoryError] Not a git repository (context: /tmp/x)
 *     }
 * @endcode
 */

#include <string>
#include <optional>
#include <ostream>
#include <utility>

namespace cta {

    /**
     * Error category enumeration.
     */
    enum class ErrorCode {
        None,             ///< No error
        InvalidArgument,  ///< Invalid argument or parameter
        NotFound,         ///< Resource not found
        ParseError,       ///< Parsing failed
        IoError,          ///< I/O operation failed
        ConfigError,      ///< Configuration or usage error
        RepositoryError,  ///< Repository could not be opened or read
        TrackerError,     ///< Issue tracker fetch failed
        InternalError     ///< Internal/unexpected error
    };

    /**
     * Converts an ErrorCode to its string representation.
     */
    inline const char* error_code_to_string(ErrorCode code) noexcept {
        switch (code) {
            case ErrorCode::None:            return "None";
            case ErrorCode::InvalidArgument: return "InvalidArgument";
            case ErrorCode::NotFound:        return "NotFound";
            case ErrorCode::ParseError:      return "ParseError";
            case ErrorCode::IoError:         return "IoError";
            case ErrorCode::ConfigError:     return "ConfigError";
            case ErrorCode::RepositoryError: return "RepositoryError";
            case ErrorCode::TrackerError:    return "TrackerError";
            case ErrorCode::InternalError:   return "InternalError";
        }
        return "Unknown";
    }

    /**
     * Structured error with code, message, and optional context.
     *
     * Errors are immutable; with_context() returns a new Error.
     */
    class Error {
    public:
        Error(ErrorCode code, std::string message)
            : code_(code)
            , message_(std::move(message))
            , context_(std::nullopt) {}

        Error(ErrorCode code, std::string message, std::string context)
            : code_(code)
            , message_(std::move(message))
            , context_(std::move(context)) {}

        static Error invalid_argument(std::string message) {
            return {ErrorCode::InvalidArgument, std::move(message)};
        }

        static Error invalid_argument(std::string message, std::string context) {
            return {ErrorCode::InvalidArgument, std::move(message), std::move(context)};
        }

        static Error not_found(std::string message) {
            return {ErrorCode::NotFound, std::move(message)};
        }

        static Error not_found(std::string message, std::string context) {
            return {ErrorCode::NotFound, std::move(message), std::move(context)};
        }

        static Error parse_error(std::string message) {
            return {ErrorCode::ParseError, std::move(message)};
        }

        static Error parse_error(std::string message, std::string context) {
            return {ErrorCode::ParseError, std::move(message), std::move(context)};
        }

        static Error io_error(std::string message) {
            return {ErrorCode::IoError, std::move(message)};
        }

        static Error io_error(std::string message, std::string context) {
            return {ErrorCode::IoError, std::move(message), std::move(context)};
        }

        static Error config_error(std::string message) {
            return {ErrorCode::ConfigError, std::move(message)};
        }

        static Error config_error(std::string message, std::string context) {
            return {ErrorCode::ConfigError, std::move(message), std::move(context)};
        }

        /**
         * Creates a repository error (unopenable repository, unreadable
         * tree or diff, malformed commit data).
         */
        static Error repository_error(std::string message) {
            return {ErrorCode::RepositoryError, std::move(message)};
        }

        static Error repository_error(std::string message, std::string context) {
            return {ErrorCode::RepositoryError, std::move(message), std::move(context)};
        }

        /**
         * Creates a tracker error (transport failure, bad credential,
         * pagination failure).
         */
        static Error tracker_error(std::string message) {
            return {ErrorCode::TrackerError, std::move(message)};
        }

        static Error tracker_error(std::string message, std::string context) {
            return {ErrorCode::TrackerError, std::move(message), std::move(context)};
        }

        static Error internal_error(std::string message) {
            return {ErrorCode::InternalError, std::move(message)};
        }

        static Error internal_error(std::string message, std::string context) {
            return {ErrorCode::InternalError, std::move(message), std::move(context)};
        }

        [[nodiscard]] ErrorCode code() const noexcept {
            return code_;
        }

        [[nodiscard]] const std::string& message() const noexcept {
            return message_;
        }

        [[nodiscard]] const std::optional<std::string>& context() const noexcept {
            return context_;
        }

        [[nodiscard]] bool has_context() const noexcept {
            return context_.has_value();
        }

        /**
         * Returns a copy of this error with additional context appended.
         *
         * Existing context is kept and joined with "; ".
         */
        [[nodiscard]] Error with_context(std::string additional_context) const {
            if (context_.has_value()) {
                return {code_, message_, *context_ + "; " + std::move(additional_context)};
            }
            return {code_, message_, std::move(additional_context)};
        }

        /**
         * Formats the error as "[Code] message" or
         * "[Code] message (context: ...)".
         */
        [[nodiscard]] std::string to_string() const {
            std::string result = "[";
            result += error_code_to_string(code_);
            result += "] ";
            result += message_;
            if (context_.has_value()) {
                result += " (context: ";
                result += *context_;
                result += ")";
            }
            return result;
        }

        bool operator==(const Error& other) const {
            return code_ == other.code_ &&
                   message_ == other.message_ &&
                   context_ == other.context_;
        }

        bool operator!=(const Error& other) const {
            return !(*this == other);
        }

    private:
        ErrorCode code_;
        std::string message_;
        std::optional<std::string> context_;
    };

    inline std::ostream& operator<<(std::ostream& os, const Error& error) {
        return os << error.to_string();
    }

    inline std::ostream& operator<<(std::ostream& os, ErrorCode code) {
        return os << error_code_to_string(code);
    }

}  // namespace cta

#endif //CRASHTESTAUDIT_ERROR_HPP
