//
// Created by gregorian-rayne on 10/12/26.
//

#ifndef CTA_CONFIG_HPP
#define CTA_CONFIG_HPP

/**
 * @file config.hpp
 * @brief TOML configuration of the audit.
 *
 * Every key is optional; a missing file means all defaults.
 *
 * @code
 * [repository]
 * crash_dir = "tests/crashes"
 * file_pattern = "*.rs"
 *
 * [tracker]
 * api_url = "https://api.github.com"
 * web_url = "https://github.com"
 * owner = "rust-lang"
 * repo = "rust"
 * per_page = 100
 * timeout_seconds = 30
 *
 * [cache]
 * directory = ".cache"
 * file = "open_issues.json"
 * @endcode
 */

#include "cta/result.hpp"
#include "cta/error.hpp"
#include "cta/types.hpp"

#include <string>

namespace cta::config
{
    /**
     * Default configuration file looked up in the working directory.
     */
    inline constexpr auto DEFAULT_CONFIG_FILE = ".cta.toml";

    struct RepositoryConfig {
        std::string crash_dir = "tests/crashes";
        std::string file_pattern = "*.rs";
    };

    struct TrackerConfig {
        std::string api_url = "https://api.github.com";
        std::string web_url = "https://github.com";
        std::string owner = "rust-lang";
        std::string repo = "rust";
        long long per_page = 100;
        long long timeout_seconds = 30;
    };

    struct CacheConfig {
        std::string directory = ".cache";
        std::string file = "open_issues.json";
    };

    class AuditConfig {
    public:
        RepositoryConfig repository;
        TrackerConfig tracker;
        CacheConfig cache;

        /**
         * Loads and validates a configuration file.
         *
         * @return NotFound for a missing file, ConfigError for a parse or
         *         validation failure.
         */
        static Result<AuditConfig, Error> load_from_file(const fs::path& path);

        static Result<AuditConfig, Error> load_from_string(const std::string& content);

        static AuditConfig default_config();

        [[nodiscard]] Result<void, Error> validate() const;

        /**
         * Renders the configuration back to TOML.
         */
        [[nodiscard]] std::string to_string() const;

        /**
         * Git pathspec of the monitored files, "<crash_dir>/<file_pattern>".
         */
        [[nodiscard]] std::string pathspec() const;

        [[nodiscard]] fs::path cache_path() const;
    };

}  // namespace cta::config

#endif //CTA_CONFIG_HPP
