//
// Created by gregorian-rayne on 10/12/26.
//

#include "cta/config/config.hpp"
#include "cta/utils/string_utils.hpp"

#include <toml++/toml.h>

#include <fstream>
#include <sstream>
#include <vector>

namespace cta::config
{
    namespace {

        /**
         * Collects the first type error found while reading a table.
         */
        class SectionReader {
        public:
            SectionReader(const toml::table* table, std::string name, std::vector<std::string>& errors)
                : table_(table)
                , name_(std::move(name))
                , errors_(errors) {}

            void read(const std::string_view key, std::string& out) const {
                const toml::node* node = find(key);
                if (node == nullptr) return;
                if (const auto value = node->value<std::string>(); node->is_string() && value) {
                    out = *value;
                } else {
                    errors_.push_back(qualified(key) + " must be a string");
                }
            }

            void read(const std::string_view key, long long& out) const {
                const toml::node* node = find(key);
                if (node == nullptr) return;
                if (const auto value = node->value<std::int64_t>(); node->is_integer() && value) {
                    out = static_cast<long long>(*value);
                } else {
                    errors_.push_back(qualified(key) + " must be an integer");
                }
            }

        private:
            [[nodiscard]] const toml::node* find(const std::string_view key) const {
                return table_ == nullptr ? nullptr : table_->get(key);
            }

            [[nodiscard]] std::string qualified(const std::string_view key) const {
                return name_ + "." + std::string(key);
            }

            const toml::table* table_;
            std::string name_;
            std::vector<std::string>& errors_;
        };

        const toml::table* section(const toml::table& root, const std::string& name, std::vector<std::string>& errors) {
            const toml::node* node = root.get(name);
            if (node == nullptr) {
                return nullptr;
            }
            if (!node->is_table()) {
                errors.push_back("[" + name + "] must be a table");
                return nullptr;
            }
            return node->as_table();
        }

        std::string join(const std::vector<std::string>& parts, const std::string_view sep) {
            std::string out;
            for (std::size_t i = 0; i < parts.size(); ++i) {
                if (i > 0) out += sep;
                out += parts[i];
            }
            return out;
        }

        void require_non_empty(const std::string& value, const std::string_view key, std::vector<std::string>& errors) {
            if (string_utils::trim(value).empty()) {
                errors.push_back(std::string(key) + " must not be empty");
            }
        }

    }  // namespace

    Result<AuditConfig, Error> AuditConfig::load_from_file(const fs::path& path) {
        std::ifstream file(path);
        if (!file) {
            return Result<AuditConfig, Error>::failure(
                Error::not_found("Configuration file not found", path.string())
            );
        }

        std::ostringstream buffer;
        buffer << file.rdbuf();

        auto config = load_from_string(buffer.str());
        if (config.is_err()) {
            return Result<AuditConfig, Error>::failure(config.error().with_context(path.string()));
        }
        return config;
    }

    Result<AuditConfig, Error> AuditConfig::load_from_string(const std::string& content) {
        try {
            const toml::table tbl = toml::parse(content);
            AuditConfig config;
            std::vector<std::string> errors;

            const SectionReader repository(section(tbl, "repository", errors), "repository", errors);
            repository.read("crash_dir", config.repository.crash_dir);
            repository.read("file_pattern", config.repository.file_pattern);

            const SectionReader tracker(section(tbl, "tracker", errors), "tracker", errors);
            tracker.read("api_url", config.tracker.api_url);
            tracker.read("web_url", config.tracker.web_url);
            tracker.read("owner", config.tracker.owner);
            tracker.read("repo", config.tracker.repo);
            tracker.read("per_page", config.tracker.per_page);
            tracker.read("timeout_seconds", config.tracker.timeout_seconds);

            const SectionReader cache(section(tbl, "cache", errors), "cache", errors);
            cache.read("directory", config.cache.directory);
            cache.read("file", config.cache.file);

            if (!errors.empty()) {
                return Result<AuditConfig, Error>::failure(
                    Error::config_error("Invalid configuration:\n  " + join(errors, "\n  "))
                );
            }

            if (auto validation_result = config.validate(); validation_result.is_err()) {
                return Result<AuditConfig, Error>::failure(validation_result.error());
            }

            return Result<AuditConfig, Error>::success(std::move(config));

        } catch (const toml::parse_error& err) {
            return Result<AuditConfig, Error>::failure(
                Error::config_error("Failed to parse TOML configuration: " + std::string(err.description()))
            );
        }
    }

    AuditConfig AuditConfig::default_config() {
        return AuditConfig{};
    }

    Result<void, Error> AuditConfig::validate() const {
        std::vector<std::string> errors;

        require_non_empty(repository.crash_dir, "repository.crash_dir", errors);
        require_non_empty(repository.file_pattern, "repository.file_pattern", errors);
        require_non_empty(tracker.api_url, "tracker.api_url", errors);
        require_non_empty(tracker.web_url, "tracker.web_url", errors);
        require_non_empty(tracker.owner, "tracker.owner", errors);
        require_non_empty(tracker.repo, "tracker.repo", errors);
        require_non_empty(cache.directory, "cache.directory", errors);
        require_non_empty(cache.file, "cache.file", errors);

        const fs::path crash_dir(repository.crash_dir);
        if (crash_dir.is_absolute()) {
            errors.emplace_back("repository.crash_dir must be relative to the repository root");
        }
        for (const auto& part : crash_dir) {
            if (part == "..") {
                errors.emplace_back("repository.crash_dir must not contain '..'");
                break;
            }
        }

        if (tracker.per_page < 1 || tracker.per_page > 100) {
            errors.emplace_back("tracker.per_page must be between 1 and 100");
        }

        if (tracker.timeout_seconds <= 0) {
            errors.emplace_back("tracker.timeout_seconds must be positive");
        }

        if (!errors.empty()) {
            return Result<void, Error>::failure(
                Error::config_error("Configuration validation failed:\n  " + join(errors, "\n  "))
            );
        }

        return Result<void, Error>::success();
    }

    std::string AuditConfig::to_string() const {
        std::ostringstream ss;

        ss << "[repository]\n";
        ss << "crash_dir = \"" << repository.crash_dir << "\"\n";
        ss << "file_pattern = \"" << repository.file_pattern << "\"\n\n";

        ss << "[tracker]\n";
        ss << "api_url = \"" << tracker.api_url << "\"\n";
        ss << "web_url = \"" << tracker.web_url << "\"\n";
        ss << "owner = \"" << tracker.owner << "\"\n";
        ss << "repo = \"" << tracker.repo << "\"\n";
        ss << "per_page = " << tracker.per_page << "\n";
        ss << "timeout_seconds = " << tracker.timeout_seconds << "\n\n";

        ss << "[cache]\n";
        ss << "directory = \"" << cache.directory << "\"\n";
        ss << "file = \"" << cache.file << "\"\n";

        return ss.str();
    }

    std::string AuditConfig::pathspec() const {
        std::string dir = repository.crash_dir;
        while (!dir.empty() && dir.back() == '/') {
            dir.pop_back();
        }
        return dir + "/" + repository.file_pattern;
    }

    fs::path AuditConfig::cache_path() const {
        return fs::path(cache.directory) / cache.file;
    }

}  // namespace cta::config
