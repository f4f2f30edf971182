//
// Created by gregorian-rayne on 10/3/26.
//

#ifndef CRASHTESTAUDIT_JSON_UTILS_HPP
#define CRASHTESTAUDIT_JSON_UTILS_HPP

/**
 * @file json_utils.hpp
 * @brief JSON helpers built on nlohmann/json.
 *
 * nlohmann/json reports failures with exceptions; these helpers convert them
 * into Result<T, Error> so callers stay exception free.
 */

#include "cta/result.hpp"
#include "cta/error.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <string_view>

namespace cta::json_utils {

    namespace fs = std::filesystem;
    using json = nlohmann::json;

    /**
     * Parses a JSON document held in memory.
     *
     * @param content The JSON text.
     * @param context Label used in the error context (a URL, a page number).
     */
    inline Result<json, Error> parse(const std::string_view content, const std::string& context = "") {
        try {
            return Result<json, Error>::success(json::parse(content));
        } catch (const json::parse_error& e) {
            return Result<json, Error>::failure(
                Error::parse_error("JSON parse error", context.empty() ? e.what() : context + ": " + e.what())
            );
        }
    }

    /**
     * Reads and parses a JSON file.
     */
    inline Result<json, Error> read_file(const fs::path& path) {
        if (std::error_code ec; !fs::exists(path, ec)) {
            return Result<json, Error>::failure(
                Error::not_found("JSON file not found", path.string())
            );
        }

        std::ifstream file(path);
        if (!file) {
            return Result<json, Error>::failure(
                Error::io_error("Failed to open JSON file", path.string())
            );
        }

        std::ostringstream buffer;
        buffer << file.rdbuf();
        if (file.bad()) {
            return Result<json, Error>::failure(
                Error::io_error("Failed to read JSON file", path.string())
            );
        }

        return parse(buffer.str(), path.string());
    }

    /**
     * Writes a JSON document, creating the parent directory if needed.
     *
     * @param indent Indentation level (-1 for compact output).
     */
    inline Result<void, Error> write_file(const fs::path& path, const json& data, const int indent = 2) {
        if (const auto parent = path.parent_path(); !parent.empty()) {
            std::error_code ec;
            fs::create_directories(parent, ec);
            if (ec) {
                return Result<void, Error>::failure(
                    Error::io_error("Failed to create directory", parent.string() + ": " + ec.message())
                );
            }
        }

        std::string text;
        try {
            text = data.dump(indent);
        } catch (const json::type_error& e) {
            return Result<void, Error>::failure(
                Error::internal_error("JSON serialization error", e.what())
            );
        }

        std::ofstream file(path, std::ios::out | std::ios::trunc);
        if (!file) {
            return Result<void, Error>::failure(
                Error::io_error("Failed to open file for writing", path.string())
            );
        }
        file << text << '\n';
        file.close();
        if (!file) {
            return Result<void, Error>::failure(
                Error::io_error("Failed to write JSON file", path.string())
            );
        }

        return Result<void, Error>::success();
    }

    /**
     * Reads a typed member of a JSON object.
     */
    template<typename T>
    Result<T, Error> get(const json& obj, const std::string& key) {
        if (!obj.is_object() || !obj.contains(key)) {
            return Result<T, Error>::failure(
                Error::not_found("JSON key not found", key)
            );
        }

        try {
            return Result<T, Error>::success(obj.at(key).get<T>());
        } catch (const json::exception& e) {
            return Result<T, Error>::failure(
                Error::parse_error("JSON type mismatch", key + ": " + e.what())
            );
        }
    }

}  // namespace cta::json_utils

#endif //CRASHTESTAUDIT_JSON_UTILS_HPP
