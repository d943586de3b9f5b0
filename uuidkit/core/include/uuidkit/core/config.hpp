/**
 * @file config.hpp
 * @brief Logging configuration loaded from JSON
 *
 * Example file:
 *
 *   {
 *     "name": "uuidkit",
 *     "level": "debug",
 *     "pattern": "[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v",
 *     "file": "uuidkit.log",
 *     "maxFileSize": 10485760,
 *     "maxFiles": 3
 *   }
 *
 * Every key is optional.
 */

#pragma once

#include <cstddef>
#include <string>
#include <nlohmann/json.hpp>
#include <spdlog/common.h>

#include "result.hpp"

namespace uuidkit {

struct LogConfig {
    std::string name = "uuidkit";
    spdlog::level::level_enum level = spdlog::level::info;
    std::string pattern = "[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v";

    /// Rotating log file; empty means console only
    std::string file;
    std::size_t maxFileSize = 10 * 1024 * 1024;
    std::size_t maxFiles = 3;

    /**
     * @brief Build a config from a JSON object
     *
     * Missing keys keep their defaults. Fails with InvalidArgument on a
     * non-object, a wrongly typed value or an unknown level name.
     */
    static Result<LogConfig> fromJson(const nlohmann::json& json);

    /**
     * @brief Load a config from a JSON file
     *
     * Fails with FileOpenFailed if the file cannot be read and InvalidData
     * if it is not valid JSON.
     */
    static Result<LogConfig> loadFromFile(const std::string& path);

    nlohmann::json toJson() const;
};

} // namespace uuidkit
