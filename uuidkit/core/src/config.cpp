/**
 * @file config.cpp
 * @brief LogConfig JSON loading
 */

#include <uuidkit/core/config.hpp>
#include <uuidkit/core/logger.hpp>
#include <cstdint>
#include <fstream>

namespace uuidkit {

namespace {

template<typename T>
void readKey(const nlohmann::json& json, const char* key, T& out) {
    if (json.contains(key)) {
        out = json.at(key).get<T>();
    }
}

/// Read a non-negative integer key; false if present but not one
bool readCount(const nlohmann::json& json, const char* key, std::size_t& out) {
    if (!json.contains(key)) {
        return true;
    }
    const auto& value = json.at(key);
    if (!value.is_number_integer()) {
        return false;
    }
    if (!value.is_number_unsigned() && value.get<int64_t>() < 0) {
        return false;
    }
    out = value.get<std::size_t>();
    return true;
}

} // anonymous namespace

Result<LogConfig> LogConfig::fromJson(const nlohmann::json& json) {
    if (!json.is_object()) {
        return Err<LogConfig>(ErrorCode::InvalidArgument,
                              "Log config must be a JSON object, got " + std::string(json.type_name()));
    }

    LogConfig config;
    try {
        readKey(json, "name", config.name);
        readKey(json, "pattern", config.pattern);
        readKey(json, "file", config.file);
        if (!readCount(json, "maxFileSize", config.maxFileSize)) {
            return Err<LogConfig>(ErrorCode::InvalidArgument, "maxFileSize must be a non-negative integer");
        }
        if (!readCount(json, "maxFiles", config.maxFiles)) {
            return Err<LogConfig>(ErrorCode::InvalidArgument, "maxFiles must be a non-negative integer");
        }

        if (json.contains("level")) {
            const auto levelName = json.at("level").get<std::string>();
            const auto level = spdlog::level::from_str(levelName);
            // from_str maps unknown names to off
            if (level == spdlog::level::off && levelName != "off") {
                return Err<LogConfig>(ErrorCode::InvalidArgument, "Unknown log level: " + levelName);
            }
            config.level = level;
        }
    } catch (const nlohmann::json::exception& e) {
        return Err<LogConfig>(ErrorCode::InvalidArgument, std::string("Invalid log config: ") + e.what());
    }

    return config;
}

Result<LogConfig> LogConfig::loadFromFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        UUIDKIT_LOG_ERROR("Failed to open config file: {}", path);
        return Err<LogConfig>(ErrorCode::FileOpenFailed, "Failed to open config file: " + path);
    }

    nlohmann::json json;
    try {
        file >> json;
    } catch (const nlohmann::json::exception& e) {
        UUIDKIT_LOG_ERROR("Failed to parse config file: {} - {}", path, e.what());
        return Err<LogConfig>(ErrorCode::InvalidData, "Failed to parse config file: " + std::string(e.what()));
    }

    return fromJson(json);
}

nlohmann::json LogConfig::toJson() const {
    const auto levelName = spdlog::level::to_string_view(level);
    return {
        {"name", name},
        {"level", std::string(levelName.data(), levelName.size())},
        {"pattern", pattern},
        {"file", file},
        {"maxFileSize", maxFileSize},
        {"maxFiles", maxFiles}
    };
}

} // namespace uuidkit
