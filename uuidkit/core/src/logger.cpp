/**
 * @file logger.cpp
 * @brief Logger implementation
 */

#include <uuidkit/core/logger.hpp>
#include <uuidkit/core/config.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <iostream>
#include <mutex>
#include <vector>

namespace uuidkit {

namespace {

std::mutex s_mutex;
std::shared_ptr<spdlog::logger> s_logger;

std::shared_ptr<spdlog::logger> makeLogger(const LogConfig& config) {
    std::vector<spdlog::sink_ptr> sinks;

    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console_sink->set_level(config.level);
    sinks.push_back(console_sink);

    if (!config.file.empty()) {
        try {
            auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                config.file, config.maxFileSize, config.maxFiles);
            file_sink->set_level(config.level);
            sinks.push_back(file_sink);
        } catch (const spdlog::spdlog_ex& ex) {
            std::cerr << "Log file " << config.file << " unavailable: " << ex.what() << std::endl;
        }
    }

    auto logger = std::make_shared<spdlog::logger>(config.name, sinks.begin(), sinks.end());
    logger->set_level(config.level);
    logger->set_pattern(config.pattern);

    return logger;
}

} // anonymous namespace

void initLogging(const std::string& appName, spdlog::level::level_enum level) {
    LogConfig config;
    config.name = appName;
    config.level = level;
    initLogging(config);
}

void initLogging(const LogConfig& config) {
    auto logger = makeLogger(config);

    std::lock_guard<std::mutex> lock(s_mutex);
    s_logger = std::move(logger);
}

std::shared_ptr<spdlog::logger> getLogger() {
    std::lock_guard<std::mutex> lock(s_mutex);
    if (!s_logger) {
        s_logger = makeLogger(LogConfig{});
    }
    return s_logger;
}

void setLogLevel(spdlog::level::level_enum level) {
    std::lock_guard<std::mutex> lock(s_mutex);
    if (s_logger) {
        s_logger->set_level(level);
        for (auto& sink : s_logger->sinks()) {
            sink->set_level(level);
        }
    }
}

} // namespace uuidkit
