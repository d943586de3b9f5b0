/**
 * @file logger.hpp
 * @brief Logging utilities wrapping spdlog
 *
 * The library logs through a single named spdlog logger. It is created on
 * first use with a console sink unless initLogging() ran earlier.
 */

#pragma once

#include <spdlog/spdlog.h>
#include <memory>
#include <string>

namespace uuidkit {

struct LogConfig;

/// Initialize logging with a console sink (call once at startup)
void initLogging(const std::string& appName, spdlog::level::level_enum level = spdlog::level::info);

/// Initialize logging from a LogConfig, adding a rotating file sink if configured
void initLogging(const LogConfig& config);

/// Get the library logger
std::shared_ptr<spdlog::logger> getLogger();

/// Set log level at runtime
void setLogLevel(spdlog::level::level_enum level);

} // namespace uuidkit

#define UUIDKIT_LOG_TRACE(...)    SPDLOG_LOGGER_TRACE(uuidkit::getLogger(), __VA_ARGS__)
#define UUIDKIT_LOG_DEBUG(...)    SPDLOG_LOGGER_DEBUG(uuidkit::getLogger(), __VA_ARGS__)
#define UUIDKIT_LOG_INFO(...)     SPDLOG_LOGGER_INFO(uuidkit::getLogger(), __VA_ARGS__)
#define UUIDKIT_LOG_WARN(...)     SPDLOG_LOGGER_WARN(uuidkit::getLogger(), __VA_ARGS__)
#define UUIDKIT_LOG_ERROR(...)    SPDLOG_LOGGER_ERROR(uuidkit::getLogger(), __VA_ARGS__)
#define UUIDKIT_LOG_CRITICAL(...) SPDLOG_LOGGER_CRITICAL(uuidkit::getLogger(), __VA_ARGS__)
