#pragma once

/// @file logging.h
/// @brief Process logger built on spdlog
///
/// One named logger serves the whole process. It is created lazily with
/// console output on stderr and can be replaced at any time with
/// ConfigureLogging(), which the CLI does once the configuration is loaded.

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <absl/status/status.h>
#include <absl/status/statusor.h>
#include <spdlog/spdlog.h>

#include "common/config.h"

namespace sentinel {

enum class LogLevel {
    kTrace,
    kDebug,
    kInfo,
    kWarn,
    kError,
    kCritical,
    kOff
};

/// @brief Parse a level name, case-insensitively; "warning" is accepted for kWarn
absl::StatusOr<LogLevel> ParseLogLevel(std::string_view name);

std::string_view LogLevelName(LogLevel level);

/// @brief Where console output goes
enum class ConsoleTarget {
    kStdout,
    kStderr,
    kNone
};

struct LogConfig {
    std::string name = "sentinel";
    LogLevel level = LogLevel::kInfo;
    std::string pattern = "[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v";

    /// JSON reports go to stdout, so logs default to stderr
    ConsoleTarget console = ConsoleTarget::kStderr;

    /// Rotating log file; empty disables it
    std::string file_path;
    size_t max_file_bytes = 10 * 1024 * 1024;
    size_t max_files = 5;

    /// @brief Read the logging section (level, file, pattern, max_file_bytes, max_files)
    static absl::StatusOr<LogConfig> FromConfig(const Config& config);
};

/// @brief Replace the process logger
///
/// Extra sinks receive every record alongside the configured ones. Fails if
/// the log file cannot be opened; the previous logger stays in place then.
absl::Status ConfigureLogging(const LogConfig& config,
                              std::vector<spdlog::sink_ptr> extra_sinks = {});

/// @brief The process logger, created with defaults on first use
std::shared_ptr<spdlog::logger> GetLogger();

void SetLogLevel(LogLevel level);

void FlushLogs();

/// @brief Flush and drop the process logger; the next GetLogger() recreates it
void ShutdownLogging();

#define SENTINEL_LOG_TRACE(...) SPDLOG_LOGGER_TRACE(::sentinel::GetLogger(), __VA_ARGS__)
#define SENTINEL_LOG_DEBUG(...) SPDLOG_LOGGER_DEBUG(::sentinel::GetLogger(), __VA_ARGS__)
#define SENTINEL_LOG_INFO(...) SPDLOG_LOGGER_INFO(::sentinel::GetLogger(), __VA_ARGS__)
#define SENTINEL_LOG_WARN(...) SPDLOG_LOGGER_WARN(::sentinel::GetLogger(), __VA_ARGS__)
#define SENTINEL_LOG_ERROR(...) SPDLOG_LOGGER_ERROR(::sentinel::GetLogger(), __VA_ARGS__)
#define SENTINEL_LOG_CRITICAL(...) SPDLOG_LOGGER_CRITICAL(::sentinel::GetLogger(), __VA_ARGS__)

}  // namespace sentinel
