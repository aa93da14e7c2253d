/// @file logging.cpp
/// @brief Process logger construction and level control

#include "logging.h"

#include <mutex>
#include <utility>

#include <absl/strings/ascii.h>
#include <absl/strings/str_cat.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include "error.h"

namespace sentinel {

namespace {

struct LevelEntry {
    LogLevel level;
    std::string_view name;
    spdlog::level::level_enum spdlog_level;
};

constexpr LevelEntry kLevels[] = {
    {LogLevel::kTrace, "trace", spdlog::level::trace},
    {LogLevel::kDebug, "debug", spdlog::level::debug},
    {LogLevel::kInfo, "info", spdlog::level::info},
    {LogLevel::kWarn, "warn", spdlog::level::warn},
    {LogLevel::kError, "error", spdlog::level::err},
    {LogLevel::kCritical, "critical", spdlog::level::critical},
    {LogLevel::kOff, "off", spdlog::level::off},
};

spdlog::level::level_enum ToSpdlog(LogLevel level) {
    for (const auto& entry : kLevels) {
        if (entry.level == level) {
            return entry.spdlog_level;
        }
    }
    return spdlog::level::info;
}

std::mutex g_mutex;
std::shared_ptr<spdlog::logger> g_logger;

absl::StatusOr<std::shared_ptr<spdlog::logger>> BuildLogger(
    const LogConfig& config, std::vector<spdlog::sink_ptr> sinks) {
    switch (config.console) {
        case ConsoleTarget::kStdout:
            sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
            break;
        case ConsoleTarget::kStderr:
            sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
            break;
        case ConsoleTarget::kNone:
            break;
    }

    if (!config.file_path.empty()) {
        try {
            sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                config.file_path, config.max_file_bytes, config.max_files));
        } catch (const spdlog::spdlog_ex& e) {
            return MakeError(ErrorCode::kConfigurationError,
                             absl::StrCat("Cannot open log file ", config.file_path, ": ",
                                          e.what()));
        }
    }

    auto logger = std::make_shared<spdlog::logger>(config.name, sinks.begin(), sinks.end());
    logger->set_pattern(config.pattern);
    logger->set_level(ToSpdlog(config.level));
    logger->flush_on(spdlog::level::warn);
    return logger;
}

void Install(std::shared_ptr<spdlog::logger> logger) {
    g_logger = std::move(logger);
    spdlog::set_default_logger(g_logger);
}

}  // namespace

absl::StatusOr<LogLevel> ParseLogLevel(std::string_view name) {
    const std::string lowered = absl::AsciiStrToLower(absl::string_view(name.data(), name.size()));
    if (lowered == "warning") {
        return LogLevel::kWarn;
    }
    for (const auto& entry : kLevels) {
        if (entry.name == lowered) {
            return entry.level;
        }
    }
    return absl::InvalidArgumentError(absl::StrCat("Unknown log level: ", absl::string_view(name.data(), name.size())));
}

std::string_view LogLevelName(LogLevel level) {
    for (const auto& entry : kLevels) {
        if (entry.level == level) {
            return entry.name;
        }
    }
    return "info";
}

absl::StatusOr<LogConfig> LogConfig::FromConfig(const Config& config) {
    LogConfig result;
    if (config.HasKey("logging.level")) {
        SENTINEL_ASSIGN_OR_RETURN(result.level,
                                  ParseLogLevel(config.GetString("logging.level")));
    }
    result.file_path = config.GetString("logging.file", result.file_path);
    result.pattern = config.GetString("logging.pattern", result.pattern);

    int64_t max_bytes = 0;
    SENTINEL_ASSIGN_OR_RETURN(max_bytes,
                              config.ReadInt("logging.max_file_bytes",
                                             static_cast<int64_t>(result.max_file_bytes)));
    int64_t max_files = 0;
    SENTINEL_ASSIGN_OR_RETURN(max_files,
                              config.ReadInt("logging.max_files",
                                             static_cast<int64_t>(result.max_files)));
    if (max_bytes <= 0 || max_files <= 0) {
        return MakeError(ErrorCode::kConfigurationError,
                         "logging.max_file_bytes and logging.max_files must be positive");
    }
    result.max_file_bytes = static_cast<size_t>(max_bytes);
    result.max_files = static_cast<size_t>(max_files);
    return result;
}

absl::Status ConfigureLogging(const LogConfig& config, std::vector<spdlog::sink_ptr> extra_sinks) {
    auto logger = BuildLogger(config, std::move(extra_sinks));
    if (!logger.ok()) {
        return logger.status();
    }

    std::lock_guard<std::mutex> lock(g_mutex);
    if (g_logger) {
        g_logger->flush();
    }
    Install(std::move(*logger));
    return absl::OkStatus();
}

std::shared_ptr<spdlog::logger> GetLogger() {
    std::lock_guard<std::mutex> lock(g_mutex);
    if (!g_logger) {
        // Defaults have no file sink, so building cannot fail
        auto logger = BuildLogger(LogConfig{}, {});
        Install(std::move(*logger));
    }
    return g_logger;
}

void SetLogLevel(LogLevel level) {
    GetLogger()->set_level(ToSpdlog(level));
}

void FlushLogs() {
    std::lock_guard<std::mutex> lock(g_mutex);
    if (g_logger) {
        g_logger->flush();
    }
}

void ShutdownLogging() {
    std::lock_guard<std::mutex> lock(g_mutex);
    if (g_logger) {
        g_logger->flush();
        g_logger.reset();
    }
    spdlog::drop_all();
}

}  // namespace sentinel
