#pragma once

/// @file logging.h
/// @brief DriftScope logging utilities wrapping spdlog

#include <memory>
#include <string>
#include <string_view>

#include <absl/status/status.h>
#include <absl/status/statusor.h>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>

namespace driftscope {

/// @brief Severity, numerically equal to the spdlog level
enum class LogLevel {
    kTrace = spdlog::level::trace,
    kDebug = spdlog::level::debug,
    kInfo = spdlog::level::info,
    kWarn = spdlog::level::warn,
    kError = spdlog::level::err,
    kCritical = spdlog::level::critical,
    kOff = spdlog::level::off
};

/// @brief Parse a level name ("trace", "debug", "info", "warn", "error",
/// "critical", "off"), case-insensitive
absl::StatusOr<LogLevel> ParseLogLevel(std::string_view name);

/// @brief Logger settings, filled from the "logging.*" configuration keys
struct LogConfig {
    std::string name = "driftscope";
    LogLevel level = LogLevel::kInfo;
    std::string pattern = "[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] [%t] %v";

    // Rotating file sink, enabled when "logging.file" is set
    bool enable_file = false;
    std::string file_path = "driftscope.log";
    size_t max_file_size = 5 * 1024 * 1024;
    size_t max_files = 3;
};

/// @brief Create the process logger: stderr colour sink plus, when enabled, a
/// rotating file sink
///
/// Only the first successful call takes effect; later calls keep the existing
/// logger. stdout is left to the check output.
/// @return kConfigurationError if the log file cannot be opened; logging is
///         left uninitialised in that case
absl::Status InitLogging(const LogConfig& config = {});

/// @brief Process logger, created with defaults on first use
std::shared_ptr<spdlog::logger> GetLogger();

void SetLogLevel(LogLevel level);

void FlushLogs();

/// @brief Flush and drop all spdlog loggers before exit
void ShutdownLogging();

// Levels below SPDLOG_ACTIVE_LEVEL compile out
#define DRIFTSCOPE_LOG_TRACE(...) SPDLOG_LOGGER_TRACE(::driftscope::GetLogger(), __VA_ARGS__)
#define DRIFTSCOPE_LOG_DEBUG(...) SPDLOG_LOGGER_DEBUG(::driftscope::GetLogger(), __VA_ARGS__)
#define DRIFTSCOPE_LOG_INFO(...) SPDLOG_LOGGER_INFO(::driftscope::GetLogger(), __VA_ARGS__)
#define DRIFTSCOPE_LOG_WARN(...) SPDLOG_LOGGER_WARN(::driftscope::GetLogger(), __VA_ARGS__)
#define DRIFTSCOPE_LOG_ERROR(...) SPDLOG_LOGGER_ERROR(::driftscope::GetLogger(), __VA_ARGS__)
#define DRIFTSCOPE_LOG_CRITICAL(...) SPDLOG_LOGGER_CRITICAL(::driftscope::GetLogger(), __VA_ARGS__)

}  // namespace driftscope
