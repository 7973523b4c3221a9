#include "logging.h"

#include "error.h"

#include <mutex>
#include <vector>

#include <absl/strings/ascii.h>
#include <absl/strings/str_cat.h>

namespace driftscope {

namespace {

std::shared_ptr<spdlog::logger> g_logger;
std::mutex g_logger_mutex;

}  // namespace

absl::StatusOr<LogLevel> ParseLogLevel(std::string_view name) {
    const std::string lowered = absl::AsciiStrToLower(name);
    if (lowered == "trace") return LogLevel::kTrace;
    if (lowered == "debug") return LogLevel::kDebug;
    if (lowered == "info") return LogLevel::kInfo;
    if (lowered == "warn" || lowered == "warning") return LogLevel::kWarn;
    if (lowered == "error") return LogLevel::kError;
    if (lowered == "critical") return LogLevel::kCritical;
    if (lowered == "off") return LogLevel::kOff;
    return absl::InvalidArgumentError(absl::StrCat("Unknown log level: ", name));
}

absl::Status InitLogging(const LogConfig& config) {
    const auto level = static_cast<spdlog::level::level_enum>(config.level);
    std::vector<spdlog::sink_ptr> sinks;

    // Console sink goes to stderr so stdout stays clean for check output
    auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console_sink->set_level(level);
    sinks.push_back(console_sink);

    if (config.enable_file) {
        std::shared_ptr<spdlog::sinks::rotating_file_sink_mt> file_sink;
        try {
            file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                config.file_path,
                config.max_file_size,
                config.max_files
            );
        } catch (const spdlog::spdlog_ex& e) {
            return MakeError(ErrorCode::kConfigurationError,
                             absl::StrCat("Cannot open log file ", config.file_path,
                                          ": ", e.what()));
        }
        file_sink->set_level(level);
        sinks.push_back(file_sink);
    }

    std::lock_guard<std::mutex> lock(g_logger_mutex);
    if (g_logger) {
        return absl::OkStatus();
    }

    auto logger = std::make_shared<spdlog::logger>(config.name, sinks.begin(), sinks.end());
    logger->set_level(level);
    logger->set_pattern(config.pattern);

    spdlog::set_default_logger(logger);

    // Flush on warn and above
    logger->flush_on(spdlog::level::warn);

    g_logger = std::move(logger);
    return absl::OkStatus();
}

std::shared_ptr<spdlog::logger> GetLogger() {
    {
        std::lock_guard<std::mutex> lock(g_logger_mutex);
        if (g_logger) {
            return g_logger;
        }
    }
    // Defaults have no file sink, so this does not fail
    const absl::Status status = InitLogging();
    std::lock_guard<std::mutex> lock(g_logger_mutex);
    if (!status.ok() || !g_logger) {
        return spdlog::default_logger();
    }
    return g_logger;
}

void SetLogLevel(LogLevel level) {
    GetLogger()->set_level(static_cast<spdlog::level::level_enum>(level));
}

void FlushLogs() {
    std::lock_guard<std::mutex> lock(g_logger_mutex);
    if (g_logger) {
        g_logger->flush();
    }
}

void ShutdownLogging() {
    std::lock_guard<std::mutex> lock(g_logger_mutex);
    if (g_logger) {
        g_logger->flush();
        spdlog::shutdown();
        g_logger.reset();
    }
}

}  // namespace driftscope
