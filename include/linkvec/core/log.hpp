#pragma once

/// @file log.hpp
/// @brief spdlog setup, named loggers and phase timing for linkvec

#include <spdlog/spdlog.h>
#include <chrono>
#include <cstddef>
#include <map>
#include <memory>
#include <optional>
#include <string>

// =============================================================================
// Logging Macros
// =============================================================================

#define LINKVEC_LOG_INFO(...) spdlog::info(__VA_ARGS__)
#define LINKVEC_LOG_ERROR(...) spdlog::error(__VA_ARGS__)

namespace linkvec_core {

/// Default logger pattern until configure_logging() installs sinks
inline void init_logging() {
    spdlog::set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
    spdlog::set_level(spdlog::level::info);
}

// =============================================================================
// Configuration
// =============================================================================

/// Sinks and level applied to every named logger
struct LogConfig {
    bool console_enabled = true;
    bool file_enabled = false;                      ///< Requires log_directory
    std::string log_directory;                      ///< One <logger>.log per logger
    std::size_t max_file_size = 10 * 1024 * 1024;   // 10 MB
    std::size_t max_files = 5;
    spdlog::level::level_enum level = spdlog::level::info;
};

/// Install `config`. Loggers created afterwards get its sinks; existing
/// loggers only pick up the level.
void configure_logging(const LogConfig& config);

/// Get or create a named logger
std::shared_ptr<spdlog::logger> get_logger(const std::string& name);

/// Logger used by the benchmark driver
std::shared_ptr<spdlog::logger> bench_logger();

// =============================================================================
// Levels
// =============================================================================

/// Apply `level` to spdlog and every named logger
void set_global_log_level(spdlog::level::level_enum level);

spdlog::level::level_enum get_global_log_level();

/// Accepts trace, debug, info, warn, error, critical and off,
/// plus the aliases warning, err and fatal
std::optional<spdlog::level::level_enum> parse_log_level(const std::string& str);

/// Canonical name, accepted back by parse_log_level()
const char* log_level_name(spdlog::level::level_enum level);

// =============================================================================
// Structured Records
// =============================================================================

using LogFields = std::map<std::string, std::string>;

/// `message {key="value", ...}`, keys in sorted order
std::string format_structured(const std::string& message, const LogFields& fields);

/// Emit format_structured(message, fields) on the named logger
void log_structured(
    spdlog::level::level_enum level,
    const std::string& logger_name,
    const std::string& message,
    const LogFields& fields);

// =============================================================================
// LogScope
// =============================================================================

/// Times one phase and traces its entry and exit on a named logger
///
/// @code
/// linkvec_core::LogScope scope("construction", "linkvec_bench");
/// build();
/// auto took = scope.finish();
/// @endcode
class LogScope {
public:
    LogScope(const std::string& name, const std::string& logger_name);
    ~LogScope();

    LogScope(const LogScope&) = delete;
    LogScope& operator=(const LogScope&) = delete;
    LogScope(LogScope&&) = delete;
    LogScope& operator=(LogScope&&) = delete;

    /// Stop the clock; later calls return the same duration
    std::chrono::nanoseconds finish();

    /// Time since entry, or the stopped duration once finished
    [[nodiscard]] std::chrono::nanoseconds elapsed() const;

private:
    std::string m_name;
    std::shared_ptr<spdlog::logger> m_logger;
    std::chrono::steady_clock::time_point m_start;
    std::optional<std::chrono::steady_clock::time_point> m_stop;
};

// =============================================================================
// Lifecycle
// =============================================================================

void flush_all_loggers();

/// Flush, drop every named logger and shut spdlog down
void shutdown_logging();

} // namespace linkvec_core
