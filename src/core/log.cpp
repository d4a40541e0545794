/// @file log.cpp
/// @brief Named spdlog loggers built from a LogConfig

#include <linkvec/core/log.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <filesystem>
#include <mutex>
#include <sstream>
#include <vector>

namespace linkvec_core {

namespace {

struct LoggerRegistry {
    std::mutex mutex;
    std::map<std::string, std::shared_ptr<spdlog::logger>> loggers;
    LogConfig config;
};

LoggerRegistry& registry() {
    static LoggerRegistry instance;
    return instance;
}

std::vector<spdlog::sink_ptr> make_sinks(const std::string& name, const LogConfig& config) {
    std::vector<spdlog::sink_ptr> sinks;

    if (config.console_enabled) {
        auto console = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console->set_pattern("[%H:%M:%S.%e] [%^%l%$] [%n] %v");
        sinks.push_back(std::move(console));
    }

    if (config.file_enabled && !config.log_directory.empty()) {
        std::filesystem::path path = std::filesystem::path(config.log_directory) / (name + ".log");
        try {
            std::filesystem::create_directories(config.log_directory);
            auto file = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                path.string(), config.max_file_size, config.max_files);
            file->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%n] %v");
            sinks.push_back(std::move(file));
        } catch (const spdlog::spdlog_ex& ex) {
            spdlog::warn("Cannot open {}: {}", path.string(), ex.what());
        } catch (const std::filesystem::filesystem_error& ex) {
            spdlog::warn("Cannot create {}: {}", config.log_directory, ex.what());
        }
    }

    return sinks;
}

void apply_level(LoggerRegistry& reg, spdlog::level::level_enum level) {
    reg.config.level = level;
    spdlog::set_level(level);
    for (auto& [name, logger] : reg.loggers) {
        logger->set_level(level);
    }
}

} // anonymous namespace

// =============================================================================
// Loggers
// =============================================================================

void configure_logging(const LogConfig& config) {
    auto& reg = registry();
    std::lock_guard<std::mutex> lock(reg.mutex);

    reg.config = config;
    apply_level(reg, config.level);
}

std::shared_ptr<spdlog::logger> get_logger(const std::string& name) {
    auto& reg = registry();
    std::lock_guard<std::mutex> lock(reg.mutex);

    if (auto it = reg.loggers.find(name); it != reg.loggers.end()) {
        return it->second;
    }

    auto sinks = make_sinks(name, reg.config);
    auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
    logger->set_level(reg.config.level);
    reg.loggers.emplace(name, logger);

    if (!spdlog::get(name)) {
        spdlog::register_logger(logger);
    }
    return logger;
}

std::shared_ptr<spdlog::logger> bench_logger() {
    return get_logger("linkvec_bench");
}

// =============================================================================
// Levels
// =============================================================================

void set_global_log_level(spdlog::level::level_enum level) {
    auto& reg = registry();
    std::lock_guard<std::mutex> lock(reg.mutex);
    apply_level(reg, level);
}

spdlog::level::level_enum get_global_log_level() {
    auto& reg = registry();
    std::lock_guard<std::mutex> lock(reg.mutex);
    return reg.config.level;
}

std::optional<spdlog::level::level_enum> parse_log_level(const std::string& str) {
    static const std::map<std::string, spdlog::level::level_enum> names = {
        {"trace", spdlog::level::trace},
        {"debug", spdlog::level::debug},
        {"info", spdlog::level::info},
        {"warn", spdlog::level::warn},
        {"warning", spdlog::level::warn},
        {"error", spdlog::level::err},
        {"err", spdlog::level::err},
        {"critical", spdlog::level::critical},
        {"fatal", spdlog::level::critical},
        {"off", spdlog::level::off},
    };

    auto it = names.find(str);
    if (it == names.end()) {
        return std::nullopt;
    }
    return it->second;
}

const char* log_level_name(spdlog::level::level_enum level) {
    switch (level) {
        case spdlog::level::trace: return "trace";
        case spdlog::level::debug: return "debug";
        case spdlog::level::info: return "info";
        case spdlog::level::warn: return "warn";
        case spdlog::level::err: return "error";
        case spdlog::level::critical: return "critical";
        case spdlog::level::off: return "off";
        default: return "unknown";
    }
}

// =============================================================================
// Structured Records
// =============================================================================

std::string format_structured(const std::string& message, const LogFields& fields) {
    std::ostringstream oss;
    oss << message;

    const char* separator = " {";
    for (const auto& [key, value] : fields) {
        oss << separator << key << "=\"" << value << "\"";
        separator = ", ";
    }
    if (!fields.empty()) {
        oss << "}";
    }
    return oss.str();
}

void log_structured(
    spdlog::level::level_enum level,
    const std::string& logger_name,
    const std::string& message,
    const LogFields& fields)
{
    auto logger = get_logger(logger_name);
    if (logger->should_log(level)) {
        logger->log(level, format_structured(message, fields));
    }
}

// =============================================================================
// LogScope
// =============================================================================

LogScope::LogScope(const std::string& name, const std::string& logger_name)
    : m_name(name)
    , m_logger(get_logger(logger_name))
    , m_start(std::chrono::steady_clock::now())
{
    m_logger->trace(">>> {}", m_name);
}

LogScope::~LogScope() {
    m_logger->trace("<<< {} ({}ns)", m_name, elapsed().count());
}

std::chrono::nanoseconds LogScope::finish() {
    if (!m_stop) {
        m_stop = std::chrono::steady_clock::now();
    }
    return elapsed();
}

std::chrono::nanoseconds LogScope::elapsed() const {
    auto end = m_stop.value_or(std::chrono::steady_clock::now());
    return std::chrono::duration_cast<std::chrono::nanoseconds>(end - m_start);
}

// =============================================================================
// Lifecycle
// =============================================================================

void flush_all_loggers() {
    auto& reg = registry();
    std::lock_guard<std::mutex> lock(reg.mutex);

    for (auto& [name, logger] : reg.loggers) {
        logger->flush();
    }
    spdlog::default_logger()->flush();
}

void shutdown_logging() {
    flush_all_loggers();

    auto& reg = registry();
    std::lock_guard<std::mutex> lock(reg.mutex);

    for (auto& [name, logger] : reg.loggers) {
        spdlog::drop(name);
    }
    reg.loggers.clear();

    spdlog::shutdown();
}

} // namespace linkvec_core
