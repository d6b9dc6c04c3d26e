/// @file log.cpp
/// @brief Logging system implementation for hookchain_core
///
/// All named loggers share one console sink. File output, when enabled, is a
/// rotating file per logger. Levels set with set_logger_level() survive
/// set_global_log_level() and are cleared by configure_logging().

#include <hookchain/core/log.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <array>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <utility>
#include <vector>

namespace hookchain_core {

// =============================================================================
// Logger State
// =============================================================================

namespace {

struct LogState {
    std::mutex mutex;
    LogConfig config;
    spdlog::sink_ptr console;
    std::map<std::string, std::shared_ptr<spdlog::logger>> loggers;
    std::map<std::string, spdlog::level::level_enum> overrides;
};

LogState& state() {
    static LogState s;
    return s;
}

constexpr std::array<std::pair<const char*, spdlog::level::level_enum>, 10> k_level_names{{
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
}};

/// Caller holds s.mutex
spdlog::sink_ptr console_sink(LogState& s) {
    if (!s.console) {
        s.console = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        s.console->set_pattern("[%H:%M:%S.%e] [%^%l%$] [%n] %v");
    }
    return s.console;
}

/// Caller holds s.mutex
std::vector<spdlog::sink_ptr> build_sinks(LogState& s, const std::string& name) {
    std::vector<spdlog::sink_ptr> sinks;

    if (s.config.console_enabled) {
        sinks.push_back(console_sink(s));
    }

    if (s.config.file_enabled && !s.config.log_directory.empty()) {
        const auto path = std::filesystem::path(s.config.log_directory) / (name + ".log");
        try {
            auto file = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                path.string(), s.config.max_file_size, s.config.max_files);
            file->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%n] %v");
            sinks.push_back(std::move(file));
        } catch (const spdlog::spdlog_ex& e) {
            HOOKCHAIN_LOG_WARN("Cannot log '{}' to {}: {}", name, path.string(), e.what());
        }
    }

    return sinks;
}

/// Caller holds s.mutex
spdlog::level::level_enum level_for(const LogState& s, const std::string& name) {
    auto it = s.overrides.find(name);
    return it != s.overrides.end() ? it->second : s.config.level;
}

} // anonymous namespace

// =============================================================================
// Logger Configuration
// =============================================================================

void configure_logging(const LogConfig& config) {
    auto& s = state();
    std::lock_guard<std::mutex> lock(s.mutex);

    s.config = config;
    s.overrides.clear();

    for (auto& [name, logger] : s.loggers) {
        logger->sinks() = build_sinks(s, name);
        logger->set_level(config.level);
    }
    spdlog::set_level(config.level);
}

std::shared_ptr<spdlog::logger> get_logger(const std::string& name) {
    auto& s = state();
    std::lock_guard<std::mutex> lock(s.mutex);

    if (auto it = s.loggers.find(name); it != s.loggers.end()) {
        return it->second;
    }

    auto sinks = build_sinks(s, name);
    auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
    logger->set_level(level_for(s, name));
    s.loggers.emplace(name, logger);

    // Keep spdlog::get() working for callers outside hookchain
    if (!spdlog::get(name)) {
        spdlog::register_logger(logger);
    }
    return logger;
}

// Looked up on every call so a logger dropped by shutdown_logging() is
// recreated with the current configuration
std::shared_ptr<spdlog::logger> core_logger() {
    return get_logger("hookchain_core");
}

std::shared_ptr<spdlog::logger> event_logger() {
    return get_logger("hookchain_event");
}

// =============================================================================
// Log Level Management
// =============================================================================

void set_global_log_level(spdlog::level::level_enum level) {
    auto& s = state();
    std::lock_guard<std::mutex> lock(s.mutex);

    s.config.level = level;
    for (auto& [name, logger] : s.loggers) {
        logger->set_level(level_for(s, name));
    }
    spdlog::set_level(level);
}

void set_logger_level(const std::string& name, spdlog::level::level_enum level) {
    auto& s = state();
    std::lock_guard<std::mutex> lock(s.mutex);

    s.overrides[name] = level;
    if (auto it = s.loggers.find(name); it != s.loggers.end()) {
        it->second->set_level(level);
    }
}

spdlog::level::level_enum get_global_log_level() {
    auto& s = state();
    std::lock_guard<std::mutex> lock(s.mutex);
    return s.config.level;
}

std::optional<spdlog::level::level_enum> parse_log_level(const std::string& str) {
    for (const auto& [name, level] : k_level_names) {
        if (str == name) {
            return level;
        }
    }
    return std::nullopt;
}

const char* log_level_name(spdlog::level::level_enum level) {
    // First entry per level is its canonical name
    for (const auto& [name, value] : k_level_names) {
        if (value == level) {
            return name;
        }
    }
    return "unknown";
}

// =============================================================================
// Lifecycle
// =============================================================================

void flush_all_loggers() {
    auto& s = state();
    std::lock_guard<std::mutex> lock(s.mutex);

    for (auto& [name, logger] : s.loggers) {
        logger->flush();
    }
    spdlog::default_logger()->flush();
}

void shutdown_logging() {
    flush_all_loggers();

    auto& s = state();
    std::lock_guard<std::mutex> lock(s.mutex);

    for (const auto& [name, logger] : s.loggers) {
        spdlog::drop(name);
    }
    s.loggers.clear();
    s.overrides.clear();
    s.console.reset();
}
} // namespace hookchain_core
