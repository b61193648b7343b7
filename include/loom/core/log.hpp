#pragma once

/// @file log.hpp
/// @brief Logging utilities for loom

#include <spdlog/spdlog.h>
#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <string>

/// Report through the default logger before configure_logging has run
#define LOOM_LOG_ERROR(...) spdlog::error(__VA_ARGS__)

namespace loom_core {

// =============================================================================
// Basic Logging (Inline)
// =============================================================================

/// Pattern and level for programs that never call configure_logging
inline void init_logging() {
    spdlog::set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
    spdlog::set_level(spdlog::level::info);
}

// =============================================================================
// Log Configuration
// =============================================================================

/// The `[log]` table of loom.toml
struct LogConfig {
    bool console_enabled = true;
    bool file_enabled = false;
    std::string log_directory;
    std::size_t max_file_size = 10 * 1024 * 1024;  // 10 MB
    std::size_t max_files = 5;
    spdlog::level::level_enum level = spdlog::level::info;

    /// Per-subsystem overrides keyed by logger name; `loom.derive` also
    /// covers `loom.derive.*`
    std::map<std::string, spdlog::level::level_enum> subsystem_levels;

    /// Level a logger named `name` runs at
    [[nodiscard]] spdlog::level::level_enum level_for(const std::string& name) const;
};

/// Rebuild the sinks and levels of every loom logger
void configure_logging(const LogConfig& config);

// =============================================================================
// Named Loggers
// =============================================================================

/// Get or create a named logger
std::shared_ptr<spdlog::logger> get_logger(const std::string& name);

/// Get the core logger
std::shared_ptr<spdlog::logger> core_logger();

/// Get the UI graph compiler logger
std::shared_ptr<spdlog::logger> derive_logger();

/// Get the layout engine logger
std::shared_ptr<spdlog::logger> layout_logger();

// =============================================================================
// Level Names
// =============================================================================

/// Level named in loom.toml; accepts `warning`, `err` and `fatal` as aliases
std::optional<spdlog::level::level_enum> parse_log_level(const std::string& str);

const char* log_level_name(spdlog::level::level_enum level);

// =============================================================================
// Log Scoping (RAII)
// =============================================================================

/// Traces entry and exit of a compiler pass with its duration
class LogScope {
public:
    LogScope(const std::string& name, const std::string& logger_name = "loom");
    ~LogScope();

    // Non-copyable, non-movable
    LogScope(const LogScope&) = delete;
    LogScope& operator=(const LogScope&) = delete;
    LogScope(LogScope&&) = delete;
    LogScope& operator=(LogScope&&) = delete;

private:
    std::string m_name;
    std::shared_ptr<spdlog::logger> m_logger;
    std::chrono::steady_clock::time_point m_start;
};

#define LOOM_LOG_SCOPE_CAT2(a, b) a##b
#define LOOM_LOG_SCOPE_CAT(a, b) LOOM_LOG_SCOPE_CAT2(a, b)

/// Macro for easy scope logging
#define LOOM_LOG_SCOPE(name, logger) \
    ::loom_core::LogScope LOOM_LOG_SCOPE_CAT(loom_log_scope_, __LINE__)(name, logger)

// =============================================================================
// Lifecycle
// =============================================================================

/// Flush and drop every loom logger
void shutdown_logging();

} // namespace loom_core
