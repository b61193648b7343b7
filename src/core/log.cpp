/// @file log.cpp
/// @brief Named loggers of the compiler and layout subsystems
///
/// Every loom logger is registered here so that loading loom.toml can
/// rebuild its sinks and apply the per-subsystem levels after the logger was
/// first handed out.

#include <loom/core/log.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <filesystem>
#include <mutex>
#include <vector>

namespace loom_core {

// =============================================================================
// LogConfig
// =============================================================================

spdlog::level::level_enum LogConfig::level_for(const std::string& name) const {
    // Longest matching prefix wins: "loom.derive.resolver" prefers "loom.derive.resolver" over "loom.derive"
    const std::string* best = nullptr;
    spdlog::level::level_enum result = level;
    for (const auto& [subsystem, subsystem_level] : subsystem_levels) {
        const bool exact = name == subsystem;
        const bool nested = name.size() > subsystem.size() && name.compare(0, subsystem.size(), subsystem) == 0 &&
                            name[subsystem.size()] == '.';
        if ((exact || nested) && (!best || subsystem.size() > best->size())) {
            best = &subsystem;
            result = subsystem_level;
        }
    }
    return result;
}

// =============================================================================
// Registry
// =============================================================================

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

/// Console output goes to stderr: loom-derive writes generated code to stdout
std::vector<spdlog::sink_ptr> make_sinks(const LogConfig& config, const std::string& name) {
    std::vector<spdlog::sink_ptr> sinks;

    if (config.console_enabled) {
        auto console = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        console->set_pattern("[%H:%M:%S.%e] [%^%l%$] [%n] %v");
        sinks.push_back(console);
    }

    if (config.file_enabled && !config.log_directory.empty()) {
        try {
            const auto path = std::filesystem::path(config.log_directory) / (name + ".log");
            auto file = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(path.string(), config.max_file_size,
                                                                                config.max_files);
            file->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%n] %v");
            sinks.push_back(file);
        } catch (const spdlog::spdlog_ex& e) {
            spdlog::warn("Cannot open log file for '{}': {}", name, e.what());
        }
    }

    return sinks;
}

} // anonymous namespace

void configure_logging(const LogConfig& config) {
    auto& reg = registry();
    std::lock_guard<std::mutex> lock(reg.mutex);

    reg.config = config;
    for (auto& [name, logger] : reg.loggers) {
        auto sinks = make_sinks(reg.config, name);
        logger->sinks().assign(sinks.begin(), sinks.end());
        logger->set_level(reg.config.level_for(name));
    }
    spdlog::set_level(reg.config.level);
    spdlog::debug("loom logging at level {}", log_level_name(reg.config.level));
}

std::shared_ptr<spdlog::logger> get_logger(const std::string& name) {
    auto& reg = registry();
    std::lock_guard<std::mutex> lock(reg.mutex);

    auto it = reg.loggers.find(name);
    if (it != reg.loggers.end()) {
        return it->second;
    }

    auto sinks = make_sinks(reg.config, name);
    auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
    logger->set_level(reg.config.level_for(name));

    reg.loggers.emplace(name, logger);
    if (!spdlog::get(name)) {
        spdlog::register_logger(logger);
    }
    return logger;
}

std::shared_ptr<spdlog::logger> core_logger() {
    static std::shared_ptr<spdlog::logger> logger = get_logger("loom");
    return logger;
}

std::shared_ptr<spdlog::logger> derive_logger() {
    static std::shared_ptr<spdlog::logger> logger = get_logger("loom.derive");
    return logger;
}

std::shared_ptr<spdlog::logger> layout_logger() {
    static std::shared_ptr<spdlog::logger> logger = get_logger("loom.layout");
    return logger;
}

// =============================================================================
// Level Names
// =============================================================================

std::optional<spdlog::level::level_enum> parse_log_level(const std::string& str) {
    static const std::map<std::string, spdlog::level::level_enum> names = {
        {"trace", spdlog::level::trace}, {"debug", spdlog::level::debug},
        {"info", spdlog::level::info},   {"warn", spdlog::level::warn},
        {"warning", spdlog::level::warn}, {"error", spdlog::level::err},
        {"err", spdlog::level::err},     {"critical", spdlog::level::critical},
        {"fatal", spdlog::level::critical}, {"off", spdlog::level::off},
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
    const auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - m_start);
    m_logger->trace("<<< {} ({}us)", m_name, elapsed.count());
}

// =============================================================================
// Shutdown
// =============================================================================

void shutdown_logging() {
    auto& reg = registry();
    std::lock_guard<std::mutex> lock(reg.mutex);

    for (auto& [name, logger] : reg.loggers) {
        logger->flush();
        spdlog::drop(name);
    }
    reg.loggers.clear();
    spdlog::shutdown();
}

} // namespace loom_core
