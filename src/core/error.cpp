/// @file error.cpp
/// @brief Error formatting and statistics for loom_core

#include <loom/core/error.hpp>
#include <atomic>
#include <sstream>
#include <vector>

namespace loom_core {

// =============================================================================
// Error Message Formatting
// =============================================================================

namespace detail {

/// Format derive error with the offending field
std::string format_derive_error(const DeriveError& err) {
    std::ostringstream oss;
    oss << "[DeriveError] " << err.message;

    if (!err.field.empty()) {
        oss << " (field: " << err.field << ")";
    }

    return oss.str();
}

/// Format layout error with the owning layout
std::string format_layout_error(const LayoutError& err) {
    std::ostringstream oss;
    oss << "[LayoutError] " << err.message;
    return oss.str();
}

/// Format config error with the source path
std::string format_config_error(const ConfigError& err) {
    std::ostringstream oss;
    oss << "[ConfigError] " << err.message;

    if (!err.path.empty() && err.message.find(err.path) == std::string::npos) {
        oss << " (path: " << err.path << ")";
    }

    return oss.str();
}

} // namespace detail

// =============================================================================
// Error Chain Support
// =============================================================================

std::string build_error_chain(const Error& error) {
    std::ostringstream oss;

    oss << "[" << error_code_name(error.code()) << "] ";

    std::visit([&oss](const auto& err) {
        using T = std::decay_t<decltype(err)>;
        if constexpr (std::is_same_v<T, std::string>) {
            oss << err;
        } else if constexpr (std::is_same_v<T, DeriveError>) {
            oss << detail::format_derive_error(err);
        } else if constexpr (std::is_same_v<T, LayoutError>) {
            oss << detail::format_layout_error(err);
        } else if constexpr (std::is_same_v<T, ConfigError>) {
            oss << detail::format_config_error(err);
        }
    }, error.variant());

    for (const auto& [key, value] : error.context()) {
        oss << "\n  " << key << ": " << value;
    }

    return oss.str();
}

// =============================================================================
// Explicit Template Instantiations
// =============================================================================

template class Result<void, Error>;
template class Result<bool, Error>;
template class Result<int, Error>;
template class Result<std::string, Error>;

// =============================================================================
// Error Statistics
// =============================================================================

namespace debug {

struct ErrorStats {
    std::atomic<std::uint64_t> total_errors{0};
    std::atomic<std::uint64_t> derive_errors{0};
    std::atomic<std::uint64_t> layout_errors{0};
    std::atomic<std::uint64_t> config_errors{0};
    std::atomic<std::uint64_t> generic_errors{0};
};

static ErrorStats s_error_stats;

void record_error(const Error& error) {
    s_error_stats.total_errors.fetch_add(1, std::memory_order_relaxed);

    if (error.is<DeriveError>()) {
        s_error_stats.derive_errors.fetch_add(1, std::memory_order_relaxed);
    } else if (error.is<LayoutError>()) {
        s_error_stats.layout_errors.fetch_add(1, std::memory_order_relaxed);
    } else if (error.is<ConfigError>()) {
        s_error_stats.config_errors.fetch_add(1, std::memory_order_relaxed);
    } else {
        s_error_stats.generic_errors.fetch_add(1, std::memory_order_relaxed);
    }
}

std::uint64_t total_error_count() {
    return s_error_stats.total_errors.load(std::memory_order_relaxed);
}

void reset_error_stats() {
    s_error_stats.total_errors.store(0, std::memory_order_relaxed);
    s_error_stats.derive_errors.store(0, std::memory_order_relaxed);
    s_error_stats.layout_errors.store(0, std::memory_order_relaxed);
    s_error_stats.config_errors.store(0, std::memory_order_relaxed);
    s_error_stats.generic_errors.store(0, std::memory_order_relaxed);
}

std::string error_stats_summary() {
    std::ostringstream oss;
    oss << "Error Statistics:\n"
        << "  Total: " << s_error_stats.total_errors.load() << "\n"
        << "  Derive: " << s_error_stats.derive_errors.load() << "\n"
        << "  Layout: " << s_error_stats.layout_errors.load() << "\n"
        << "  Config: " << s_error_stats.config_errors.load() << "\n"
        << "  Generic: " << s_error_stats.generic_errors.load() << "\n";
    return oss.str();
}

} // namespace debug

} // namespace loom_core
