#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for loom_core module

#include <cstdint>

namespace loom_core {

// =============================================================================
// Error Types
// =============================================================================

enum class ErrorCode : std::uint8_t;
struct DeriveError;
struct LayoutError;
struct ConfigError;
class Error;

template<typename T, typename E = Error>
class Result;

// =============================================================================
// Logging
// =============================================================================

struct LogConfig;
class LogScope;

} // namespace loom_core
