#pragma once

/// @file core.hpp
/// @brief Main include file for loom_core module
///
/// This header includes all loom_core components in dependency order.

// Forward declarations
#include "fwd.hpp"

// Error handling
#include "error.hpp"

// Logging
#include "log.hpp"

#define LOOM_VERSION_MAJOR 0
#define LOOM_VERSION_MINOR 3
#define LOOM_VERSION_PATCH 0
#define LOOM_VERSION_STRING "0.3.0"

/// @namespace loom_core
/// @brief Shared infrastructure for the loom compiler and layout engines
///
/// - **Error Handling**: Result<T> with domain error kinds
/// - **Logging**: spdlog named loggers per subsystem
///
/// Example usage:
/// @code
/// #include <loom/core/core.hpp>
///
/// loom_core::Result<int> parse_cell(int value) {
///     if (value < 0) {
///         return loom_core::Err<int>("Negative cell index");
///     }
///     return value;
/// }
/// @endcode
