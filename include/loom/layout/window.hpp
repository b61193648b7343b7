#pragma once

/// @file window.hpp
/// @brief Windowing collaborator used by the layout engines
///
/// Layout engines never talk to a toolkit directly. Every geometry query and
/// update goes through an IWindowSystem, which the application provides
/// (Win32WindowSystem on Windows, MemoryWindowSystem for headless runs).

#include "fwd.hpp"

#include <cstdint>
#include <functional>
#include <string>

namespace loom_layout {

// =============================================================================
// Geometry
// =============================================================================

/// Opaque reference to a native control or window
struct ControlHandle {
    std::uint64_t value = 0;

    [[nodiscard]] bool is_null() const noexcept { return value == 0; }
    explicit operator bool() const noexcept { return value != 0; }

    bool operator==(const ControlHandle& other) const noexcept { return value == other.value; }
    bool operator!=(const ControlHandle& other) const noexcept { return value != other.value; }
    bool operator<(const ControlHandle& other) const noexcept { return value < other.value; }

    [[nodiscard]] std::string to_string() const;
};

struct Point {
    std::int32_t x = 0;
    std::int32_t y = 0;

    bool operator==(const Point& other) const noexcept { return x == other.x && y == other.y; }
    bool operator!=(const Point& other) const noexcept { return !(*this == other); }
};

struct Size {
    std::uint32_t width = 0;
    std::uint32_t height = 0;

    bool operator==(const Size& other) const noexcept { return width == other.width && height == other.height; }
    bool operator!=(const Size& other) const noexcept { return !(*this == other); }
};

/// Identifies one resize subscription
struct ResizeToken {
    std::uint64_t id = 0;

    [[nodiscard]] bool is_valid() const noexcept { return id != 0; }
    bool operator==(const ResizeToken& other) const noexcept { return id == other.id; }
};

/// Called with the new client size of the watched control
using ResizeCallback = std::function<void(std::uint32_t width, std::uint32_t height)>;

// =============================================================================
// IWindowSystem
// =============================================================================

/// @brief Geometry primitives of the host toolkit
///
/// Positions are relative to the parent's client area. Sizes of a container
/// are its client size. Getters report physical pixels; the setters take
/// logical units and scale them with logical_to_physical.
class IWindowSystem {
public:
    virtual ~IWindowSystem() = default;

    [[nodiscard]] virtual bool is_valid(ControlHandle handle) const = 0;

    [[nodiscard]] virtual Size size(ControlHandle handle) const = 0;
    [[nodiscard]] virtual Point position(ControlHandle handle) const = 0;

    virtual void set_position(ControlHandle handle, std::int32_t x, std::int32_t y) = 0;
    virtual void set_size(ControlHandle handle, std::uint32_t width, std::uint32_t height) = 0;

    /// Batch the geometry updates issued until end_deferred
    virtual void begin_deferred(std::size_t expected_count) { (void)expected_count; }
    virtual void end_deferred() {}

    /// Watch `parent` for client-area size changes
    [[nodiscard]] virtual ResizeToken bind_resize(ControlHandle parent, ResizeCallback callback) = 0;
    virtual void unbind_resize(ResizeToken token) = 0;

    /// Convert a physical pixel value to logical units (DPI scaling)
    [[nodiscard]] virtual std::int32_t physical_to_logical(std::int32_t value) const { return value; }
    /// Inverse of physical_to_logical
    [[nodiscard]] virtual std::int32_t logical_to_physical(std::int32_t value) const { return value; }

    [[nodiscard]] Size logical_size(ControlHandle handle) const {
        const Size physical = size(handle);
        return Size{static_cast<std::uint32_t>(physical_to_logical(static_cast<std::int32_t>(physical.width))),
                    static_cast<std::uint32_t>(physical_to_logical(static_cast<std::int32_t>(physical.height)))};
    }

    [[nodiscard]] Point logical_position(ControlHandle handle) const {
        const Point physical = position(handle);
        return Point{physical_to_logical(physical.x), physical_to_logical(physical.y)};
    }
};

/// Window system used by layout builders that were not given one
void set_default_window_system(IWindowSystem* system) noexcept;

/// May be null
[[nodiscard]] IWindowSystem* default_window_system() noexcept;

} // namespace loom_layout
