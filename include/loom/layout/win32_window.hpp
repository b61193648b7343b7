#pragma once

/// @file win32_window.hpp
/// @brief IWindowSystem over native Win32 windows
///
/// Only available when building for Windows. A ControlHandle value is the
/// HWND of the control.

#include "window.hpp"

#include <map>

namespace loom_layout {

class Win32WindowSystem : public IWindowSystem {
public:
    Win32WindowSystem();
    ~Win32WindowSystem() override;

    Win32WindowSystem(const Win32WindowSystem&) = delete;
    Win32WindowSystem& operator=(const Win32WindowSystem&) = delete;

    [[nodiscard]] bool is_valid(ControlHandle handle) const override;
    [[nodiscard]] Size size(ControlHandle handle) const override;
    [[nodiscard]] Point position(ControlHandle handle) const override;

    void set_position(ControlHandle handle, std::int32_t x, std::int32_t y) override;
    void set_size(ControlHandle handle, std::uint32_t width, std::uint32_t height) override;

    /// Updates between the calls are applied in one DeferWindowPos batch
    void begin_deferred(std::size_t expected_count) override;
    void end_deferred() override;

    [[nodiscard]] ResizeToken bind_resize(ControlHandle parent, ResizeCallback callback) override;
    void unbind_resize(ResizeToken token) override;

    [[nodiscard]] std::int32_t physical_to_logical(std::int32_t value) const override;
    [[nodiscard]] std::int32_t logical_to_physical(std::int32_t value) const override;

    /// Dispatch from the window subclass procedure
    void notify_resize(std::uint64_t token, std::uint32_t width, std::uint32_t height);

private:
    struct Pending {
        bool has_position = false;
        bool has_size = false;
        std::int32_t x = 0;
        std::int32_t y = 0;
        std::uint32_t width = 0;
        std::uint32_t height = 0;
    };

    void apply(ControlHandle handle, const Pending& pending);

    std::map<std::uint64_t, ResizeCallback> m_callbacks;
    std::map<std::uint64_t, ControlHandle> m_subclassed;
    std::map<ControlHandle, Pending> m_pending;
    std::size_t m_deferred_depth = 0;
    std::uint64_t m_next_token = 1;
};

} // namespace loom_layout
