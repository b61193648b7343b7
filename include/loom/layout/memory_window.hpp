#pragma once

/// @file memory_window.hpp
/// @brief Headless window system keeping control rectangles in memory

#include "window.hpp"

#include <map>
#include <string>
#include <vector>

namespace loom_layout {

/// Control known to a MemoryWindowSystem
struct MemoryControl {
    ControlHandle handle;
    ControlHandle parent;
    std::string type;
    std::string name;
    Point position;
    Size size;
};

/// @brief IWindowSystem without a native toolkit
///
/// Used by tests and by applications that only need the computed geometry. `resize()` plays the role of the toolkit's resize
/// notification.
class MemoryWindowSystem : public IWindowSystem {
public:
    MemoryWindowSystem() = default;

    // Non-copyable: resize subscriptions capture layout pointers
    MemoryWindowSystem(const MemoryWindowSystem&) = delete;
    MemoryWindowSystem& operator=(const MemoryWindowSystem&) = delete;

    // =========================================================================
    // Control management
    // =========================================================================

    /// Register a control and return its handle
    ControlHandle create(const std::string& type, const std::string& name, ControlHandle parent,
                         Point position = {}, Size size = {});

    /// Remove a control and its resize subscriptions
    void destroy(ControlHandle handle);

    [[nodiscard]] const MemoryControl* find(ControlHandle handle) const;
    [[nodiscard]] const MemoryControl* find(const std::string& name) const;

    /// Controls in creation order
    [[nodiscard]] const std::vector<ControlHandle>& creation_order() const noexcept { return m_order; }

    [[nodiscard]] std::size_t control_count() const noexcept { return m_controls.size(); }

    /// Change the client size of a control and notify its resize subscribers
    void resize(ControlHandle handle, std::uint32_t width, std::uint32_t height);

    // =========================================================================
    // Instrumentation
    // =========================================================================

    [[nodiscard]] std::size_t deferred_batches() const noexcept { return m_batches; }
    [[nodiscard]] std::size_t geometry_updates() const noexcept { return m_updates; }
    [[nodiscard]] std::size_t subscription_count() const noexcept { return m_subscriptions.size(); }
    [[nodiscard]] bool in_deferred() const noexcept { return m_deferred_depth > 0; }

    // =========================================================================
    // IWindowSystem
    // =========================================================================

    [[nodiscard]] bool is_valid(ControlHandle handle) const override;
    [[nodiscard]] Size size(ControlHandle handle) const override;
    [[nodiscard]] Point position(ControlHandle handle) const override;

    void set_position(ControlHandle handle, std::int32_t x, std::int32_t y) override;
    void set_size(ControlHandle handle, std::uint32_t width, std::uint32_t height) override;

    void begin_deferred(std::size_t expected_count) override;
    void end_deferred() override;

    [[nodiscard]] ResizeToken bind_resize(ControlHandle parent, ResizeCallback callback) override;
    void unbind_resize(ResizeToken token) override;

private:
    struct Subscription {
        ControlHandle parent;
        ResizeCallback callback;
    };

    std::map<ControlHandle, MemoryControl> m_controls;
    std::vector<ControlHandle> m_order;
    std::map<std::uint64_t, Subscription> m_subscriptions;
    std::uint64_t m_next_handle = 1;
    std::uint64_t m_next_token = 1;
    std::size_t m_deferred_depth = 0;
    std::size_t m_batches = 0;
    std::size_t m_updates = 0;
};

} // namespace loom_layout
