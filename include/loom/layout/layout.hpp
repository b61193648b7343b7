#pragma once

/// @file layout.hpp
/// @brief Common base of the layout engines

#include "window.hpp"

#include <loom/core/error.hpp>

#include <array>
#include <optional>
#include <string>
#include <vector>

namespace loom_layout {

/// Margins in top, right, bottom, left order
using Margin = std::array<std::uint32_t, 4>;

inline constexpr std::uint32_t k_default_margin = 5;
inline constexpr std::uint32_t k_default_spacing = 5;

// =============================================================================
// Layout
// =============================================================================

/// @brief Positions the children of one parent control
///
/// A layout is bound to its parent by its builder. While bound it listens to
/// the parent's resize notifications and recomputes every child rectangle
/// from its stored configuration and the new client size. Nothing computed
/// by a previous pass is reused, so `compute` may run any number of times.
///
/// Layouts are owned by the UI thread. They hold a pointer to the window
/// system, which must outlive them.
class Layout {
public:
    explicit Layout(const char* kind) : m_kind(kind) {}
    virtual ~Layout();

    // Non-copyable, non-movable: the resize subscription captures `this`
    Layout(const Layout&) = delete;
    Layout& operator=(const Layout&) = delete;
    Layout(Layout&&) = delete;
    Layout& operator=(Layout&&) = delete;

    /// Reposition every child for a parent client area of the given size
    void compute(std::uint32_t width, std::uint32_t height);

    /// Compute from the parent's current client size
    void fit();

    [[nodiscard]] bool is_bound() const noexcept { return m_system != nullptr; }
    [[nodiscard]] ControlHandle parent() const noexcept { return m_parent; }
    [[nodiscard]] IWindowSystem* window_system() const noexcept { return m_system; }
    [[nodiscard]] const char* kind() const noexcept { return m_kind; }

    /// Number of compute passes that reached the engine
    [[nodiscard]] std::uint64_t compute_count() const noexcept { return m_compute_count; }

protected:
    /// Engine-specific placement of the children
    virtual void do_compute(std::uint32_t width, std::uint32_t height) = 0;

    [[nodiscard]] virtual std::size_t child_count() const noexcept = 0;

    /// Bind to `parent`; `system` falls back to the default window system
    [[nodiscard]] loom_core::Result<void> attach(IWindowSystem* system, ControlHandle parent);

    /// Drop the resize subscription and forget the parent
    void detach();

    /// Recompute after a configuration change when bound
    void refit();

    /// Handle to log in messages
    [[nodiscard]] std::string describe() const;

private:
    const char* m_kind;
    IWindowSystem* m_system = nullptr;
    ControlHandle m_parent;
    ResizeToken m_token;
    bool m_computing = false;
    std::uint64_t m_compute_count = 0;
};

namespace detail {

/// Split `available` into `count` cells; the first `available % count` cells get one extra pixel
void distribute(std::uint32_t available, std::uint32_t count, std::vector<std::uint32_t>& out);

/// Offset and extent of cells [first, first + span) in a spaced track
struct Span {
    std::int64_t offset = 0;
    std::int64_t extent = 0;
};

[[nodiscard]] Span span_geometry(const std::vector<std::uint32_t>& cells, std::uint32_t leading_margin,
                                 std::uint32_t spacing, std::uint32_t first, std::uint32_t span);

} // namespace detail

} // namespace loom_layout
