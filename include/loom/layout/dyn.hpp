#pragma once

/// @file dyn.hpp
/// @brief Anchor layout scaling children with the parent size

#include "layout.hpp"

#include <vector>

namespace loom_layout {

/// Percentages per axis; 0 leaves the axis fixed
struct DynRatio {
    std::int32_t x = 0;
    std::int32_t y = 0;
};

/// Child of a DynLayout with its add-time baseline
struct DynLayoutItem {
    ControlHandle control;
    DynRatio move;
    DynRatio size;

    // Baseline, captured when the child is added
    Point pos_init;
    std::int32_t width_init = 0;
    std::int32_t height_init = 0;

    DynLayoutItem() = default;
    DynLayoutItem(ControlHandle c, DynRatio move_ratio, DynRatio size_ratio)
        : control(c), move(move_ratio), size(size_ratio) {}
};

// =============================================================================
// DynLayout
// =============================================================================

/// @brief Moves and stretches children by a percentage of the parent size
///
/// A child's baseline is computed once when it is added, from its current
/// geometry and the current parent size. A compute pass places it at
/// `baseline + pct * 0.01 * parent_dimension` on each axis with a non-zero
/// percentage. A child anchored with `move.x = 100` therefore follows the
/// right edge of its parent.
class DynLayout : public Layout {
public:
    DynLayout() : Layout("DynLayout") {}
    ~DynLayout() override;

    [[nodiscard]] static DynLayoutBuilder builder();

    /// Requires a bound layout; the baseline is taken from the window system
    [[nodiscard]] loom_core::Result<void> add_child(ControlHandle control, DynRatio move, DynRatio size);
    [[nodiscard]] loom_core::Result<void> add_child_item(const DynLayoutItem& item);
    [[nodiscard]] loom_core::Result<void> remove_child(ControlHandle control);
    [[nodiscard]] bool has_child(ControlHandle control) const;
    void clear();

    [[nodiscard]] const std::vector<DynLayoutItem>& children() const noexcept { return m_children; }

protected:
    void do_compute(std::uint32_t width, std::uint32_t height) override;
    [[nodiscard]] std::size_t child_count() const noexcept override { return m_children.size(); }

private:
    friend class DynLayoutBuilder;

    std::vector<DynLayoutItem> m_children;
};

// =============================================================================
// DynLayoutBuilder
// =============================================================================

class DynLayoutBuilder {
public:
    DynLayoutBuilder& parent(ControlHandle parent) { m_parent = parent; return *this; }
    DynLayoutBuilder& window_system(IWindowSystem* system) { m_system = system; return *this; }

    DynLayoutBuilder& child(ControlHandle control, DynRatio move, DynRatio size) {
        m_children.emplace_back(control, move, size);
        return *this;
    }

    DynLayoutBuilder& child_item(DynLayoutItem item) {
        m_children.push_back(item);
        return *this;
    }

    [[nodiscard]] loom_core::Result<void> build(DynLayout& layout);

private:
    ControlHandle m_parent;
    IWindowSystem* m_system = nullptr;
    std::vector<DynLayoutItem> m_children;
};

} // namespace loom_layout
