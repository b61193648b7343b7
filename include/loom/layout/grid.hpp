#pragma once

/// @file grid.hpp
/// @brief Grid layout engine

#include "layout.hpp"

#include <limits>
#include <optional>
#include <vector>

namespace loom_layout {

/// Control placed in a grid cell range
struct GridLayoutItem {
    ControlHandle control;
    std::uint32_t col = 0;
    std::uint32_t row = 0;
    std::uint32_t col_span = 1;
    std::uint32_t row_span = 1;

    GridLayoutItem() = default;
    GridLayoutItem(ControlHandle c, std::uint32_t column, std::uint32_t r,
                   std::uint32_t cspan = 1, std::uint32_t rspan = 1)
        : control(c), col(column), row(r), col_span(cspan), row_span(rspan) {}
};

// =============================================================================
// GridLayout
// =============================================================================

/// @brief Places children in a grid of equally sized cells
///
/// The column count is `max_column` when set, otherwise the largest
/// `col + col_span` among the children; rows work the same way. Each cell
/// is surrounded by `spacing` on every side and the grid by `margin`.
/// A container too small to give every cell a non-negative size leaves the
/// children untouched.
class GridLayout : public Layout {
public:
    GridLayout() : Layout("GridLayout") {}
    ~GridLayout() override;

    [[nodiscard]] static GridLayoutBuilder builder();

    // =========================================================================
    // Children
    // =========================================================================

    [[nodiscard]] loom_core::Result<void> add_child(std::uint32_t col, std::uint32_t row, ControlHandle control);
    [[nodiscard]] loom_core::Result<void> add_child_item(GridLayoutItem item);

    [[nodiscard]] loom_core::Result<void> remove_child(ControlHandle control);
    [[nodiscard]] loom_core::Result<void> remove_child_by_pos(std::uint32_t col, std::uint32_t row);

    [[nodiscard]] loom_core::Result<void> move_child(ControlHandle control, std::uint32_t col, std::uint32_t row);
    [[nodiscard]] loom_core::Result<void> move_child_by_pos(std::uint32_t col, std::uint32_t row,
                                                            std::uint32_t new_col, std::uint32_t new_row);

    [[nodiscard]] bool has_child(ControlHandle control) const;
    [[nodiscard]] const std::vector<GridLayoutItem>& children() const noexcept { return m_children; }

    // =========================================================================
    // Configuration
    // =========================================================================

    [[nodiscard]] const Margin& margin() const noexcept { return m_margin; }
    void set_margin(const Margin& margin);

    [[nodiscard]] std::uint32_t spacing() const noexcept { return m_spacing; }
    void set_spacing(std::uint32_t spacing);

    [[nodiscard]] Size min_size() const noexcept { return m_min_size; }
    void set_min_size(Size size);

    [[nodiscard]] Size max_size() const noexcept { return m_max_size; }
    void set_max_size(Size size);

    [[nodiscard]] std::optional<std::uint32_t> max_column() const noexcept { return m_max_column; }
    void set_max_column(std::optional<std::uint32_t> count);

    [[nodiscard]] std::optional<std::uint32_t> max_row() const noexcept { return m_max_row; }
    void set_max_row(std::optional<std::uint32_t> count);

    /// Columns and rows the next compute will use
    [[nodiscard]] std::uint32_t column_count() const;
    [[nodiscard]] std::uint32_t row_count() const;

protected:
    void do_compute(std::uint32_t width, std::uint32_t height) override;
    [[nodiscard]] std::size_t child_count() const noexcept override { return m_children.size(); }

private:
    friend class GridLayoutBuilder;

    [[nodiscard]] loom_core::Result<void> check_item(const GridLayoutItem& item) const;
    std::vector<GridLayoutItem>::iterator find_child(ControlHandle control);
    std::vector<GridLayoutItem>::iterator find_at(std::uint32_t col, std::uint32_t row);

    std::vector<GridLayoutItem> m_children;
    Margin m_margin{k_default_margin, k_default_margin, k_default_margin, k_default_margin};
    std::uint32_t m_spacing = k_default_spacing;
    Size m_min_size{0, 0};
    Size m_max_size{std::numeric_limits<std::uint32_t>::max(), std::numeric_limits<std::uint32_t>::max()};
    std::optional<std::uint32_t> m_max_column;
    std::optional<std::uint32_t> m_max_row;
};

// =============================================================================
// GridLayoutBuilder
// =============================================================================

class GridLayoutBuilder {
public:
    GridLayoutBuilder& parent(ControlHandle parent) { m_parent = parent; return *this; }
    GridLayoutBuilder& window_system(IWindowSystem* system) { m_system = system; return *this; }
    GridLayoutBuilder& margin(const Margin& margin) { m_margin = margin; return *this; }
    GridLayoutBuilder& spacing(std::uint32_t spacing) { m_spacing = spacing; return *this; }
    GridLayoutBuilder& min_size(Size size) { m_min_size = size; return *this; }
    GridLayoutBuilder& max_size(Size size) { m_max_size = size; return *this; }
    GridLayoutBuilder& max_column(std::uint32_t count) { m_max_column = count; return *this; }
    GridLayoutBuilder& max_row(std::uint32_t count) { m_max_row = count; return *this; }

    GridLayoutBuilder& child(std::uint32_t col, std::uint32_t row, ControlHandle control) {
        m_children.emplace_back(control, col, row);
        return *this;
    }

    GridLayoutBuilder& child_item(GridLayoutItem item) {
        m_children.push_back(item);
        return *this;
    }

    /// Validate, replace the layout's configuration, bind it to the parent and fit it
    [[nodiscard]] loom_core::Result<void> build(GridLayout& layout);

private:
    ControlHandle m_parent;
    IWindowSystem* m_system = nullptr;
    Margin m_margin{k_default_margin, k_default_margin, k_default_margin, k_default_margin};
    std::uint32_t m_spacing = k_default_spacing;
    Size m_min_size{0, 0};
    Size m_max_size{std::numeric_limits<std::uint32_t>::max(), std::numeric_limits<std::uint32_t>::max()};
    std::optional<std::uint32_t> m_max_column;
    std::optional<std::uint32_t> m_max_row;
    std::vector<GridLayoutItem> m_children;
};

} // namespace loom_layout
