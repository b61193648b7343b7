/// @file grid.cpp
/// @brief Grid layout engine

#include <loom/layout/grid.hpp>

#include <loom/core/log.hpp>

#include <algorithm>

namespace loom_layout {

namespace {

std::string cell_name(std::uint32_t col, std::uint32_t row) {
    return "cell (" + std::to_string(col) + ", " + std::to_string(row) + ")";
}

loom_core::Result<void> validate_item(const char* kind, const GridLayoutItem& item,
                                      std::optional<std::uint32_t> max_column,
                                      std::optional<std::uint32_t> max_row) {
    if (item.control.is_null()) {
        return loom_core::Error(loom_core::LayoutError::invalid_cell(kind, "null control at " +
                                                                               cell_name(item.col, item.row)));
    }
    if (item.col_span == 0 || item.row_span == 0) {
        return loom_core::Error(loom_core::LayoutError::invalid_cell(
            kind, "span of " + item.control.to_string() + " must be at least 1"));
    }
    if (max_column && static_cast<std::uint64_t>(item.col) + item.col_span > *max_column) {
        return loom_core::Error(loom_core::LayoutError::invalid_cell(
            kind, cell_name(item.col, item.row) + " exceeds max_column " + std::to_string(*max_column)));
    }
    if (max_row && static_cast<std::uint64_t>(item.row) + item.row_span > *max_row) {
        return loom_core::Error(loom_core::LayoutError::invalid_cell(
            kind, cell_name(item.col, item.row) + " exceeds max_row " + std::to_string(*max_row)));
    }
    return loom_core::Ok();
}

} // anonymous namespace

// =============================================================================
// GridLayout
// =============================================================================

GridLayout::~GridLayout() = default;

GridLayoutBuilder GridLayout::builder() {
    return GridLayoutBuilder();
}

loom_core::Result<void> GridLayout::check_item(const GridLayoutItem& item) const {
    return validate_item(kind(), item, m_max_column, m_max_row);
}

std::vector<GridLayoutItem>::iterator GridLayout::find_child(ControlHandle control) {
    return std::find_if(m_children.begin(), m_children.end(),
                        [&](const GridLayoutItem& item) { return item.control == control; });
}

std::vector<GridLayoutItem>::iterator GridLayout::find_at(std::uint32_t col, std::uint32_t row) {
    return std::find_if(m_children.begin(), m_children.end(),
                        [&](const GridLayoutItem& item) { return item.col == col && item.row == row; });
}

loom_core::Result<void> GridLayout::add_child(std::uint32_t col, std::uint32_t row, ControlHandle control) {
    return add_child_item(GridLayoutItem(control, col, row));
}

loom_core::Result<void> GridLayout::add_child_item(GridLayoutItem item) {
    auto valid = check_item(item);
    if (!valid) {
        return valid.error();
    }
    m_children.push_back(item);
    refit();
    return loom_core::Ok();
}

loom_core::Result<void> GridLayout::remove_child(ControlHandle control) {
    auto it = find_child(control);
    if (it == m_children.end()) {
        return loom_core::Error(loom_core::LayoutError::child_not_found(describe(), control.to_string()));
    }
    m_children.erase(it);
    refit();
    return loom_core::Ok();
}

loom_core::Result<void> GridLayout::remove_child_by_pos(std::uint32_t col, std::uint32_t row) {
    auto it = find_at(col, row);
    if (it == m_children.end()) {
        return loom_core::Error(loom_core::LayoutError::child_not_found(describe(), cell_name(col, row)));
    }
    m_children.erase(it);
    refit();
    return loom_core::Ok();
}

loom_core::Result<void> GridLayout::move_child(ControlHandle control, std::uint32_t col, std::uint32_t row) {
    auto it = find_child(control);
    if (it == m_children.end()) {
        return loom_core::Error(loom_core::LayoutError::child_not_found(describe(), control.to_string()));
    }

    GridLayoutItem moved = *it;
    moved.col = col;
    moved.row = row;
    auto valid = check_item(moved);
    if (!valid) {
        return valid.error();
    }

    *it = moved;
    refit();
    return loom_core::Ok();
}

loom_core::Result<void> GridLayout::move_child_by_pos(std::uint32_t col, std::uint32_t row,
                                                      std::uint32_t new_col, std::uint32_t new_row) {
    auto it = find_at(col, row);
    if (it == m_children.end()) {
        return loom_core::Error(loom_core::LayoutError::child_not_found(describe(), cell_name(col, row)));
    }
    return move_child(it->control, new_col, new_row);
}

bool GridLayout::has_child(ControlHandle control) const {
    return std::any_of(m_children.begin(), m_children.end(),
                       [&](const GridLayoutItem& item) { return item.control == control; });
}

void GridLayout::set_margin(const Margin& margin) {
    m_margin = margin;
    refit();
}

void GridLayout::set_spacing(std::uint32_t spacing) {
    m_spacing = spacing;
    refit();
}

void GridLayout::set_min_size(Size size) {
    m_min_size = size;
    refit();
}

void GridLayout::set_max_size(Size size) {
    m_max_size = size;
    refit();
}

void GridLayout::set_max_column(std::optional<std::uint32_t> count) {
    m_max_column = count;
    refit();
}

void GridLayout::set_max_row(std::optional<std::uint32_t> count) {
    m_max_row = count;
    refit();
}

std::uint32_t GridLayout::column_count() const {
    if (m_max_column) {
        return *m_max_column;
    }
    std::uint32_t count = 0;
    for (const auto& item : m_children) {
        count = std::max(count, item.col + item.col_span);
    }
    return count;
}

std::uint32_t GridLayout::row_count() const {
    if (m_max_row) {
        return *m_max_row;
    }
    std::uint32_t count = 0;
    for (const auto& item : m_children) {
        count = std::max(count, item.row + item.row_span);
    }
    return count;
}

void GridLayout::do_compute(std::uint32_t width, std::uint32_t height) {
    const std::uint32_t columns = column_count();
    const std::uint32_t rows = row_count();
    if (columns == 0 || rows == 0) {
        return;
    }

    width = std::clamp(width, m_min_size.width, std::max(m_min_size.width, m_max_size.width));
    height = std::clamp(height, m_min_size.height, std::max(m_min_size.height, m_max_size.height));

    const auto [top, right, bottom, left] = m_margin;
    const std::int64_t reserved_w = static_cast<std::int64_t>(left) + right +
                                    static_cast<std::int64_t>(m_spacing) * 2 * columns;
    const std::int64_t reserved_h = static_cast<std::int64_t>(top) + bottom +
                                    static_cast<std::int64_t>(m_spacing) * 2 * rows;

    if (static_cast<std::int64_t>(width) <= reserved_w || static_cast<std::int64_t>(height) <= reserved_h) {
        loom_core::layout_logger()->trace("{}: {}x{} leaves no room for {}x{} cells, skipping",
                                          describe(), width, height, columns, rows);
        return;
    }

    std::vector<std::uint32_t> widths;
    std::vector<std::uint32_t> heights;
    detail::distribute(static_cast<std::uint32_t>(width - reserved_w), columns, widths);
    detail::distribute(static_cast<std::uint32_t>(height - reserved_h), rows, heights);

    IWindowSystem* system = window_system();
    for (const auto& item : m_children) {
        auto x = detail::span_geometry(widths, left, m_spacing, item.col, item.col_span);
        auto y = detail::span_geometry(heights, top, m_spacing, item.row, item.row_span);

        system->set_position(item.control, static_cast<std::int32_t>(x.offset), static_cast<std::int32_t>(y.offset));
        system->set_size(item.control, static_cast<std::uint32_t>(std::max<std::int64_t>(x.extent, 0)),
                         static_cast<std::uint32_t>(std::max<std::int64_t>(y.extent, 0)));
    }
}

// =============================================================================
// GridLayoutBuilder
// =============================================================================

loom_core::Result<void> GridLayoutBuilder::build(GridLayout& layout) {
    for (const auto& item : m_children) {
        auto valid = validate_item(layout.kind(), item, m_max_column, m_max_row);
        if (!valid) {
            return valid;
        }
    }

    auto attached = layout.attach(m_system, m_parent);
    if (!attached) {
        return attached;
    }

    layout.m_children = m_children;
    layout.m_margin = m_margin;
    layout.m_spacing = m_spacing;
    layout.m_min_size = m_min_size;
    layout.m_max_size = m_max_size;
    layout.m_max_column = m_max_column;
    layout.m_max_row = m_max_row;

    layout.fit();
    return loom_core::Ok();
}

} // namespace loom_layout
