/// @file box.cpp
/// @brief Single-axis box layout engine

#include <loom/layout/box.hpp>

#include <loom/core/log.hpp>

#include <algorithm>

namespace loom_layout {

const char* box_layout_type_name(BoxLayoutType type) noexcept {
    switch (type) {
        case BoxLayoutType::Horizontal: return "Horizontal";
        case BoxLayoutType::Vertical: return "Vertical";
    }
    return "Unknown";
}

namespace {

loom_core::Result<void> validate_item(const char* kind, const BoxLayoutItem& item,
                                      std::optional<std::uint32_t> max_cell) {
    if (item.control.is_null()) {
        return loom_core::Error(loom_core::LayoutError::invalid_cell(
            kind, "null control at cell " + std::to_string(item.cell)));
    }
    if (item.cell_span == 0) {
        return loom_core::Error(loom_core::LayoutError::invalid_cell(
            kind, "span of " + item.control.to_string() + " must be at least 1"));
    }
    if (max_cell && static_cast<std::uint64_t>(item.cell) + item.cell_span > *max_cell) {
        return loom_core::Error(loom_core::LayoutError::invalid_cell(
            kind, "cell " + std::to_string(item.cell) + " exceeds max_cell " + std::to_string(*max_cell)));
    }
    return loom_core::Ok();
}

} // anonymous namespace

// =============================================================================
// BoxLayout
// =============================================================================

BoxLayout::~BoxLayout() = default;

BoxLayoutBuilder BoxLayout::builder() {
    return BoxLayoutBuilder();
}

loom_core::Result<void> BoxLayout::check_item(const BoxLayoutItem& item) const {
    return validate_item(kind(), item, m_max_cell);
}

loom_core::Result<void> BoxLayout::add_child(std::uint32_t cell, ControlHandle control) {
    return add_child_item(BoxLayoutItem(control, cell));
}

loom_core::Result<void> BoxLayout::add_child_item(BoxLayoutItem item) {
    auto valid = check_item(item);
    if (!valid) {
        return valid.error();
    }
    m_children.push_back(item);
    refit();
    return loom_core::Ok();
}

loom_core::Result<void> BoxLayout::remove_child(ControlHandle control) {
    auto it = std::find_if(m_children.begin(), m_children.end(),
                           [&](const BoxLayoutItem& item) { return item.control == control; });
    if (it == m_children.end()) {
        return loom_core::Error(loom_core::LayoutError::child_not_found(describe(), control.to_string()));
    }
    m_children.erase(it);
    refit();
    return loom_core::Ok();
}

loom_core::Result<void> BoxLayout::move_child(ControlHandle control, std::uint32_t cell) {
    auto it = std::find_if(m_children.begin(), m_children.end(),
                           [&](const BoxLayoutItem& item) { return item.control == control; });
    if (it == m_children.end()) {
        return loom_core::Error(loom_core::LayoutError::child_not_found(describe(), control.to_string()));
    }

    BoxLayoutItem moved = *it;
    moved.cell = cell;
    auto valid = check_item(moved);
    if (!valid) {
        return valid.error();
    }

    *it = moved;
    refit();
    return loom_core::Ok();
}

bool BoxLayout::has_child(ControlHandle control) const {
    return std::any_of(m_children.begin(), m_children.end(),
                       [&](const BoxLayoutItem& item) { return item.control == control; });
}

void BoxLayout::set_layout_type(BoxLayoutType type) {
    m_type = type;
    refit();
}

void BoxLayout::set_margin(const Margin& margin) {
    m_margin = margin;
    refit();
}

void BoxLayout::set_spacing(std::uint32_t spacing) {
    m_spacing = spacing;
    refit();
}

void BoxLayout::set_min_size(Size size) {
    m_min_size = size;
    refit();
}

void BoxLayout::set_max_size(Size size) {
    m_max_size = size;
    refit();
}

void BoxLayout::set_max_cell(std::optional<std::uint32_t> count) {
    m_max_cell = count;
    refit();
}

std::uint32_t BoxLayout::cell_count() const {
    if (m_max_cell) {
        return *m_max_cell;
    }
    std::uint32_t count = 0;
    for (const auto& item : m_children) {
        count = std::max(count, item.cell + item.cell_span);
    }
    return count;
}

void BoxLayout::do_compute(std::uint32_t width, std::uint32_t height) {
    const std::uint32_t cells = cell_count();
    if (cells == 0) {
        return;
    }

    width = std::clamp(width, m_min_size.width, std::max(m_min_size.width, m_max_size.width));
    height = std::clamp(height, m_min_size.height, std::max(m_min_size.height, m_max_size.height));

    const auto [top, right, bottom, left] = m_margin;
    const bool horizontal = m_type == BoxLayoutType::Horizontal;

    // The main axis holds `cells` spaced cells, the cross axis a single one
    const std::uint32_t main_cells = cells;
    const std::uint32_t main_total = horizontal ? width : height;
    const std::uint32_t cross_total = horizontal ? height : width;
    const std::uint32_t main_lead = horizontal ? left : top;
    const std::uint32_t main_trail = horizontal ? right : bottom;
    const std::uint32_t cross_lead = horizontal ? top : left;
    const std::uint32_t cross_trail = horizontal ? bottom : right;

    const std::int64_t reserved_main = static_cast<std::int64_t>(main_lead) + main_trail +
                                       static_cast<std::int64_t>(m_spacing) * 2 * main_cells;
    const std::int64_t reserved_cross = static_cast<std::int64_t>(cross_lead) + cross_trail +
                                        static_cast<std::int64_t>(m_spacing) * 2;

    if (static_cast<std::int64_t>(main_total) <= reserved_main ||
        static_cast<std::int64_t>(cross_total) <= reserved_cross) {
        loom_core::layout_logger()->trace("{}: {}x{} leaves no room for {} cells, skipping",
                                          describe(), width, height, cells);
        return;
    }

    std::vector<std::uint32_t> main_sizes;
    detail::distribute(static_cast<std::uint32_t>(main_total - reserved_main), main_cells, main_sizes);
    const std::vector<std::uint32_t> cross_sizes{static_cast<std::uint32_t>(cross_total - reserved_cross)};

    IWindowSystem* system = window_system();
    for (const auto& item : m_children) {
        auto main = detail::span_geometry(main_sizes, main_lead, m_spacing, item.cell, item.cell_span);
        auto cross = detail::span_geometry(cross_sizes, cross_lead, m_spacing, 0, 1);

        const auto main_extent = static_cast<std::uint32_t>(std::max<std::int64_t>(main.extent, 0));
        const auto cross_extent = static_cast<std::uint32_t>(std::max<std::int64_t>(cross.extent, 0));

        if (horizontal) {
            system->set_position(item.control, static_cast<std::int32_t>(main.offset),
                                 static_cast<std::int32_t>(cross.offset));
            system->set_size(item.control, main_extent, cross_extent);
        } else {
            system->set_position(item.control, static_cast<std::int32_t>(cross.offset),
                                 static_cast<std::int32_t>(main.offset));
            system->set_size(item.control, cross_extent, main_extent);
        }
    }
}

// =============================================================================
// BoxLayoutBuilder
// =============================================================================

loom_core::Result<void> BoxLayoutBuilder::build(BoxLayout& layout) {
    for (const auto& item : m_children) {
        auto valid = validate_item(layout.kind(), item, m_max_cell);
        if (!valid) {
            return valid;
        }
    }

    auto attached = layout.attach(m_system, m_parent);
    if (!attached) {
        return attached;
    }

    layout.m_children = m_children;
    layout.m_type = m_type;
    layout.m_margin = m_margin;
    layout.m_spacing = m_spacing;
    layout.m_min_size = m_min_size;
    layout.m_max_size = m_max_size;
    layout.m_max_cell = m_max_cell;

    layout.fit();
    return loom_core::Ok();
}

} // namespace loom_layout
