/// @file dyn.cpp
/// @brief Anchor layout scaling children with the parent size

#include <loom/layout/dyn.hpp>

#include <loom/core/log.hpp>

#include <algorithm>

namespace loom_layout {

namespace {

/// `pct` percent of `dimension`, truncated toward zero
std::int32_t scaled(std::int32_t pct, std::uint32_t dimension) {
    if (pct <= 0) {
        return 0;
    }
    const float delta = 0.01f * static_cast<float>(dimension);
    return static_cast<std::int32_t>(delta * static_cast<float>(pct));
}

} // anonymous namespace

DynLayout::~DynLayout() = default;

DynLayoutBuilder DynLayout::builder() {
    return DynLayoutBuilder();
}

loom_core::Result<void> DynLayout::add_child(ControlHandle control, DynRatio move, DynRatio size) {
    return add_child_item(DynLayoutItem(control, move, size));
}

loom_core::Result<void> DynLayout::add_child_item(const DynLayoutItem& item) {
    if (!is_bound()) {
        return loom_core::Error(loom_core::LayoutError::missing_parent(kind()));
    }
    IWindowSystem* system = window_system();
    if (item.control.is_null() || !system->is_valid(item.control)) {
        return loom_core::Error(loom_core::LayoutError::backend_failure(
            describe(), "child " + item.control.to_string() + " is not a live control"));
    }

    const Size container = system->logical_size(parent());
    const Point pos = system->logical_position(item.control);
    const Size size = system->logical_size(item.control);

    // Baseline such that compute() at the current parent size reproduces the current geometry
    DynLayoutItem stored = item;
    stored.pos_init = Point{pos.x - scaled(item.move.x, container.width),
                            pos.y - scaled(item.move.y, container.height)};
    stored.width_init = static_cast<std::int32_t>(size.width) - scaled(item.size.x, container.width);
    stored.height_init = static_cast<std::int32_t>(size.height) - scaled(item.size.y, container.height);

    loom_core::layout_logger()->trace("{}: child {} baseline ({}, {}) {}x{}", describe(), item.control.to_string(),
                                      stored.pos_init.x, stored.pos_init.y, stored.width_init, stored.height_init);

    m_children.push_back(stored);
    return loom_core::Ok();
}

loom_core::Result<void> DynLayout::remove_child(ControlHandle control) {
    auto it = std::find_if(m_children.begin(), m_children.end(),
                           [&](const DynLayoutItem& item) { return item.control == control; });
    if (it == m_children.end()) {
        return loom_core::Error(loom_core::LayoutError::child_not_found(describe(), control.to_string()));
    }
    m_children.erase(it);
    return loom_core::Ok();
}

bool DynLayout::has_child(ControlHandle control) const {
    return std::any_of(m_children.begin(), m_children.end(),
                       [&](const DynLayoutItem& item) { return item.control == control; });
}

void DynLayout::clear() {
    m_children.clear();
}

void DynLayout::do_compute(std::uint32_t width, std::uint32_t height) {
    IWindowSystem* system = window_system();
    for (const auto& item : m_children) {
        const std::int32_t x = item.pos_init.x + scaled(item.move.x, width);
        const std::int32_t y = item.pos_init.y + scaled(item.move.y, height);
        const std::int32_t w = item.width_init + scaled(item.size.x, width);
        const std::int32_t h = item.height_init + scaled(item.size.y, height);

        system->set_position(item.control, x, y);
        system->set_size(item.control, static_cast<std::uint32_t>(std::max(w, 0)),
                         static_cast<std::uint32_t>(std::max(h, 0)));
    }
}

// =============================================================================
// DynLayoutBuilder
// =============================================================================

loom_core::Result<void> DynLayoutBuilder::build(DynLayout& layout) {
    auto attached = layout.attach(m_system, m_parent);
    if (!attached) {
        return attached;
    }

    layout.m_children.clear();
    for (const auto& item : m_children) {
        auto added = layout.add_child_item(item);
        if (!added) {
            return added;
        }
    }

    layout.fit();
    return loom_core::Ok();
}

} // namespace loom_layout
