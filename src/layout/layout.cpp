/// @file layout.cpp
/// @brief Layout base class and shared cell arithmetic

#include <loom/layout/layout.hpp>

#include <loom/core/log.hpp>

#include <algorithm>
#include <atomic>
#include <numeric>

namespace loom_layout {

// =============================================================================
// Default window system
// =============================================================================

namespace {

std::atomic<IWindowSystem*> g_default_system{nullptr};

} // anonymous namespace

void set_default_window_system(IWindowSystem* system) noexcept {
    g_default_system.store(system);
}

IWindowSystem* default_window_system() noexcept {
    return g_default_system.load();
}

std::string ControlHandle::to_string() const {
    return "#" + std::to_string(value);
}

// =============================================================================
// Layout
// =============================================================================

Layout::~Layout() {
    detach();
}

void Layout::compute(std::uint32_t width, std::uint32_t height) {
    if (!m_system) {
        return;
    }
    // Moving children may resize the parent, which calls back into compute
    if (m_computing) {
        return;
    }
    m_computing = true;

    m_system->begin_deferred(child_count());
    do_compute(width, height);
    m_system->end_deferred();

    ++m_compute_count;
    m_computing = false;
}

void Layout::fit() {
    if (!m_system) {
        return;
    }
    const Size size = m_system->logical_size(m_parent);
    compute(size.width, size.height);
}

loom_core::Result<void> Layout::attach(IWindowSystem* system, ControlHandle parent) {
    detach();

    if (parent.is_null()) {
        return loom_core::Error(loom_core::LayoutError::missing_parent(m_kind));
    }

    IWindowSystem* target = system ? system : default_window_system();
    if (!target) {
        return loom_core::Error(loom_core::LayoutError::backend_failure(m_kind, "no window system available"));
    }
    if (!target->is_valid(parent)) {
        return loom_core::Error(loom_core::LayoutError::backend_failure(
            m_kind, "parent " + parent.to_string() + " is not a live control"));
    }

    m_system = target;
    m_parent = parent;
    m_token = m_system->bind_resize(parent, [this](std::uint32_t width, std::uint32_t height) {
        compute(static_cast<std::uint32_t>(m_system->physical_to_logical(static_cast<std::int32_t>(width))),
                static_cast<std::uint32_t>(m_system->physical_to_logical(static_cast<std::int32_t>(height))));
    });

    loom_core::layout_logger()->debug("{} bound to parent {}", m_kind, parent.to_string());
    return loom_core::Ok();
}

void Layout::detach() {
    if (m_system && m_token.is_valid()) {
        m_system->unbind_resize(m_token);
    }
    m_token = {};
    m_system = nullptr;
    m_parent = {};
}

void Layout::refit() {
    if (m_system) {
        fit();
    }
}

std::string Layout::describe() const {
    return std::string(m_kind) + "(" + m_parent.to_string() + ")";
}

// =============================================================================
// Cell arithmetic
// =============================================================================

namespace detail {

void distribute(std::uint32_t available, std::uint32_t count, std::vector<std::uint32_t>& out) {
    out.assign(count, 0);
    if (count == 0) {
        return;
    }
    std::uint32_t base = available / count;
    std::uint32_t extra = available % count;
    for (std::uint32_t i = 0; i < count; ++i) {
        out[i] = base + (i < extra ? 1u : 0u);
    }
}

Span span_geometry(const std::vector<std::uint32_t>& cells, std::uint32_t leading_margin,
                   std::uint32_t spacing, std::uint32_t first, std::uint32_t span) {
    const std::size_t begin = std::min<std::size_t>(first, cells.size());
    const std::size_t end = std::min<std::size_t>(static_cast<std::size_t>(first) + span, cells.size());

    Span out;
    std::int64_t before = std::accumulate(cells.begin(), cells.begin() + static_cast<std::ptrdiff_t>(begin),
                                          std::int64_t{0});
    out.offset = static_cast<std::int64_t>(leading_margin) + spacing +
                 static_cast<std::int64_t>(spacing) * 2 * first + before;

    std::int64_t covered = std::accumulate(cells.begin() + static_cast<std::ptrdiff_t>(begin),
                                           cells.begin() + static_cast<std::ptrdiff_t>(end), std::int64_t{0});
    out.extent = covered + static_cast<std::int64_t>(spacing) * 2 * (static_cast<std::int64_t>(span) - 1);
    return out;
}

} // namespace detail

} // namespace loom_layout
