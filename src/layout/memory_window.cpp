/// @file memory_window.cpp
/// @brief Headless window system

#include <loom/layout/memory_window.hpp>

#include <loom/core/log.hpp>

#include <vector>

namespace loom_layout {

ControlHandle MemoryWindowSystem::create(const std::string& type, const std::string& name, ControlHandle parent,
                                         Point position, Size size) {
    ControlHandle handle{m_next_handle++};
    m_controls[handle] = MemoryControl{handle, parent, type, name, position, size};
    m_order.push_back(handle);
    loom_core::layout_logger()->trace("created {} '{}' as {}", type, name, handle.to_string());
    return handle;
}

void MemoryWindowSystem::destroy(ControlHandle handle) {
    m_controls.erase(handle);
    for (auto it = m_subscriptions.begin(); it != m_subscriptions.end();) {
        if (it->second.parent == handle) {
            it = m_subscriptions.erase(it);
        } else {
            ++it;
        }
    }
}

const MemoryControl* MemoryWindowSystem::find(ControlHandle handle) const {
    auto it = m_controls.find(handle);
    return it != m_controls.end() ? &it->second : nullptr;
}

const MemoryControl* MemoryWindowSystem::find(const std::string& name) const {
    for (const auto& handle : m_order) {
        auto it = m_controls.find(handle);
        if (it != m_controls.end() && it->second.name == name) {
            return &it->second;
        }
    }
    return nullptr;
}

void MemoryWindowSystem::resize(ControlHandle handle, std::uint32_t width, std::uint32_t height) {
    auto it = m_controls.find(handle);
    if (it == m_controls.end()) {
        return;
    }
    it->second.size = Size{width, height};

    // Copy first: a handler may bind or unbind subscriptions
    std::vector<ResizeCallback> callbacks;
    for (const auto& [id, sub] : m_subscriptions) {
        if (sub.parent == handle) {
            callbacks.push_back(sub.callback);
        }
    }
    for (const auto& callback : callbacks) {
        callback(width, height);
    }
}

bool MemoryWindowSystem::is_valid(ControlHandle handle) const {
    return m_controls.count(handle) != 0;
}

Size MemoryWindowSystem::size(ControlHandle handle) const {
    const MemoryControl* control = find(handle);
    return control ? control->size : Size{};
}

Point MemoryWindowSystem::position(ControlHandle handle) const {
    const MemoryControl* control = find(handle);
    return control ? control->position : Point{};
}

void MemoryWindowSystem::set_position(ControlHandle handle, std::int32_t x, std::int32_t y) {
    auto it = m_controls.find(handle);
    if (it == m_controls.end()) {
        return;
    }
    it->second.position = Point{x, y};
    ++m_updates;
}

void MemoryWindowSystem::set_size(ControlHandle handle, std::uint32_t width, std::uint32_t height) {
    auto it = m_controls.find(handle);
    if (it == m_controls.end()) {
        return;
    }
    it->second.size = Size{width, height};
    ++m_updates;
}

void MemoryWindowSystem::begin_deferred(std::size_t expected_count) {
    (void)expected_count;
    if (m_deferred_depth++ == 0) {
        ++m_batches;
    }
}

void MemoryWindowSystem::end_deferred() {
    if (m_deferred_depth > 0) {
        --m_deferred_depth;
    }
}

ResizeToken MemoryWindowSystem::bind_resize(ControlHandle parent, ResizeCallback callback) {
    ResizeToken token{m_next_token++};
    m_subscriptions[token.id] = Subscription{parent, std::move(callback)};
    return token;
}

void MemoryWindowSystem::unbind_resize(ResizeToken token) {
    m_subscriptions.erase(token.id);
}

} // namespace loom_layout
