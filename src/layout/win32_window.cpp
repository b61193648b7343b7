/// @file win32_window.cpp
/// @brief IWindowSystem over native Win32 windows

#include <loom/layout/win32_window.hpp>

#include <loom/core/log.hpp>

#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>
#include <commctrl.h>

namespace loom_layout {

namespace {

HWND to_hwnd(ControlHandle handle) {
    return reinterpret_cast<HWND>(static_cast<std::uintptr_t>(handle.value));
}

LRESULT CALLBACK resize_subclass_proc(HWND hwnd, UINT msg, WPARAM wparam, LPARAM lparam,
                                      UINT_PTR id, DWORD_PTR data) {
    if (msg == WM_SIZE) {
        auto* system = reinterpret_cast<Win32WindowSystem*>(data);
        system->notify_resize(static_cast<std::uint64_t>(id), LOWORD(lparam), HIWORD(lparam));
    }
    return DefSubclassProc(hwnd, msg, wparam, lparam);
}

} // anonymous namespace

Win32WindowSystem::Win32WindowSystem() = default;

Win32WindowSystem::~Win32WindowSystem() {
    for (const auto& [token, handle] : m_subclassed) {
        RemoveWindowSubclass(to_hwnd(handle), resize_subclass_proc, static_cast<UINT_PTR>(token));
    }
}

bool Win32WindowSystem::is_valid(ControlHandle handle) const {
    return !handle.is_null() && IsWindow(to_hwnd(handle)) != FALSE;
}

Size Win32WindowSystem::size(ControlHandle handle) const {
    RECT rect{};
    HWND hwnd = to_hwnd(handle);
    // Containers report their client area, children their outer size
    if (GetParent(hwnd) == nullptr || (GetWindowLongPtrW(hwnd, GWL_STYLE) & WS_CHILD) == 0) {
        GetClientRect(hwnd, &rect);
    } else {
        GetWindowRect(hwnd, &rect);
    }
    return Size{static_cast<std::uint32_t>(rect.right - rect.left), static_cast<std::uint32_t>(rect.bottom - rect.top)};
}

Point Win32WindowSystem::position(ControlHandle handle) const {
    HWND hwnd = to_hwnd(handle);
    RECT rect{};
    GetWindowRect(hwnd, &rect);
    HWND parent = GetParent(hwnd);
    if (parent) {
        MapWindowPoints(HWND_DESKTOP, parent, reinterpret_cast<LPPOINT>(&rect), 2);
    }
    return Point{rect.left, rect.top};
}

void Win32WindowSystem::set_position(ControlHandle handle, std::int32_t x, std::int32_t y) {
    x = logical_to_physical(x);
    y = logical_to_physical(y);
    if (m_deferred_depth > 0) {
        Pending& pending = m_pending[handle];
        pending.has_position = true;
        pending.x = x;
        pending.y = y;
        return;
    }
    SetWindowPos(to_hwnd(handle), nullptr, x, y, 0, 0, SWP_NOZORDER | SWP_NOSIZE | SWP_NOACTIVATE);
}

void Win32WindowSystem::set_size(ControlHandle handle, std::uint32_t width, std::uint32_t height) {
    width = static_cast<std::uint32_t>(logical_to_physical(static_cast<std::int32_t>(width)));
    height = static_cast<std::uint32_t>(logical_to_physical(static_cast<std::int32_t>(height)));
    if (m_deferred_depth > 0) {
        Pending& pending = m_pending[handle];
        pending.has_size = true;
        pending.width = width;
        pending.height = height;
        return;
    }
    SetWindowPos(to_hwnd(handle), nullptr, 0, 0, static_cast<int>(width), static_cast<int>(height),
                 SWP_NOZORDER | SWP_NOMOVE | SWP_NOACTIVATE);
}

void Win32WindowSystem::begin_deferred(std::size_t expected_count) {
    (void)expected_count;
    ++m_deferred_depth;
}

void Win32WindowSystem::end_deferred() {
    if (m_deferred_depth == 0 || --m_deferred_depth > 0) {
        return;
    }

    HDWP batch = BeginDeferWindowPos(static_cast<int>(m_pending.size()));
    for (const auto& [handle, pending] : m_pending) {
        if (!batch) {
            apply(handle, pending);
            continue;
        }
        Pending merged = pending;
        if (!merged.has_position) {
            Point p = position(handle);
            merged.x = p.x;
            merged.y = p.y;
        }
        if (!merged.has_size) {
            Size s = size(handle);
            merged.width = s.width;
            merged.height = s.height;
        }
        batch = DeferWindowPos(batch, to_hwnd(handle), nullptr, merged.x, merged.y,
                               static_cast<int>(merged.width), static_cast<int>(merged.height),
                               SWP_NOZORDER | SWP_NOREPOSITION | SWP_NOACTIVATE | SWP_NOCOPYBITS);
    }
    if (batch) {
        EndDeferWindowPos(batch);
    } else {
        loom_core::layout_logger()->warn("DeferWindowPos batch failed, geometry applied individually");
    }
    m_pending.clear();
}

void Win32WindowSystem::apply(ControlHandle handle, const Pending& pending) {
    if (pending.has_position) {
        SetWindowPos(to_hwnd(handle), nullptr, pending.x, pending.y, 0, 0, SWP_NOZORDER | SWP_NOSIZE | SWP_NOACTIVATE);
    }
    if (pending.has_size) {
        SetWindowPos(to_hwnd(handle), nullptr, 0, 0, static_cast<int>(pending.width),
                     static_cast<int>(pending.height), SWP_NOZORDER | SWP_NOMOVE | SWP_NOACTIVATE);
    }
}

ResizeToken Win32WindowSystem::bind_resize(ControlHandle parent, ResizeCallback callback) {
    ResizeToken token{m_next_token++};
    if (!SetWindowSubclass(to_hwnd(parent), resize_subclass_proc, static_cast<UINT_PTR>(token.id),
                           reinterpret_cast<DWORD_PTR>(this))) {
        loom_core::layout_logger()->error("Failed to subclass {} for resize notifications", parent.to_string());
        return ResizeToken{};
    }
    m_callbacks[token.id] = std::move(callback);
    m_subclassed[token.id] = parent;
    return token;
}

void Win32WindowSystem::unbind_resize(ResizeToken token) {
    auto it = m_subclassed.find(token.id);
    if (it == m_subclassed.end()) {
        return;
    }
    RemoveWindowSubclass(to_hwnd(it->second), resize_subclass_proc, static_cast<UINT_PTR>(token.id));
    m_subclassed.erase(it);
    m_callbacks.erase(token.id);
}

namespace {

int screen_dpi() {
    HDC screen = GetDC(nullptr);
    const int dpi = GetDeviceCaps(screen, LOGPIXELSX);
    ReleaseDC(nullptr, screen);
    return dpi;
}

} // namespace

std::int32_t Win32WindowSystem::physical_to_logical(std::int32_t value) const {
    const int dpi = screen_dpi();
    return dpi > 0 ? MulDiv(value, USER_DEFAULT_SCREEN_DPI, dpi) : value;
}

std::int32_t Win32WindowSystem::logical_to_physical(std::int32_t value) const {
    const int dpi = screen_dpi();
    return dpi > 0 ? MulDiv(value, dpi, USER_DEFAULT_SCREEN_DPI) : value;
}

void Win32WindowSystem::notify_resize(std::uint64_t token, std::uint32_t width, std::uint32_t height) {
    auto it = m_callbacks.find(token);
    if (it != m_callbacks.end()) {
        it->second(width, height);
    }
}

} // namespace loom_layout
