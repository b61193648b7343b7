#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for loom_layout module

#include <cstdint>

namespace loom_layout {

// Windowing
struct ControlHandle;
struct Point;
struct Size;
struct ResizeToken;
class IWindowSystem;
class MemoryWindowSystem;

// Engines
class Layout;
struct GridLayoutItem;
class GridLayout;
class GridLayoutBuilder;
enum class BoxLayoutType : std::uint8_t;
struct BoxLayoutItem;
class BoxLayout;
class BoxLayoutBuilder;
struct Dimension;
struct FlexStyle;
class FlexboxLayoutItem;
class FlexboxLayout;
class FlexboxLayoutBuilder;
struct DynRatio;
struct DynLayoutItem;
class DynLayout;
class DynLayoutBuilder;

} // namespace loom_layout
