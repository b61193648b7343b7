#pragma once

/// @file flexbox.hpp
/// @brief Flexbox layout engine backed by Yoga
///
/// The box model itself is solved by Yoga. This engine keeps the styles,
/// converts them to a Yoga node tree on every compute and adds two build-time
/// conveniences:
///
/// - auto-size: every child gets `100/n %` on the main axis and `Auto` on the
///   cross axis
/// - auto-spacing: the container padding and every child margin are set to
///   the spacing value
///
/// Setting any explicit child size, min/max size, grow, shrink or basis turns
/// auto-size off for the whole layout; setting padding or a child margin turns
/// auto-spacing off.

#include "layout.hpp"

#include <optional>
#include <string>
#include <vector>

namespace loom_layout {

// =============================================================================
// Style values
// =============================================================================

enum class FlexDirection : std::uint8_t { Row, Column, RowReverse, ColumnReverse };
enum class FlexWrap : std::uint8_t { NoWrap, Wrap, WrapReverse };
enum class JustifyContent : std::uint8_t { FlexStart, Center, FlexEnd, SpaceBetween, SpaceAround, SpaceEvenly };
enum class AlignItems : std::uint8_t { FlexStart, Center, FlexEnd, Stretch, Baseline };
enum class AlignSelf : std::uint8_t { Auto, FlexStart, Center, FlexEnd, Stretch, Baseline };
enum class AlignContent : std::uint8_t { FlexStart, Center, FlexEnd, Stretch, SpaceBetween, SpaceAround };
enum class PositionType : std::uint8_t { Relative, Absolute };

/// Name to enum lookups for style values coming from annotations
[[nodiscard]] std::optional<FlexDirection> parse_flex_direction(const std::string& name);
[[nodiscard]] std::optional<FlexWrap> parse_flex_wrap(const std::string& name);
[[nodiscard]] std::optional<JustifyContent> parse_justify_content(const std::string& name);
[[nodiscard]] std::optional<AlignItems> parse_align_items(const std::string& name);
[[nodiscard]] std::optional<AlignSelf> parse_align_self(const std::string& name);
[[nodiscard]] std::optional<AlignContent> parse_align_content(const std::string& name);
[[nodiscard]] std::optional<PositionType> parse_position_type(const std::string& name);

/// Length of a style property
struct Dimension {
    enum class Unit : std::uint8_t {
        Undefined,  ///< Not set; the solver default applies
        Auto,
        Points,
        Percent,  ///< 0..100 of the parent dimension
    };

    Unit unit = Unit::Undefined;
    float value = 0.0f;

    [[nodiscard]] static Dimension undefined() noexcept { return {}; }
    [[nodiscard]] static Dimension automatic() noexcept { return {Unit::Auto, 0.0f}; }
    [[nodiscard]] static Dimension points(float v) noexcept { return {Unit::Points, v}; }
    [[nodiscard]] static Dimension percent(float v) noexcept { return {Unit::Percent, v}; }

    [[nodiscard]] bool is_undefined() const noexcept { return unit == Unit::Undefined; }

    bool operator==(const Dimension& other) const noexcept {
        return unit == other.unit && value == other.value;
    }
    bool operator!=(const Dimension& other) const noexcept { return !(*this == other); }

    [[nodiscard]] std::string to_string() const;
};

struct DimensionSize {
    Dimension width;
    Dimension height;

    bool operator==(const DimensionSize& other) const noexcept {
        return width == other.width && height == other.height;
    }
};

/// Edges in top, right, bottom, left order
struct DimensionRect {
    Dimension top;
    Dimension right;
    Dimension bottom;
    Dimension left;

    [[nodiscard]] static DimensionRect uniform(Dimension d) noexcept { return {d, d, d, d}; }

    bool operator==(const DimensionRect& other) const noexcept {
        return top == other.top && right == other.right && bottom == other.bottom && left == other.left;
    }
};

/// Style of the container or of one child
struct FlexStyle {
    FlexDirection direction = FlexDirection::Row;
    FlexWrap wrap = FlexWrap::NoWrap;
    JustifyContent justify_content = JustifyContent::FlexStart;
    AlignItems align_items = AlignItems::Stretch;
    AlignSelf align_self = AlignSelf::Auto;
    AlignContent align_content = AlignContent::FlexStart;
    PositionType position_type = PositionType::Relative;

    DimensionSize size;
    DimensionSize min_size;
    DimensionSize max_size;
    DimensionRect position;
    DimensionRect margin;
    DimensionRect padding;
    DimensionRect border;

    float flex_grow = 0.0f;
    float flex_shrink = 1.0f;
    Dimension flex_basis = Dimension::automatic();
    std::optional<float> aspect_ratio;
};

// =============================================================================
// FlexboxLayoutItem
// =============================================================================

/// @brief Child control with its style
///
/// Setters record which groups were set explicitly so that the builder can
/// turn the conveniences off.
class FlexboxLayoutItem {
public:
    FlexboxLayoutItem() = default;
    explicit FlexboxLayoutItem(ControlHandle control, FlexStyle style = {})
        : m_control(control), m_style(std::move(style)) {}

    FlexboxLayoutItem& size(DimensionSize v) { m_style.size = v; m_explicit_size = true; return *this; }
    FlexboxLayoutItem& min_size(DimensionSize v) { m_style.min_size = v; m_explicit_size = true; return *this; }
    FlexboxLayoutItem& max_size(DimensionSize v) { m_style.max_size = v; m_explicit_size = true; return *this; }
    FlexboxLayoutItem& flex_grow(float v) { m_style.flex_grow = v; m_explicit_size = true; return *this; }
    FlexboxLayoutItem& flex_shrink(float v) { m_style.flex_shrink = v; m_explicit_size = true; return *this; }
    FlexboxLayoutItem& flex_basis(Dimension v) { m_style.flex_basis = v; m_explicit_size = true; return *this; }
    FlexboxLayoutItem& margin(DimensionRect v) { m_style.margin = v; m_explicit_margin = true; return *this; }
    FlexboxLayoutItem& align_self(AlignSelf v) { m_style.align_self = v; return *this; }
    FlexboxLayoutItem& position_type(PositionType v) { m_style.position_type = v; return *this; }
    FlexboxLayoutItem& position(DimensionRect v) { m_style.position = v; return *this; }
    FlexboxLayoutItem& aspect_ratio(float v) { m_style.aspect_ratio = v; return *this; }

    [[nodiscard]] ControlHandle control() const noexcept { return m_control; }
    [[nodiscard]] const FlexStyle& style() const noexcept { return m_style; }
    [[nodiscard]] FlexStyle& style_mut() noexcept { return m_style; }
    [[nodiscard]] bool has_explicit_size() const noexcept { return m_explicit_size; }
    [[nodiscard]] bool has_explicit_margin() const noexcept { return m_explicit_margin; }

private:
    ControlHandle m_control;
    FlexStyle m_style;
    bool m_explicit_size = false;
    bool m_explicit_margin = false;
};

inline constexpr std::uint32_t k_default_auto_spacing = 5;

// =============================================================================
// FlexboxLayout
// =============================================================================

class FlexboxLayout : public Layout {
public:
    FlexboxLayout() : Layout("FlexboxLayout") {}
    ~FlexboxLayout() override;

    [[nodiscard]] static FlexboxLayoutBuilder builder();

    /// The style is used as given; the build-time conveniences do not apply
    [[nodiscard]] loom_core::Result<void> add_child(ControlHandle control, FlexStyle style);
    [[nodiscard]] loom_core::Result<void> remove_child(ControlHandle control);
    [[nodiscard]] bool has_child(ControlHandle control) const;

    [[nodiscard]] const FlexStyle* child_style(ControlHandle control) const;
    [[nodiscard]] loom_core::Result<void> set_child_style(ControlHandle control, FlexStyle style);
    [[nodiscard]] const std::vector<FlexboxLayoutItem>& children() const noexcept { return m_children; }

    /// Container style
    [[nodiscard]] const FlexStyle& style() const noexcept { return m_style; }
    void set_style(FlexStyle style);

    /// Whether the conveniences were applied by the last build
    [[nodiscard]] bool auto_size() const noexcept { return m_auto_size; }
    [[nodiscard]] std::optional<std::uint32_t> auto_spacing() const noexcept { return m_auto_spacing; }

protected:
    void do_compute(std::uint32_t width, std::uint32_t height) override;
    [[nodiscard]] std::size_t child_count() const noexcept override { return m_children.size(); }

private:
    friend class FlexboxLayoutBuilder;

    FlexStyle m_style;
    std::vector<FlexboxLayoutItem> m_children;
    bool m_auto_size = false;
    std::optional<std::uint32_t> m_auto_spacing;
};

// =============================================================================
// FlexboxLayoutBuilder
// =============================================================================

/// @brief Configures a FlexboxLayout
///
/// `child_*` setters apply to the child added last. Calling one before any
/// `child()` is reported by `build()`.
class FlexboxLayoutBuilder {
public:
    FlexboxLayoutBuilder& parent(ControlHandle parent) { m_parent = parent; return *this; }
    FlexboxLayoutBuilder& window_system(IWindowSystem* system) { m_system = system; return *this; }

    FlexboxLayoutBuilder& flex_direction(FlexDirection v) { m_style.direction = v; return *this; }
    FlexboxLayoutBuilder& flex_wrap(FlexWrap v) { m_style.wrap = v; return *this; }
    FlexboxLayoutBuilder& justify_content(JustifyContent v) { m_style.justify_content = v; return *this; }
    FlexboxLayoutBuilder& align_items(AlignItems v) { m_style.align_items = v; return *this; }
    FlexboxLayoutBuilder& align_content(AlignContent v) { m_style.align_content = v; return *this; }
    FlexboxLayoutBuilder& min_size(DimensionSize v) { m_style.min_size = v; return *this; }
    FlexboxLayoutBuilder& max_size(DimensionSize v) { m_style.max_size = v; return *this; }
    FlexboxLayoutBuilder& border(DimensionRect v) { m_style.border = v; return *this; }

    FlexboxLayoutBuilder& padding(DimensionRect v) {
        m_style.padding = v;
        m_explicit_padding = true;
        return *this;
    }

    FlexboxLayoutBuilder& auto_size(bool enabled) { m_auto_size = enabled; return *this; }

    /// `std::nullopt` disables auto-spacing
    FlexboxLayoutBuilder& auto_spacing(std::optional<std::uint32_t> spacing) {
        m_auto_spacing = spacing;
        return *this;
    }

    FlexboxLayoutBuilder& child(ControlHandle control);
    FlexboxLayoutBuilder& child_item(FlexboxLayoutItem item);

    FlexboxLayoutBuilder& child_size(DimensionSize v);
    FlexboxLayoutBuilder& child_min_size(DimensionSize v);
    FlexboxLayoutBuilder& child_max_size(DimensionSize v);
    FlexboxLayoutBuilder& child_flex_grow(float v);
    FlexboxLayoutBuilder& child_flex_shrink(float v);
    FlexboxLayoutBuilder& child_flex_basis(Dimension v);
    FlexboxLayoutBuilder& child_margin(DimensionRect v);
    FlexboxLayoutBuilder& child_align_self(AlignSelf v);
    FlexboxLayoutBuilder& child_position_type(PositionType v);
    FlexboxLayoutBuilder& child_position(DimensionRect v);
    FlexboxLayoutBuilder& child_aspect_ratio(float v);

    [[nodiscard]] loom_core::Result<void> build(FlexboxLayout& layout);

private:
    [[nodiscard]] FlexboxLayoutItem* current(const char* setter);

    ControlHandle m_parent;
    IWindowSystem* m_system = nullptr;
    FlexStyle m_style;
    std::vector<FlexboxLayoutItem> m_children;
    bool m_explicit_padding = false;
    bool m_auto_size = true;
    std::optional<std::uint32_t> m_auto_spacing = k_default_auto_spacing;
    std::optional<std::string> m_error;
};

} // namespace loom_layout
