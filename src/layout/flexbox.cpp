/// @file flexbox.cpp
/// @brief Flexbox layout engine backed by Yoga

#include <loom/layout/flexbox.hpp>

#include <loom/core/log.hpp>

#include <yoga/Yoga.h>

#include <algorithm>
#include <cmath>
#include <memory>
#include <type_traits>

namespace loom_layout {

// =============================================================================
// Style value names
// =============================================================================

std::optional<FlexDirection> parse_flex_direction(const std::string& name) {
    if (name == "Row") return FlexDirection::Row;
    if (name == "Column") return FlexDirection::Column;
    if (name == "RowReverse") return FlexDirection::RowReverse;
    if (name == "ColumnReverse") return FlexDirection::ColumnReverse;
    return std::nullopt;
}

std::optional<FlexWrap> parse_flex_wrap(const std::string& name) {
    if (name == "NoWrap") return FlexWrap::NoWrap;
    if (name == "Wrap") return FlexWrap::Wrap;
    if (name == "WrapReverse") return FlexWrap::WrapReverse;
    return std::nullopt;
}

std::optional<JustifyContent> parse_justify_content(const std::string& name) {
    if (name == "FlexStart") return JustifyContent::FlexStart;
    if (name == "Center") return JustifyContent::Center;
    if (name == "FlexEnd") return JustifyContent::FlexEnd;
    if (name == "SpaceBetween") return JustifyContent::SpaceBetween;
    if (name == "SpaceAround") return JustifyContent::SpaceAround;
    if (name == "SpaceEvenly") return JustifyContent::SpaceEvenly;
    return std::nullopt;
}

std::optional<AlignItems> parse_align_items(const std::string& name) {
    if (name == "FlexStart") return AlignItems::FlexStart;
    if (name == "Center") return AlignItems::Center;
    if (name == "FlexEnd") return AlignItems::FlexEnd;
    if (name == "Stretch") return AlignItems::Stretch;
    if (name == "Baseline") return AlignItems::Baseline;
    return std::nullopt;
}

std::optional<AlignSelf> parse_align_self(const std::string& name) {
    if (name == "Auto") return AlignSelf::Auto;
    if (name == "FlexStart") return AlignSelf::FlexStart;
    if (name == "Center") return AlignSelf::Center;
    if (name == "FlexEnd") return AlignSelf::FlexEnd;
    if (name == "Stretch") return AlignSelf::Stretch;
    if (name == "Baseline") return AlignSelf::Baseline;
    return std::nullopt;
}

std::optional<AlignContent> parse_align_content(const std::string& name) {
    if (name == "FlexStart") return AlignContent::FlexStart;
    if (name == "Center") return AlignContent::Center;
    if (name == "FlexEnd") return AlignContent::FlexEnd;
    if (name == "Stretch") return AlignContent::Stretch;
    if (name == "SpaceBetween") return AlignContent::SpaceBetween;
    if (name == "SpaceAround") return AlignContent::SpaceAround;
    return std::nullopt;
}

std::optional<PositionType> parse_position_type(const std::string& name) {
    if (name == "Relative") return PositionType::Relative;
    if (name == "Absolute") return PositionType::Absolute;
    return std::nullopt;
}

std::string Dimension::to_string() const {
    switch (unit) {
        case Unit::Undefined: return "Undefined";
        case Unit::Auto: return "Auto";
        case Unit::Points: return "Points(" + std::to_string(value) + ")";
        case Unit::Percent: return "Percent(" + std::to_string(value) + ")";
    }
    return "Undefined";
}

// =============================================================================
// Yoga conversion
// =============================================================================

namespace {

struct NodeDeleter {
    void operator()(YGNodeRef node) const { YGNodeFreeRecursive(node); }
};

struct ConfigDeleter {
    void operator()(YGConfigRef config) const { YGConfigFree(config); }
};

using NodePtr = std::unique_ptr<std::remove_pointer_t<YGNodeRef>, NodeDeleter>;
using ConfigPtr = std::unique_ptr<std::remove_pointer_t<YGConfigRef>, ConfigDeleter>;

YGFlexDirection to_yoga(FlexDirection v) {
    switch (v) {
        case FlexDirection::Row: return YGFlexDirectionRow;
        case FlexDirection::Column: return YGFlexDirectionColumn;
        case FlexDirection::RowReverse: return YGFlexDirectionRowReverse;
        case FlexDirection::ColumnReverse: return YGFlexDirectionColumnReverse;
    }
    return YGFlexDirectionRow;
}

YGWrap to_yoga(FlexWrap v) {
    switch (v) {
        case FlexWrap::NoWrap: return YGWrapNoWrap;
        case FlexWrap::Wrap: return YGWrapWrap;
        case FlexWrap::WrapReverse: return YGWrapWrapReverse;
    }
    return YGWrapNoWrap;
}

YGJustify to_yoga(JustifyContent v) {
    switch (v) {
        case JustifyContent::FlexStart: return YGJustifyFlexStart;
        case JustifyContent::Center: return YGJustifyCenter;
        case JustifyContent::FlexEnd: return YGJustifyFlexEnd;
        case JustifyContent::SpaceBetween: return YGJustifySpaceBetween;
        case JustifyContent::SpaceAround: return YGJustifySpaceAround;
        case JustifyContent::SpaceEvenly: return YGJustifySpaceEvenly;
    }
    return YGJustifyFlexStart;
}

YGAlign to_yoga(AlignItems v) {
    switch (v) {
        case AlignItems::FlexStart: return YGAlignFlexStart;
        case AlignItems::Center: return YGAlignCenter;
        case AlignItems::FlexEnd: return YGAlignFlexEnd;
        case AlignItems::Stretch: return YGAlignStretch;
        case AlignItems::Baseline: return YGAlignBaseline;
    }
    return YGAlignStretch;
}

YGAlign to_yoga(AlignSelf v) {
    switch (v) {
        case AlignSelf::Auto: return YGAlignAuto;
        case AlignSelf::FlexStart: return YGAlignFlexStart;
        case AlignSelf::Center: return YGAlignCenter;
        case AlignSelf::FlexEnd: return YGAlignFlexEnd;
        case AlignSelf::Stretch: return YGAlignStretch;
        case AlignSelf::Baseline: return YGAlignBaseline;
    }
    return YGAlignAuto;
}

YGAlign to_yoga(AlignContent v) {
    switch (v) {
        case AlignContent::FlexStart: return YGAlignFlexStart;
        case AlignContent::Center: return YGAlignCenter;
        case AlignContent::FlexEnd: return YGAlignFlexEnd;
        case AlignContent::Stretch: return YGAlignStretch;
        case AlignContent::SpaceBetween: return YGAlignSpaceBetween;
        case AlignContent::SpaceAround: return YGAlignSpaceAround;
    }
    return YGAlignFlexStart;
}

YGPositionType to_yoga(PositionType v) {
    return v == PositionType::Absolute ? YGPositionTypeAbsolute : YGPositionTypeRelative;
}

void set_width(YGNodeRef node, const Dimension& d) {
    switch (d.unit) {
        case Dimension::Unit::Points: YGNodeStyleSetWidth(node, d.value); break;
        case Dimension::Unit::Percent: YGNodeStyleSetWidthPercent(node, d.value); break;
        case Dimension::Unit::Auto: YGNodeStyleSetWidthAuto(node); break;
        case Dimension::Unit::Undefined: break;
    }
}

void set_height(YGNodeRef node, const Dimension& d) {
    switch (d.unit) {
        case Dimension::Unit::Points: YGNodeStyleSetHeight(node, d.value); break;
        case Dimension::Unit::Percent: YGNodeStyleSetHeightPercent(node, d.value); break;
        case Dimension::Unit::Auto: YGNodeStyleSetHeightAuto(node); break;
        case Dimension::Unit::Undefined: break;
    }
}

void set_min(YGNodeRef node, const DimensionSize& s) {
    if (s.width.unit == Dimension::Unit::Points) YGNodeStyleSetMinWidth(node, s.width.value);
    if (s.width.unit == Dimension::Unit::Percent) YGNodeStyleSetMinWidthPercent(node, s.width.value);
    if (s.height.unit == Dimension::Unit::Points) YGNodeStyleSetMinHeight(node, s.height.value);
    if (s.height.unit == Dimension::Unit::Percent) YGNodeStyleSetMinHeightPercent(node, s.height.value);
}

void set_max(YGNodeRef node, const DimensionSize& s) {
    if (s.width.unit == Dimension::Unit::Points) YGNodeStyleSetMaxWidth(node, s.width.value);
    if (s.width.unit == Dimension::Unit::Percent) YGNodeStyleSetMaxWidthPercent(node, s.width.value);
    if (s.height.unit == Dimension::Unit::Points) YGNodeStyleSetMaxHeight(node, s.height.value);
    if (s.height.unit == Dimension::Unit::Percent) YGNodeStyleSetMaxHeightPercent(node, s.height.value);
}

template<typename Points, typename Percent, typename Auto>
void set_edges(const DimensionRect& rect, Points points, Percent percent, Auto automatic) {
    const std::pair<YGEdge, const Dimension*> edges[] = {
        {YGEdgeTop, &rect.top}, {YGEdgeRight, &rect.right}, {YGEdgeBottom, &rect.bottom}, {YGEdgeLeft, &rect.left}};
    for (const auto& [edge, d] : edges) {
        switch (d->unit) {
            case Dimension::Unit::Points: points(edge, d->value); break;
            case Dimension::Unit::Percent: percent(edge, d->value); break;
            case Dimension::Unit::Auto: automatic(edge); break;
            case Dimension::Unit::Undefined: break;
        }
    }
}

void apply_style(YGNodeRef node, const FlexStyle& style) {
    YGNodeStyleSetFlexDirection(node, to_yoga(style.direction));
    YGNodeStyleSetFlexWrap(node, to_yoga(style.wrap));
    YGNodeStyleSetJustifyContent(node, to_yoga(style.justify_content));
    YGNodeStyleSetAlignItems(node, to_yoga(style.align_items));
    YGNodeStyleSetAlignSelf(node, to_yoga(style.align_self));
    YGNodeStyleSetAlignContent(node, to_yoga(style.align_content));
    YGNodeStyleSetPositionType(node, to_yoga(style.position_type));

    set_width(node, style.size.width);
    set_height(node, style.size.height);
    set_min(node, style.min_size);
    set_max(node, style.max_size);

    set_edges(style.position,
              [&](YGEdge e, float v) { YGNodeStyleSetPosition(node, e, v); },
              [&](YGEdge e, float v) { YGNodeStyleSetPositionPercent(node, e, v); },
              [](YGEdge) {});
    set_edges(style.margin,
              [&](YGEdge e, float v) { YGNodeStyleSetMargin(node, e, v); },
              [&](YGEdge e, float v) { YGNodeStyleSetMarginPercent(node, e, v); },
              [&](YGEdge e) { YGNodeStyleSetMarginAuto(node, e); });
    set_edges(style.padding,
              [&](YGEdge e, float v) { YGNodeStyleSetPadding(node, e, v); },
              [&](YGEdge e, float v) { YGNodeStyleSetPaddingPercent(node, e, v); },
              [](YGEdge) {});
    set_edges(style.border,
              [&](YGEdge e, float v) { YGNodeStyleSetBorder(node, e, v); },
              [](YGEdge, float) {},
              [](YGEdge) {});

    YGNodeStyleSetFlexGrow(node, style.flex_grow);
    YGNodeStyleSetFlexShrink(node, style.flex_shrink);
    switch (style.flex_basis.unit) {
        case Dimension::Unit::Points: YGNodeStyleSetFlexBasis(node, style.flex_basis.value); break;
        case Dimension::Unit::Percent: YGNodeStyleSetFlexBasisPercent(node, style.flex_basis.value); break;
        case Dimension::Unit::Auto: YGNodeStyleSetFlexBasisAuto(node); break;
        case Dimension::Unit::Undefined: break;
    }
    if (style.aspect_ratio) {
        YGNodeStyleSetAspectRatio(node, *style.aspect_ratio);
    }
}

std::int32_t rounded(float v) {
    return std::isnan(v) ? 0 : static_cast<std::int32_t>(std::lround(v));
}

} // anonymous namespace

// =============================================================================
// FlexboxLayout
// =============================================================================

FlexboxLayout::~FlexboxLayout() = default;

FlexboxLayoutBuilder FlexboxLayout::builder() {
    return FlexboxLayoutBuilder();
}

loom_core::Result<void> FlexboxLayout::add_child(ControlHandle control, FlexStyle style) {
    if (control.is_null()) {
        return loom_core::Error(loom_core::LayoutError::invalid_style(describe(), "null child control"));
    }
    m_children.emplace_back(control, std::move(style));
    refit();
    return loom_core::Ok();
}

loom_core::Result<void> FlexboxLayout::remove_child(ControlHandle control) {
    auto it = std::find_if(m_children.begin(), m_children.end(),
                           [&](const FlexboxLayoutItem& item) { return item.control() == control; });
    if (it == m_children.end()) {
        return loom_core::Error(loom_core::LayoutError::child_not_found(describe(), control.to_string()));
    }
    m_children.erase(it);
    refit();
    return loom_core::Ok();
}

bool FlexboxLayout::has_child(ControlHandle control) const {
    return child_style(control) != nullptr;
}

const FlexStyle* FlexboxLayout::child_style(ControlHandle control) const {
    for (const auto& item : m_children) {
        if (item.control() == control) {
            return &item.style();
        }
    }
    return nullptr;
}

loom_core::Result<void> FlexboxLayout::set_child_style(ControlHandle control, FlexStyle style) {
    for (auto& item : m_children) {
        if (item.control() == control) {
            item.style_mut() = std::move(style);
            refit();
            return loom_core::Ok();
        }
    }
    return loom_core::Error(loom_core::LayoutError::child_not_found(describe(), control.to_string()));
}

void FlexboxLayout::set_style(FlexStyle style) {
    m_style = std::move(style);
    refit();
}

void FlexboxLayout::do_compute(std::uint32_t width, std::uint32_t height) {
    ConfigPtr config(YGConfigNew());
    YGConfigSetPointScaleFactor(config.get(), 1.0f);

    NodePtr root(YGNodeNewWithConfig(config.get()));
    apply_style(root.get(), m_style);
    YGNodeStyleSetWidth(root.get(), static_cast<float>(width));
    YGNodeStyleSetHeight(root.get(), static_cast<float>(height));

    // Ownership passes to root; NodeDeleter frees the whole tree
    for (std::size_t i = 0; i < m_children.size(); ++i) {
        YGNodeRef child = YGNodeNewWithConfig(config.get());
        apply_style(child, m_children[i].style());
        YGNodeInsertChild(root.get(), child, i);
    }

    YGNodeCalculateLayout(root.get(), static_cast<float>(width), static_cast<float>(height), YGDirectionLTR);

    IWindowSystem* system = window_system();
    for (std::size_t i = 0; i < m_children.size(); ++i) {
        YGNodeRef child = YGNodeGetChild(root.get(), i);
        const std::int32_t x = rounded(YGNodeLayoutGetLeft(child));
        const std::int32_t y = rounded(YGNodeLayoutGetTop(child));
        const std::int32_t w = rounded(YGNodeLayoutGetWidth(child));
        const std::int32_t h = rounded(YGNodeLayoutGetHeight(child));

        system->set_position(m_children[i].control(), x, y);
        system->set_size(m_children[i].control(), static_cast<std::uint32_t>(std::max(w, 0)),
                         static_cast<std::uint32_t>(std::max(h, 0)));
    }
}

// =============================================================================
// FlexboxLayoutBuilder
// =============================================================================

FlexboxLayoutBuilder& FlexboxLayoutBuilder::child(ControlHandle control) {
    m_children.emplace_back(control);
    return *this;
}

FlexboxLayoutBuilder& FlexboxLayoutBuilder::child_item(FlexboxLayoutItem item) {
    m_children.push_back(std::move(item));
    return *this;
}

FlexboxLayoutItem* FlexboxLayoutBuilder::current(const char* setter) {
    if (m_children.empty()) {
        if (!m_error) {
            m_error = std::string(setter) + " used before any child was added";
        }
        return nullptr;
    }
    return &m_children.back();
}

FlexboxLayoutBuilder& FlexboxLayoutBuilder::child_size(DimensionSize v) {
    if (auto* item = current("child_size")) item->size(v);
    return *this;
}

FlexboxLayoutBuilder& FlexboxLayoutBuilder::child_min_size(DimensionSize v) {
    if (auto* item = current("child_min_size")) item->min_size(v);
    return *this;
}

FlexboxLayoutBuilder& FlexboxLayoutBuilder::child_max_size(DimensionSize v) {
    if (auto* item = current("child_max_size")) item->max_size(v);
    return *this;
}

FlexboxLayoutBuilder& FlexboxLayoutBuilder::child_flex_grow(float v) {
    if (auto* item = current("child_flex_grow")) item->flex_grow(v);
    return *this;
}

FlexboxLayoutBuilder& FlexboxLayoutBuilder::child_flex_shrink(float v) {
    if (auto* item = current("child_flex_shrink")) item->flex_shrink(v);
    return *this;
}

FlexboxLayoutBuilder& FlexboxLayoutBuilder::child_flex_basis(Dimension v) {
    if (auto* item = current("child_flex_basis")) item->flex_basis(v);
    return *this;
}

FlexboxLayoutBuilder& FlexboxLayoutBuilder::child_margin(DimensionRect v) {
    if (auto* item = current("child_margin")) item->margin(v);
    return *this;
}

FlexboxLayoutBuilder& FlexboxLayoutBuilder::child_align_self(AlignSelf v) {
    if (auto* item = current("child_align_self")) item->align_self(v);
    return *this;
}

FlexboxLayoutBuilder& FlexboxLayoutBuilder::child_position_type(PositionType v) {
    if (auto* item = current("child_position_type")) item->position_type(v);
    return *this;
}

FlexboxLayoutBuilder& FlexboxLayoutBuilder::child_position(DimensionRect v) {
    if (auto* item = current("child_position")) item->position(v);
    return *this;
}

FlexboxLayoutBuilder& FlexboxLayoutBuilder::child_aspect_ratio(float v) {
    if (auto* item = current("child_aspect_ratio")) item->aspect_ratio(v);
    return *this;
}

loom_core::Result<void> FlexboxLayoutBuilder::build(FlexboxLayout& layout) {
    if (m_error) {
        return loom_core::Error(loom_core::LayoutError::invalid_style(layout.kind(), *m_error));
    }
    for (const auto& item : m_children) {
        if (item.control().is_null()) {
            return loom_core::Error(loom_core::LayoutError::invalid_style(layout.kind(), "null child control"));
        }
    }

    auto attached = layout.attach(m_system, m_parent);
    if (!attached) {
        return attached;
    }

    bool auto_size = m_auto_size;
    std::optional<std::uint32_t> auto_spacing = m_auto_spacing;
    if (m_explicit_padding) {
        auto_spacing.reset();
    }
    for (const auto& item : m_children) {
        if (item.has_explicit_size()) auto_size = false;
        if (item.has_explicit_margin()) auto_spacing.reset();
    }

    FlexStyle style = m_style;
    std::vector<FlexboxLayoutItem> children = m_children;

    if (auto_size && !children.empty()) {
        const Dimension share = Dimension::percent(100.0f / static_cast<float>(children.size()));
        const bool row = style.direction == FlexDirection::Row || style.direction == FlexDirection::RowReverse;
        for (auto& item : children) {
            FlexStyle& child = item.style_mut();
            child.size = row ? DimensionSize{share, Dimension::automatic()}
                             : DimensionSize{Dimension::automatic(), share};
        }
    }

    if (auto_spacing) {
        const Dimension spacing = Dimension::points(static_cast<float>(*auto_spacing));
        style.padding = DimensionRect::uniform(spacing);
        for (auto& item : children) {
            item.style_mut().margin = DimensionRect::uniform(spacing);
        }
    }

    layout.m_style = std::move(style);
    layout.m_children = std::move(children);
    layout.m_auto_size = auto_size;
    layout.m_auto_spacing = auto_spacing;

    loom_core::layout_logger()->debug("{}: {} children, auto_size={}, auto_spacing={}", layout.kind(),
                                      layout.m_children.size(), auto_size,
                                      auto_spacing ? std::to_string(*auto_spacing) : std::string("off"));

    layout.fit();
    return loom_core::Ok();
}

} // namespace loom_layout
