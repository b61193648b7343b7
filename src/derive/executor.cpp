/// @file executor.cpp
/// @brief Run-time interpretation of construction plans

#include <loom/derive/executor.hpp>
#include <loom/derive/compiler.hpp>

#include <loom/core/log.hpp>
#include <loom/layout/box.hpp>
#include <loom/layout/dyn.hpp>
#include <loom/layout/flexbox.hpp>
#include <loom/layout/grid.hpp>

#include <limits>

namespace loom_derive {

namespace {

using loom_layout::Dimension;
using loom_layout::DimensionRect;
using loom_layout::DimensionSize;

// =============================================================================
// Parameter readers
// =============================================================================

loom_core::Error bad_param(const std::string& slot, const std::string& name, const Expr& value,
                           const std::string& expected) {
    return loom_core::Error(loom_core::ErrorCode::InvalidArgument,
                            slot + ": `" + name + "` expects " + expected + ", found `" + render(value) + "`");
}

/// Integer or float literal, with an optional leading minus
bool numeric_value(const Expr& e, double& out) {
    if (e.is(ExprKind::Integer)) {
        out = static_cast<double>(e.int_value);
        return true;
    }
    if (e.is(ExprKind::Float)) {
        out = e.float_value;
        return true;
    }
    if (e.is(ExprKind::Unary) && e.string_value == "-" && !e.items.empty() && numeric_value(e.items.front(), out)) {
        out = -out;
        return true;
    }
    return false;
}

bool is_sequence(const Expr& e) {
    return e.is(ExprKind::Tuple) || e.is(ExprKind::Array);
}

loom_core::Result<std::uint32_t> read_u32(const std::string& slot, const Param& p) {
    double v = 0;
    if (!numeric_value(p.value, v) || v < 0 || v > std::numeric_limits<std::uint32_t>::max()) {
        return bad_param(slot, p.name, p.value, "a non-negative integer");
    }
    return static_cast<std::uint32_t>(v);
}

loom_core::Result<std::int32_t> read_i32(const std::string& slot, const std::string& name, const Expr& e) {
    double v = 0;
    if (!numeric_value(e, v)) {
        return bad_param(slot, name, e, "an integer");
    }
    return static_cast<std::int32_t>(v);
}

loom_core::Result<bool> read_bool(const std::string& slot, const Param& p) {
    if (!p.value.is(ExprKind::Bool)) {
        return bad_param(slot, p.name, p.value, "true or false");
    }
    return p.value.bool_value;
}

loom_core::Result<loom_layout::Margin> read_margin(const std::string& slot, const Param& p) {
    if (!is_sequence(p.value) || p.value.items.size() != 4) {
        return bad_param(slot, p.name, p.value, "[top, right, bottom, left]");
    }
    loom_layout::Margin margin{};
    for (std::size_t i = 0; i < 4; ++i) {
        double v = 0;
        if (!numeric_value(p.value.items[i], v) || v < 0) {
            return bad_param(slot, p.name, p.value, "[top, right, bottom, left]");
        }
        margin[i] = static_cast<std::uint32_t>(v);
    }
    return margin;
}

loom_core::Result<loom_layout::Size> read_size(const std::string& slot, const Param& p) {
    double w = 0;
    double h = 0;
    if (!is_sequence(p.value) || p.value.items.size() != 2 || !numeric_value(p.value.items[0], w) ||
        !numeric_value(p.value.items[1], h) || w < 0 || h < 0) {
        return bad_param(slot, p.name, p.value, "[width, height]");
    }
    return loom_layout::Size{static_cast<std::uint32_t>(w), static_cast<std::uint32_t>(h)};
}

/// Enum value name: last path segment of `loom::FlexDirection::Row`
loom_core::Result<std::string> read_enum_name(const std::string& slot, const Param& p) {
    if (!p.value.is_path()) {
        return bad_param(slot, p.name, p.value, "an enum value");
    }
    return p.value.last_segment();
}

/// `Points(v)`, `Percent(v)`, `Auto`, `Undefined` or a bare number of points
loom_core::Result<Dimension> read_dimension(const std::string& slot, const std::string& name, const Expr& e) {
    double v = 0;
    if (numeric_value(e, v)) {
        return Dimension::points(static_cast<float>(v));
    }
    if (e.is_path()) {
        const std::string& unit = e.last_segment();
        if (unit == "Auto") return Dimension::automatic();
        if (unit == "Undefined") return Dimension::undefined();
    }
    if (e.is(ExprKind::Call) && !e.segments.empty() && e.items.size() == 1 && numeric_value(e.items[0], v)) {
        const std::string& unit = e.segments.back();
        if (unit == "Points") return Dimension::points(static_cast<float>(v));
        if (unit == "Percent") return Dimension::percent(static_cast<float>(v));
    }
    return bad_param(slot, name, e, "Points(v), Percent(v), Auto or Undefined");
}

loom_core::Result<DimensionSize> read_dimension_size(const std::string& slot, const Param& p) {
    if (!is_sequence(p.value) || p.value.items.size() != 2) {
        return bad_param(slot, p.name, p.value, "(width, height)");
    }
    auto w = read_dimension(slot, p.name, p.value.items[0]);
    if (!w) return w.error();
    auto h = read_dimension(slot, p.name, p.value.items[1]);
    if (!h) return h.error();
    return DimensionSize{w.value(), h.value()};
}

/// Four dimensions in top, right, bottom, left order, or one for every edge
loom_core::Result<DimensionRect> read_dimension_rect(const std::string& slot, const Param& p) {
    if (!is_sequence(p.value)) {
        auto d = read_dimension(slot, p.name, p.value);
        if (!d) return d.error();
        return DimensionRect::uniform(d.value());
    }
    if (p.value.items.size() != 4) {
        return bad_param(slot, p.name, p.value, "(top, right, bottom, left)");
    }
    Dimension edges[4];
    for (std::size_t i = 0; i < 4; ++i) {
        auto d = read_dimension(slot, p.name, p.value.items[i]);
        if (!d) return d.error();
        edges[i] = d.value();
    }
    return DimensionRect{edges[0], edges[1], edges[2], edges[3]};
}

loom_core::Result<float> read_float(const std::string& slot, const Param& p) {
    double v = 0;
    if (!numeric_value(p.value, v)) {
        return bad_param(slot, p.name, p.value, "a number");
    }
    return static_cast<float>(v);
}

template<typename T>
loom_core::Result<T> read_enum(const std::string& slot, const Param& p,
                               std::optional<T> (*parse)(const std::string&)) {
    auto name = read_enum_name(slot, p);
    if (!name) return name.error();
    auto value = parse(name.value());
    if (!value) {
        return bad_param(slot, p.name, p.value, "a known value");
    }
    return *value;
}

void ignore_param(const std::string& slot, const std::string& type, const Param& p) {
    loom_core::derive_logger()->debug("{}: {} ignores parameter `{}`", slot, type, p.name);
}

/// Apply one flexbox child style parameter to an item
loom_core::Result<void> apply_flex_child_param(const std::string& slot, const Param& p,
                                               loom_layout::FlexboxLayoutItem& item) {
    if (p.name == "size" || p.name == "min_size" || p.name == "max_size") {
        auto v = read_dimension_size(slot, p);
        if (!v) return v.error();
        if (p.name == "size") item.size(v.value());
        else if (p.name == "min_size") item.min_size(v.value());
        else item.max_size(v.value());
    } else if (p.name == "margin" || p.name == "position") {
        auto v = read_dimension_rect(slot, p);
        if (!v) return v.error();
        if (p.name == "margin") item.margin(v.value());
        else item.position(v.value());
    } else if (p.name == "flex_grow" || p.name == "flex_shrink" || p.name == "aspect_ratio") {
        auto v = read_float(slot, p);
        if (!v) return v.error();
        if (p.name == "flex_grow") item.flex_grow(v.value());
        else if (p.name == "flex_shrink") item.flex_shrink(v.value());
        else item.aspect_ratio(v.value());
    } else if (p.name == "flex_basis") {
        auto v = read_dimension(slot, p.name, p.value);
        if (!v) return v.error();
        item.flex_basis(v.value());
    } else if (p.name == "align_self") {
        auto v = read_enum<loom_layout::AlignSelf>(slot, p, &loom_layout::parse_align_self);
        if (!v) return v.error();
        item.align_self(v.value());
    } else if (p.name == "position_type") {
        auto v = read_enum<loom_layout::PositionType>(slot, p, &loom_layout::parse_position_type);
        if (!v) return v.error();
        item.position_type(v.value());
    } else {
        return loom_core::Error(loom_core::DeriveError::invalid_placement(
            slot, "unknown flexbox item parameter `" + p.name + "`"));
    }
    return loom_core::Ok();
}

} // anonymous namespace

// =============================================================================
// MemoryControlFactory
// =============================================================================

loom_core::Result<ControlHandle> MemoryControlFactory::create(const std::string& type, const std::string& name,
                                                              const ParameterList& params, ControlHandle parent) {
    loom_layout::Point position;
    loom_layout::Size size;

    if (const Expr* pos = params.find("position")) {
        if (!is_sequence(*pos) || pos->items.size() != 2) {
            return bad_param(name, "position", *pos, "(x, y)");
        }
        auto x = read_i32(name, "position", pos->items[0]);
        if (!x) return x.error();
        auto y = read_i32(name, "position", pos->items[1]);
        if (!y) return y.error();
        position = loom_layout::Point{x.value(), y.value()};
    }

    for (const auto& p : params) {
        if (p.name == "size") {
            auto s = read_size(name, p);
            if (!s) return s.error();
            size = s.value();
            break;
        }
    }

    if (!parent.is_null() && !m_windows.is_valid(parent)) {
        return loom_core::Error(loom_core::ErrorCode::InvalidState,
                                name + ": parent " + parent.to_string() + " does not exist");
    }
    return m_windows.create(type, name, parent, position, size);
}

// =============================================================================
// HandlerRegistry
// =============================================================================

void HandlerRegistry::add(std::string name, EventHandler handler) {
    m_handlers[std::move(name)] = std::move(handler);
}

const EventHandler* HandlerRegistry::find(const std::string& name) const {
    auto it = m_handlers.find(name);
    if (it != m_handlers.end()) {
        return &it->second;
    }
    auto sep = name.rfind("::");
    if (sep != std::string::npos) {
        it = m_handlers.find(name.substr(sep + 2));
        if (it != m_handlers.end()) {
            return &it->second;
        }
    }
    return nullptr;
}

// =============================================================================
// UiInstance
// =============================================================================

ControlHandle UiInstance::handle(const std::string& name) const {
    auto it = m_handles.find(name);
    return it != m_handles.end() ? it->second : ControlHandle{};
}

loom_layout::Layout* UiInstance::layout(const std::string& name) const {
    auto it = m_layouts.find(name);
    return it != m_layouts.end() ? it->second.get() : nullptr;
}

std::size_t UiInstance::dispatch(const std::string& control, const std::string& event) const {
    std::size_t count = 0;
    for (const auto& bound : m_events) {
        if (bound.control == control && bound.event == event) {
            bound.callback(EventArgs{control, event});
            ++count;
        }
    }
    return count;
}

// =============================================================================
// PlanExecutor
// =============================================================================

PlanExecutor::PlanExecutor(IControlFactory& controls, loom_layout::IWindowSystem& windows,
                           const HandlerRegistry& handlers, DeriveConfig config)
    : m_controls(controls), m_windows(windows), m_handlers(handlers), m_config(std::move(config)) {}

void PlanExecutor::register_partial(StructDecl decl) {
    decl.partial = true;
    std::string name = decl.name;
    m_partials[name] = std::move(decl);
}

loom_core::Result<UiInstance> PlanExecutor::build(const StructDecl& decl) const {
    UiCompiler compiler(m_config);
    auto plan = compiler.compile(decl);
    if (!plan) {
        return plan.error();
    }

    UiInstance instance;
    auto executed = execute(plan.value(), instance);
    if (!executed) {
        return executed.error();
    }
    return instance;
}

loom_core::Result<void> PlanExecutor::execute(const ConstructionPlan& plan, UiInstance& instance,
                                              ControlHandle partial_parent, const std::string& prefix) const {
    LOOM_LOG_SCOPE("execute " + plan.name, "loom.derive");

    for (const auto& step : plan.steps) {
        loom_core::Result<void> result;
        switch (step.kind) {
            case StepKind::Resource:
                result = run_resource(step, instance, prefix);
                break;
            case StepKind::Control:
                result = run_control(step, instance, partial_parent, prefix);
                break;
            case StepKind::Event:
                result = run_events(step, instance, prefix);
                break;
            case StepKind::Layout:
                result = run_layout(step, instance, partial_parent, prefix);
                break;
            case StepKind::Partial:
                result = run_partial(step, instance, partial_parent, prefix);
                break;
        }
        if (!result) {
            if (prefix.empty()) {
                loom_core::debug::record_error(result.error());
            }
            return result.error()
                .with_context("struct", plan.name)
                .with_context("step", std::string(step_kind_name(step.kind)) + " " + prefix + step.target_slot);
        }
    }
    return loom_core::Ok();
}

loom_core::Result<ControlHandle> PlanExecutor::resolve_parent(const ConstructionStep& step,
                                                              const UiInstance& instance,
                                                              ControlHandle partial_parent,
                                                              const std::string& prefix) const {
    if (!step.parent) {
        return ControlHandle{};
    }
    if (step.parent->is_partial_parent()) {
        return partial_parent;
    }
    ControlHandle handle = instance.handle(prefix + step.parent->name);
    if (handle.is_null()) {
        return loom_core::Error(loom_core::DeriveError::invalid_parent(
            step.target_slot, "parent `" + step.parent->name + "` was not created before this step"));
    }
    return handle;
}

loom_core::Result<void> PlanExecutor::run_resource(const ConstructionStep& step, UiInstance& instance,
                                                   const std::string& prefix) const {
    const std::string name = prefix + step.target_slot;
    if (!m_resources) {
        loom_core::derive_logger()->debug("{}: no resource factory, {} skipped", name, step.target_type);
        return loom_core::Ok();
    }
    auto created = m_resources->create(step.target_type, name, step.params);
    if (!created) {
        return created;
    }
    instance.m_resources.push_back(name);
    return loom_core::Ok();
}

loom_core::Result<void> PlanExecutor::run_control(const ConstructionStep& step, UiInstance& instance,
                                                  ControlHandle partial_parent, const std::string& prefix) const {
    auto parent = resolve_parent(step, instance, partial_parent, prefix);
    if (!parent) {
        return parent.error();
    }

    const std::string name = prefix + step.target_slot;
    auto handle = m_controls.create(step.target_type, name, step.params, parent.value());
    if (!handle) {
        return handle.error();
    }
    instance.m_handles[name] = handle.value();
    loom_core::derive_logger()->trace("created {} {} under {}", step.target_type, name, parent.value().to_string());
    return loom_core::Ok();
}

loom_core::Result<void> PlanExecutor::run_events(const ConstructionStep& step, UiInstance& instance,
                                                 const std::string& prefix) const {
    for (const auto& binding : step.events) {
        std::string control = prefix + step.target_slot;
        if (!binding.target.empty()) {
            control += "." + binding.target;
        }
        if (!instance.contains(control)) {
            return loom_core::Error(loom_core::ErrorCode::NotFound,
                                    "Event " + binding.event + " targets `" + control + "` which is not a control");
        }

        for (const auto& handler : binding.handlers) {
            const std::string handler_name = render(handler);
            const EventHandler* callback = m_handlers.find(handler_name);
            if (!callback) {
                return loom_core::Error(loom_core::ErrorCode::NotFound,
                                        "No handler registered for `" + handler_name + "`");
            }
            instance.m_events.push_back(BoundEvent{control, binding.event, handler_name, *callback});
        }
    }
    return loom_core::Ok();
}

loom_core::Result<void> PlanExecutor::run_layout(const ConstructionStep& step, UiInstance& instance,
                                                 ControlHandle partial_parent, const std::string& prefix) const {
    const std::string name = prefix + step.target_slot;
    const std::string& type = step.target_type;

    auto parent = resolve_parent(step, instance, partial_parent, prefix);
    if (!parent) {
        return parent.error();
    }

    auto child_handle = [&](const LayoutChild& child) -> loom_core::Result<ControlHandle> {
        ControlHandle h = instance.handle(prefix + child.control);
        if (h.is_null()) {
            return loom_core::Error(loom_core::LayoutError::child_not_found(name, child.control));
        }
        return h;
    };

    if (type == "GridLayout") {
        auto builder = loom_layout::GridLayout::builder();
        builder.parent(parent.value()).window_system(&m_windows);
        for (const auto& p : step.params) {
            if (p.name == "margin") {
                auto v = read_margin(name, p);
                if (!v) return v.error();
                builder.margin(v.value());
            } else if (p.name == "spacing" || p.name == "max_column" || p.name == "max_row") {
                auto v = read_u32(name, p);
                if (!v) return v.error();
                if (p.name == "spacing") builder.spacing(v.value());
                else if (p.name == "max_column") builder.max_column(v.value());
                else builder.max_row(v.value());
            } else if (p.name == "min_size" || p.name == "max_size") {
                auto v = read_size(name, p);
                if (!v) return v.error();
                if (p.name == "min_size") builder.min_size(v.value());
                else builder.max_size(v.value());
            } else if (p.name != "parent") {
                ignore_param(name, type, p);
            }
        }
        for (const auto& child : step.children) {
            auto h = child_handle(child);
            if (!h) return h.error();
            const auto& g = std::get<GridPlacement>(child.placement);
            builder.child_item(loom_layout::GridLayoutItem(h.value(), g.col, g.row, g.col_span, g.row_span));
        }
        auto layout = std::make_unique<loom_layout::GridLayout>();
        LOOM_TRY(builder.build(*layout));
        instance.m_layouts[name] = std::move(layout);
        return loom_core::Ok();
    }

    if (type == "BoxLayout") {
        auto builder = loom_layout::BoxLayout::builder();
        builder.parent(parent.value()).window_system(&m_windows);
        for (const auto& p : step.params) {
            if (p.name == "layout_type") {
                auto v = read_enum_name(name, p);
                if (!v) return v.error();
                if (v.value() == "Horizontal") builder.layout_type(loom_layout::BoxLayoutType::Horizontal);
                else if (v.value() == "Vertical") builder.layout_type(loom_layout::BoxLayoutType::Vertical);
                else return bad_param(name, p.name, p.value, "Horizontal or Vertical");
            } else if (p.name == "margin") {
                auto v = read_margin(name, p);
                if (!v) return v.error();
                builder.margin(v.value());
            } else if (p.name == "spacing" || p.name == "max_cell") {
                auto v = read_u32(name, p);
                if (!v) return v.error();
                if (p.name == "spacing") builder.spacing(v.value());
                else builder.max_cell(v.value());
            } else if (p.name == "min_size" || p.name == "max_size") {
                auto v = read_size(name, p);
                if (!v) return v.error();
                if (p.name == "min_size") builder.min_size(v.value());
                else builder.max_size(v.value());
            } else if (p.name != "parent") {
                ignore_param(name, type, p);
            }
        }
        for (const auto& child : step.children) {
            auto h = child_handle(child);
            if (!h) return h.error();
            const auto& b = std::get<BoxPlacement>(child.placement);
            builder.child_item(loom_layout::BoxLayoutItem(h.value(), b.cell, b.cell_span));
        }
        auto layout = std::make_unique<loom_layout::BoxLayout>();
        LOOM_TRY(builder.build(*layout));
        instance.m_layouts[name] = std::move(layout);
        return loom_core::Ok();
    }

    if (type == "FlexboxLayout") {
        auto builder = loom_layout::FlexboxLayout::builder();
        builder.parent(parent.value()).window_system(&m_windows);
        for (const auto& p : step.params) {
            if (p.name == "flex_direction") {
                auto v = read_enum<loom_layout::FlexDirection>(name, p, &loom_layout::parse_flex_direction);
                if (!v) return v.error();
                builder.flex_direction(v.value());
            } else if (p.name == "flex_wrap") {
                auto v = read_enum<loom_layout::FlexWrap>(name, p, &loom_layout::parse_flex_wrap);
                if (!v) return v.error();
                builder.flex_wrap(v.value());
            } else if (p.name == "justify_content") {
                auto v = read_enum<loom_layout::JustifyContent>(name, p, &loom_layout::parse_justify_content);
                if (!v) return v.error();
                builder.justify_content(v.value());
            } else if (p.name == "align_items") {
                auto v = read_enum<loom_layout::AlignItems>(name, p, &loom_layout::parse_align_items);
                if (!v) return v.error();
                builder.align_items(v.value());
            } else if (p.name == "align_content") {
                auto v = read_enum<loom_layout::AlignContent>(name, p, &loom_layout::parse_align_content);
                if (!v) return v.error();
                builder.align_content(v.value());
            } else if (p.name == "padding" || p.name == "border") {
                auto v = read_dimension_rect(name, p);
                if (!v) return v.error();
                if (p.name == "padding") builder.padding(v.value());
                else builder.border(v.value());
            } else if (p.name == "min_size" || p.name == "max_size") {
                auto v = read_dimension_size(name, p);
                if (!v) return v.error();
                if (p.name == "min_size") builder.min_size(v.value());
                else builder.max_size(v.value());
            } else if (p.name == "auto_size") {
                auto v = read_bool(name, p);
                if (!v) return v.error();
                builder.auto_size(v.value());
            } else if (p.name == "auto_spacing") {
                // `None`, `Some(n)` or `n`
                const Expr& e = p.value;
                if (e.is_path() && e.last_segment() == "None") {
                    builder.auto_spacing(std::nullopt);
                } else {
                    const Expr& inner = (e.is(ExprKind::Call) && e.items.size() == 1) ? e.items.front() : e;
                    auto v = read_u32(name, Param{p.name, inner});
                    if (!v) return v.error();
                    builder.auto_spacing(v.value());
                }
            } else if (p.name != "parent") {
                ignore_param(name, type, p);
            }
        }
        for (const auto& child : step.children) {
            auto h = child_handle(child);
            if (!h) return h.error();
            loom_layout::FlexboxLayoutItem item(h.value());
            for (const auto& p : std::get<FlexPlacement>(child.placement).style) {
                LOOM_TRY(apply_flex_child_param(prefix + child.control, p, item));
            }
            builder.child_item(std::move(item));
        }
        auto layout = std::make_unique<loom_layout::FlexboxLayout>();
        LOOM_TRY(builder.build(*layout));
        instance.m_layouts[name] = std::move(layout);
        return loom_core::Ok();
    }

    if (type == "DynLayout") {
        auto builder = loom_layout::DynLayout::builder();
        builder.parent(parent.value()).window_system(&m_windows);
        for (const auto& p : step.params) {
            if (p.name != "parent") {
                ignore_param(name, type, p);
            }
        }
        for (const auto& child : step.children) {
            auto h = child_handle(child);
            if (!h) return h.error();
            const auto& d = std::get<DynPlacement>(child.placement);
            builder.child(h.value(), loom_layout::DynRatio{d.move_x, d.move_y},
                          loom_layout::DynRatio{d.size_x, d.size_y});
        }
        auto layout = std::make_unique<loom_layout::DynLayout>();
        LOOM_TRY(builder.build(*layout));
        instance.m_layouts[name] = std::move(layout);
        return loom_core::Ok();
    }

    return loom_core::Error(loom_core::DeriveError::unsupported_layout(step.target_slot, type));
}

loom_core::Result<void> PlanExecutor::run_partial(const ConstructionStep& step, UiInstance& instance,
                                                  ControlHandle partial_parent, const std::string& prefix) const {
    auto it = m_partials.find(step.target_type);
    if (it == m_partials.end()) {
        return loom_core::Error(loom_core::DeriveError::unknown_partial(step.target_slot, step.target_type));
    }

    auto parent = resolve_parent(step, instance, partial_parent, prefix);
    if (!parent) {
        return parent.error();
    }

    UiCompiler compiler(m_config);
    auto plan = compiler.compile(it->second);
    if (!plan) {
        return plan.error();
    }
    return execute(plan.value(), instance, parent.value(), prefix + step.target_slot + ".");
}

} // namespace loom_derive
