/// @file binder.cpp
/// @brief Binding of control placements to declared layouts

#include <loom/derive/binder.hpp>
#include <loom/derive/flags.hpp>
#include <loom/derive/resolver.hpp>

#include <loom/core/log.hpp>

#include <limits>

namespace loom_derive {

namespace {

loom_core::Result<std::uint32_t> read_uint(const std::string& control, const Param& param, std::uint32_t min) {
    const Expr& value = param.value;
    if (!value.is(ExprKind::Integer)) {
        return loom_core::Error(loom_core::DeriveError::invalid_placement(
            control, "`" + param.name + "` must be an integer literal, found `" + value.text + "`"));
    }
    if (value.int_value < static_cast<std::int64_t>(min) ||
        value.int_value > static_cast<std::int64_t>(std::numeric_limits<std::uint32_t>::max())) {
        return loom_core::Error(loom_core::DeriveError::invalid_placement(
            control, "`" + param.name + "` must be at least " + std::to_string(min) + ", found " + value.text));
    }
    return static_cast<std::uint32_t>(value.int_value);
}

loom_core::Result<std::pair<std::int32_t, std::int32_t>> read_pair(const std::string& control, const Param& param) {
    const Expr& value = param.value;
    if (!value.is(ExprKind::Tuple) || value.items.size() != 2 ||
        !value.items[0].is(ExprKind::Integer) || !value.items[1].is(ExprKind::Integer)) {
        return loom_core::Error(loom_core::DeriveError::invalid_placement(
            control, "`" + param.name + "` must be a pair of integers, found `" + value.text + "`"));
    }
    return std::make_pair(static_cast<std::int32_t>(value.items[0].int_value),
                          static_cast<std::int32_t>(value.items[1].int_value));
}

loom_core::Error unknown_param(const std::string& control, const std::string& name, const std::string& layout_type) {
    return loom_core::DeriveError::invalid_placement(
        control, "unknown parameter `" + name + "` for a " + layout_type + " item");
}

} // anonymous namespace

// =============================================================================
// LayoutBinder
// =============================================================================

loom_core::Result<void> LayoutBinder::bind(UiGraph& graph) const {
    auto logger = loom_core::derive_logger();

    for (std::size_t li = 0; li < graph.layouts.size(); ++li) {
        LayoutEntity& layout = graph.layouts[li];

        auto parent = resolve_parent(graph, layout);
        if (!parent) {
            return parent.error();
        }

        for (ControlEntity& control : graph.controls) {
            if (!control.placement || !is_pending(*control.placement)) {
                continue;
            }
            const auto& pending = std::get<PendingPlacement>(*control.placement);
            if (pending.layout != layout.name) {
                continue;
            }

            auto placement = convert(control.name, pending, layout.type);
            if (!placement) {
                return placement.error();
            }

            control.placement = placement.value();
            control.layout_index = li;
            layout.children.push_back(LayoutChild{control.name, std::move(placement.value())});
        }

        logger->trace("layout '{}' ({}) bound {} children", layout.name, layout.type, layout.children.size());
    }

    return loom_core::Ok();
}

loom_core::Result<void> LayoutBinder::resolve_parent(const UiGraph& graph, LayoutEntity& layout) const {
    if (const Expr* parent = layout.params.find("parent")) {
        auto resolved = ParentResolver::explicit_parent(graph, layout.name, *parent);
        if (!resolved) {
            return resolved.error();
        }
        layout.resolved_parent = std::move(resolved.value());
        return loom_core::Ok();
    }

    if (graph.partial) {
        layout.resolved_parent = ParentRef::partial_parent();
        return loom_core::Ok();
    }

    return loom_core::Error(loom_core::DeriveError::layout_parent(layout.name));
}

loom_core::Result<Placement> LayoutBinder::convert(const std::string& control,
                                                   const PendingPlacement& pending,
                                                   const std::string& layout_type) const {
    if (layout_type == "GridLayout") {
        GridPlacement grid;
        for (const Param& param : pending.params) {
            std::uint32_t* slot = nullptr;
            std::uint32_t min = 0;
            if (param.name == "col") {
                slot = &grid.col;
            } else if (param.name == "row") {
                slot = &grid.row;
            } else if (param.name == "col_span") {
                slot = &grid.col_span;
                min = 1;
            } else if (param.name == "row_span") {
                slot = &grid.row_span;
                min = 1;
            } else {
                return unknown_param(control, param.name, layout_type);
            }
            auto value = read_uint(control, param, min);
            if (!value) {
                return value.error();
            }
            *slot = value.value();
        }
        return Placement{grid};
    }

    if (layout_type == "BoxLayout") {
        BoxPlacement box;
        for (const Param& param : pending.params) {
            if (param.name == "cell") {
                auto value = read_uint(control, param, 0);
                if (!value) return value.error();
                box.cell = value.value();
            } else if (param.name == "cell_span") {
                auto value = read_uint(control, param, 1);
                if (!value) return value.error();
                box.cell_span = value.value();
            } else {
                return unknown_param(control, param.name, layout_type);
            }
        }
        return Placement{box};
    }

    if (layout_type == "FlexboxLayout") {
        FlexPlacement flex;
        flex.style = pending.params;
        qualify_enum_params(m_config, flex.style);
        return Placement{std::move(flex)};
    }

    if (layout_type == "DynLayout") {
        DynPlacement dyn;
        for (const Param& param : pending.params) {
            if (param.name != "move" && param.name != "size") {
                return unknown_param(control, param.name, layout_type);
            }
            auto value = read_pair(control, param);
            if (!value) {
                return value.error();
            }
            if (param.name == "move") {
                dyn.move_x = value.value().first;
                dyn.move_y = value.value().second;
            } else {
                dyn.size_x = value.value().first;
                dyn.size_y = value.value().second;
            }
        }
        return Placement{dyn};
    }

    return loom_core::Error(loom_core::DeriveError::unsupported_layout(control, layout_type));
}

} // namespace loom_derive
