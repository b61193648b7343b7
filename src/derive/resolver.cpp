/// @file resolver.cpp
/// @brief Parent assignment and construction ordering of controls

#include <loom/derive/resolver.hpp>

#include <loom/core/log.hpp>

#include <algorithm>
#include <limits>
#include <map>

namespace loom_derive {

loom_core::Result<ParentRef> ParentResolver::explicit_parent(const UiGraph& graph,
                                                             const std::string& owner,
                                                             const Expr& expr) {
    if (!expr.is_path()) {
        return loom_core::Error(loom_core::DeriveError::invalid_parent(
            owner, "expected a path to a control, found `" + expr.text + "`"));
    }

    const std::string& name = expr.last_segment();
    if (name == owner) {
        return loom_core::Error(loom_core::DeriveError::invalid_parent(owner, "a control cannot be its own parent"));
    }
    if (!graph.find_control(name)) {
        return loom_core::Error(loom_core::DeriveError::invalid_parent(owner, "no control named '" + name + "'"));
    }
    return ParentRef::field(name);
}

// =============================================================================
// Pass A
// =============================================================================

loom_core::Result<void> ParentResolver::assign_parents(UiGraph& graph) const {
    auto logger = loom_core::derive_logger();

    for (std::size_t i = 0; i < graph.controls.size(); ++i) {
        ControlEntity& control = graph.controls[i];

        if (const Expr* parent = control.params.find("parent")) {
            auto resolved = explicit_parent(graph, control.name, *parent);
            if (!resolved) {
                return resolved.error();
            }
            control.resolved_parent = std::move(resolved.value());
            logger->trace("'{}' has explicit parent '{}'", control.name, control.resolved_parent->name);
            continue;
        }

        if (m_config.is_top_level(control.type)) {
            continue;
        }

        // Nearest earlier container wins
        for (std::size_t j = i; j-- > 0;) {
            const ControlEntity& candidate = graph.controls[j];
            if (m_config.is_auto_parent(candidate.type)) {
                control.resolved_parent = ParentRef::field(candidate.name);
                logger->trace("'{}' inferred parent '{}'", control.name, candidate.name);
                break;
            }
        }

        if (control.resolved_parent) {
            continue;
        }

        if (graph.partial) {
            control.resolved_parent = ParentRef::partial_parent();
            logger->trace("'{}' uses the partial parent", control.name);
            continue;
        }

        if (m_config.strict_parents) {
            return loom_core::Error(loom_core::DeriveError::missing_parent(control.name, control.type));
        }
        logger->warn("{}: control '{}' of type {} has no parent; construction may fail at run time",
                     graph.name, control.name, control.type);
    }

    for (PartialEntity& partial : graph.partials) {
        if (const Expr* parent = partial.params.find("parent")) {
            auto resolved = explicit_parent(graph, partial.name, *parent);
            if (!resolved) {
                return resolved.error();
            }
            partial.resolved_parent = std::move(resolved.value());
        }
    }

    return loom_core::Ok();
}

// =============================================================================
// Pass B
// =============================================================================

loom_core::Result<void> ParentResolver::sort_by_weight(UiGraph& graph) const {
    const std::size_t count = graph.controls.size();
    if (count > std::numeric_limits<std::uint16_t>::max()) {
        return loom_core::Error(loom_core::ErrorCode::InvalidArgument,
                                graph.name + " declares more controls than the construction order supports");
    }

    std::map<std::string, std::size_t> by_name;
    for (std::size_t i = 0; i < count; ++i) {
        by_name.emplace(graph.controls[i].name, i);
    }

    for (std::size_t i = 0; i < count; ++i) {
        ControlEntity& control = graph.controls[i];

        // Every step moves to another control, so a chain longer than the
        // control count must revisit one
        std::size_t depth = 0;
        const ControlEntity* current = &control;
        while (current->resolved_parent && !current->resolved_parent->is_partial_parent()) {
            auto it = by_name.find(current->resolved_parent->name);
            if (it == by_name.end()) {
                return loom_core::Error(loom_core::DeriveError::invalid_parent(
                    current->name, "no control named '" + current->resolved_parent->name + "'"));
            }
            current = &graph.controls[it->second];
            if (++depth > count) {
                return loom_core::Error(loom_core::DeriveError::parent_cycle(control.name));
            }
        }

        control.weight.depth = static_cast<std::uint16_t>(depth);
        control.weight.index = static_cast<std::uint16_t>(i);
    }

    std::stable_sort(graph.controls.begin(), graph.controls.end(),
                     [](const ControlEntity& a, const ControlEntity& b) {
                         return a.weight.packed() < b.weight.packed();
                     });

    return loom_core::Ok();
}

} // namespace loom_derive
