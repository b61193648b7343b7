#pragma once

/// @file resolver.hpp
/// @brief Parent assignment and construction ordering of controls

#include "config.hpp"
#include "types.hpp"

#include <loom/core/error.hpp>

namespace loom_derive {

/// @brief Builds the parent/child graph of a struct's controls
///
/// Pass A assigns parents in declaration order:
/// 1. top-level types take no implicit parent,
/// 2. an explicit `parent: path` names the parent,
/// 3. otherwise the nearest earlier control of an auto-parent type is used,
/// 4. otherwise a partial's controls fall back to the partial's parent,
/// 5. otherwise the control stays parentless.
///
/// Pass B computes each control's depth and sorts controls by
/// (depth, declaration index), so parents always precede their children and
/// siblings keep their authored order.
class ParentResolver {
public:
    explicit ParentResolver(const DeriveConfig& config) : m_config(config) {}

    /// Pass A: fill `resolved_parent` of controls and partials
    [[nodiscard]] loom_core::Result<void> assign_parents(UiGraph& graph) const;

    /// Pass B: fill `weight` and sort `graph.controls` by it
    [[nodiscard]] loom_core::Result<void> sort_by_weight(UiGraph& graph) const;

    /// Resolve an explicit `parent` expression to a declared control
    [[nodiscard]] static loom_core::Result<ParentRef> explicit_parent(const UiGraph& graph,
                                                                      const std::string& owner,
                                                                      const Expr& expr);

private:
    const DeriveConfig& m_config;
};

} // namespace loom_derive
