#pragma once

/// @file binder.hpp
/// @brief Binding of control placements to declared layouts

#include "config.hpp"
#include "types.hpp"

#include <loom/core/error.hpp>

#include <string>

namespace loom_derive {

/// @brief Resolves layout parents and attaches placed controls to layouts
///
/// A layout's parent is its explicit `parent`, or the partial's parent when
/// the struct is a partial. Layouts never infer a parent from earlier
/// controls. Each pending placement naming a layout is converted into the
/// placement shape of that layout's type and appended to its children in
/// control declaration order.
class LayoutBinder {
public:
    explicit LayoutBinder(const DeriveConfig& config) : m_config(config) {}

    /// Must run before controls are sorted by weight
    [[nodiscard]] loom_core::Result<void> bind(UiGraph& graph) const;

    /// Convert a pending placement for a layout of the given type
    [[nodiscard]] loom_core::Result<Placement> convert(const std::string& control,
                                                       const PendingPlacement& pending,
                                                       const std::string& layout_type) const;

private:
    [[nodiscard]] loom_core::Result<void> resolve_parent(const UiGraph& graph, LayoutEntity& layout) const;

    const DeriveConfig& m_config;
};

} // namespace loom_derive
