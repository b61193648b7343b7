#pragma once

/// @file plan.hpp
/// @brief Construction plan produced by the UI graph compiler

#include "types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace loom_derive {

/// Construction phase of a step
enum class StepKind : std::uint8_t {
    Resource,
    Control,
    Event,
    Layout,
    Partial,
};

[[nodiscard]] const char* step_kind_name(StepKind kind);

/// @brief One construction statement
///
/// `params` is the annotation parameter list as written (after flag and enum
/// expansion, without `ty`). The first `parent` entry, if any, stands for
/// `parent`; consumers read the resolved reference from `parent` instead of
/// its expression.
struct ConstructionStep {
    StepKind kind = StepKind::Control;
    std::string target_type;
    std::string target_slot;
    ParameterList params;
    std::optional<ParentRef> parent;
    std::vector<LayoutChild> children;  ///< Layout steps
    std::vector<EventBinding> events;   ///< Event steps
};

/// Ordered construction sequence of one UI struct
struct ConstructionPlan {
    std::string name;
    bool partial = false;
    std::vector<ConstructionStep> steps;

    [[nodiscard]] std::size_t count(StepKind kind) const;

    /// Target slots of all steps of one kind, in plan order
    [[nodiscard]] std::vector<std::string> slots(StepKind kind) const;

    [[nodiscard]] const ConstructionStep* find(StepKind kind, std::string_view slot) const;
};

} // namespace loom_derive
