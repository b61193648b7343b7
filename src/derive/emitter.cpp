/// @file emitter.cpp
/// @brief Serialization of a resolved graph into a construction plan

#include <loom/derive/emitter.hpp>

#include <loom/core/log.hpp>

namespace loom_derive {

// =============================================================================
// ConstructionPlan
// =============================================================================

const char* step_kind_name(StepKind kind) {
    switch (kind) {
        case StepKind::Resource: return "resource";
        case StepKind::Control: return "control";
        case StepKind::Event: return "event";
        case StepKind::Layout: return "layout";
        case StepKind::Partial: return "partial";
        default: return "unknown";
    }
}

std::size_t ConstructionPlan::count(StepKind kind) const {
    std::size_t n = 0;
    for (const auto& step : steps) {
        if (step.kind == kind) ++n;
    }
    return n;
}

std::vector<std::string> ConstructionPlan::slots(StepKind kind) const {
    std::vector<std::string> out;
    for (const auto& step : steps) {
        if (step.kind == kind) out.push_back(step.target_slot);
    }
    return out;
}

const ConstructionStep* ConstructionPlan::find(StepKind kind, std::string_view slot) const {
    for (const auto& step : steps) {
        if (step.kind == kind && step.target_slot == slot) return &step;
    }
    return nullptr;
}

// =============================================================================
// CodeEmitter
// =============================================================================

loom_core::Result<ConstructionPlan> CodeEmitter::emit(const UiGraph& graph) const {
    for (const auto& control : graph.controls) {
        if (control.placement && is_pending(*control.placement)) {
            return loom_core::Error(loom_core::DeriveError::unmatched_layout_item(control.name));
        }
    }

    ConstructionPlan plan;
    plan.name = graph.name;
    plan.partial = graph.partial;

    for (const auto& resource : graph.resources) {
        ConstructionStep step;
        step.kind = StepKind::Resource;
        step.target_type = resource.type;
        step.target_slot = resource.name;
        step.params = resource.params;
        plan.steps.push_back(std::move(step));
    }

    for (const auto& control : graph.controls) {
        ConstructionStep step;
        step.kind = StepKind::Control;
        step.target_type = control.type;
        step.target_slot = control.name;
        step.params = control.params;
        step.parent = control.resolved_parent;
        plan.steps.push_back(std::move(step));
    }

    for (const auto& control : graph.controls) {
        if (control.events.empty()) continue;
        ConstructionStep step;
        step.kind = StepKind::Event;
        step.target_type = control.type;
        step.target_slot = control.name;
        step.events = control.events;
        plan.steps.push_back(std::move(step));
    }

    for (const auto& layout : graph.layouts) {
        ConstructionStep step;
        step.kind = StepKind::Layout;
        step.target_type = layout.type;
        step.target_slot = layout.name;
        step.params = layout.params;
        step.parent = layout.resolved_parent;
        step.children = layout.children;
        plan.steps.push_back(std::move(step));
    }

    for (const auto& partial : graph.partials) {
        ConstructionStep step;
        step.kind = StepKind::Partial;
        step.target_type = partial.type;
        step.target_slot = partial.name;
        step.params = partial.params;
        step.parent = partial.resolved_parent;
        plan.steps.push_back(std::move(step));
    }

    for (const auto& partial : graph.partials) {
        if (partial.events.empty()) continue;
        ConstructionStep step;
        step.kind = StepKind::Event;
        step.target_type = partial.type;
        step.target_slot = partial.name;
        step.events = partial.events;
        plan.steps.push_back(std::move(step));
    }

    loom_core::derive_logger()->debug("{}: plan has {} steps ({} controls, {} layouts, {} partials)",
                                      plan.name, plan.steps.size(), plan.count(StepKind::Control),
                                      plan.count(StepKind::Layout), plan.count(StepKind::Partial));
    return plan;
}

} // namespace loom_derive
