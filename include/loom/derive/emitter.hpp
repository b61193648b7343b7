#pragma once

/// @file emitter.hpp
/// @brief Serialization of a resolved graph into a construction plan

#include "plan.hpp"
#include "types.hpp"

#include <loom/core/error.hpp>

namespace loom_derive {

/// @brief Turns a resolved UiGraph into an ordered ConstructionPlan
///
/// Order: resources (declaration order), controls (weight order), events,
/// layouts with their children, partials. Event tables declared on partials
/// address controls inside the partial and are emitted after the partials.
class CodeEmitter {
public:
    [[nodiscard]] loom_core::Result<ConstructionPlan> emit(const UiGraph& graph) const;
};

} // namespace loom_derive
