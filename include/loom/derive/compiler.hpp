#pragma once

/// @file compiler.hpp
/// @brief UI graph compiler pipeline

#include "config.hpp"
#include "frontend.hpp"
#include "plan.hpp"
#include "types.hpp"

#include <loom/core/error.hpp>

#include <string>

namespace loom_derive {

/// @brief Runs classify, parent assignment, layout binding, weight sort and emission
class UiCompiler {
public:
    explicit UiCompiler(DeriveConfig config = {}) : m_config(std::move(config)) {}

    /// Classified and resolved graph, controls in construction order
    [[nodiscard]] loom_core::Result<UiGraph> analyze(const StructDecl& decl) const;

    /// Ordered construction plan of one struct
    [[nodiscard]] loom_core::Result<ConstructionPlan> compile(const StructDecl& decl) const;

    /// C++ source for every partial of the document followed by the root struct
    [[nodiscard]] loom_core::Result<std::string> generate(const UiDocument& doc) const;

    [[nodiscard]] const DeriveConfig& config() const noexcept { return m_config; }

private:
    DeriveConfig m_config;
};

} // namespace loom_derive
