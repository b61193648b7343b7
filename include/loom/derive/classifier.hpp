#pragma once

/// @file classifier.hpp
/// @brief Field classification into UI graph roles

#include "config.hpp"
#include "types.hpp"

#include <loom/core/error.hpp>

#include <string>
#include <string_view>

namespace loom_derive {

/// @brief Decides the role of one struct field and extracts its parameters
///
/// The role comes from the single role marker attached to the field
/// (control, resource, layout or partial). Fields without one are Plain.
/// `layout_item` and `events` annotations are only valid beside a control
/// marker (events are also accepted on partials).
class FieldClassifier {
public:
    explicit FieldClassifier(const DeriveConfig& config) : m_config(config) {}

    /// Classify a field
    /// @param index Position of the field in its struct
    [[nodiscard]] loom_core::Result<Entity> classify(const FieldDecl& field, std::size_t index) const;

private:
    [[nodiscard]] loom_core::Result<std::string> resolve_type(const FieldDecl& field,
                                                              const ParameterList& params) const;
    [[nodiscard]] loom_core::Result<Placement> parse_placement(const FieldDecl& field,
                                                               const Attribute& attr) const;

    const DeriveConfig& m_config;
};

/// Last path segment of a declared type with generic arguments removed
/// (`loom::ListBox<&'static str>` gives `ListBox`)
[[nodiscard]] std::string type_name_from_path(std::string_view declared);

} // namespace loom_derive
