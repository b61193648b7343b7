#pragma once

/// @file frontend.hpp
/// @brief JSON front-end producing struct declarations
///
/// A UI document describes one root struct and the partial structs it
/// embeds:
/// @code
/// {
///   "name": "PartialDemo",
///   "fields": [
///     { "name": "window", "type": "loom::Window",
///       "attributes": [ { "control": "(size: (500, 400), title: \"Many UI\")" } ] },
///     { "name": "people_ui", "type": "PeopleUi",
///       "attributes": { "partial": "(parent: frame1)" } }
///   ],
///   "partials": [ { "name": "PeopleUi", "fields": [ ... ] } ]
/// }
/// @endcode

#include "types.hpp"

#include <loom/core/error.hpp>

#include <nlohmann/json.hpp>

#include <filesystem>
#include <string>
#include <vector>

namespace loom_derive {

/// Root struct plus the partial structs it may embed
struct UiDocument {
    StructDecl root;
    std::vector<StructDecl> partials;

    [[nodiscard]] const StructDecl* find_partial(const std::string& name) const;

    [[nodiscard]] static loom_core::Result<UiDocument> from_json(const nlohmann::json& j);
    [[nodiscard]] static loom_core::Result<UiDocument> from_json_string(const std::string& json_str);
    [[nodiscard]] static loom_core::Result<UiDocument> load(const std::filesystem::path& path);
};

/// Parse one field object
[[nodiscard]] loom_core::Result<FieldDecl> field_from_json(const nlohmann::json& j);

/// Parse one struct object; `partial` defaults to false
[[nodiscard]] loom_core::Result<StructDecl> struct_from_json(const nlohmann::json& j);

} // namespace loom_derive
