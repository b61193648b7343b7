/// @file frontend.cpp
/// @brief JSON front-end producing struct declarations

#include <loom/derive/frontend.hpp>

#include <fstream>
#include <sstream>

namespace loom_derive {

namespace {

loom_core::Error json_error(const std::string& message) {
    return loom_core::Error(loom_core::ErrorCode::ParseError, message);
}

loom_core::Result<Attribute> attribute_from_pair(const std::string& field,
                                                 const std::string& marker,
                                                 const nlohmann::json& payload) {
    if (!payload.is_string()) {
        return json_error("Field '" + field + "': attribute '" + marker + "' must be a string payload");
    }
    return Attribute{marker, payload.get<std::string>()};
}

} // anonymous namespace

// =============================================================================
// FieldDecl / StructDecl
// =============================================================================

loom_core::Result<FieldDecl> field_from_json(const nlohmann::json& j) {
    FieldDecl field;

    if (!j.is_object()) {
        return json_error("Field declaration must be an object");
    }

    // Required: name
    if (!j.contains("name") || !j["name"].is_string()) {
        return json_error("Field declaration missing required 'name' field");
    }
    field.name = j["name"].get<std::string>();

    // Required: type
    if (!j.contains("type") || !j["type"].is_string()) {
        return json_error("Field '" + field.name + "' missing required 'type' field");
    }
    field.type = j["type"].get<std::string>();

    // Optional: attributes, as an ordered array of single-entry objects or as one object
    if (j.contains("attributes")) {
        const auto& attrs = j["attributes"];
        if (attrs.is_array()) {
            for (const auto& entry : attrs) {
                if (!entry.is_object()) {
                    return json_error("Field '" + field.name + "': attributes must be objects");
                }
                for (const auto& [marker, payload] : entry.items()) {
                    auto attr = attribute_from_pair(field.name, marker, payload);
                    if (!attr) {
                        return attr.error();
                    }
                    field.attributes.push_back(std::move(attr.value()));
                }
            }
        } else if (attrs.is_object()) {
            for (const auto& [marker, payload] : attrs.items()) {
                auto attr = attribute_from_pair(field.name, marker, payload);
                if (!attr) {
                    return attr.error();
                }
                field.attributes.push_back(std::move(attr.value()));
            }
        } else {
            return json_error("Field '" + field.name + "': attributes must be an array or an object");
        }
    }

    return field;
}

loom_core::Result<StructDecl> struct_from_json(const nlohmann::json& j) {
    StructDecl decl;

    if (!j.is_object()) {
        return json_error("Struct declaration must be an object");
    }

    if (!j.contains("name") || !j["name"].is_string()) {
        return json_error("Struct declaration missing required 'name' field");
    }
    decl.name = j["name"].get<std::string>();

    if (j.contains("partial")) {
        if (!j["partial"].is_boolean()) {
            return json_error("Struct '" + decl.name + "': partial must be a boolean");
        }
        decl.partial = j["partial"].get<bool>();
    }

    if (!j.contains("fields") || !j["fields"].is_array()) {
        return json_error("Struct '" + decl.name + "' missing required 'fields' array");
    }
    for (const auto& field_json : j["fields"]) {
        auto field = field_from_json(field_json);
        if (!field) {
            return loom_core::Err<StructDecl>("Struct '" + decl.name + "': " + field.error().message());
        }
        decl.fields.push_back(std::move(field.value()));
    }

    return decl;
}

// =============================================================================
// UiDocument
// =============================================================================

const StructDecl* UiDocument::find_partial(const std::string& name) const {
    for (const auto& p : partials) {
        if (p.name == name) return &p;
    }
    return nullptr;
}

loom_core::Result<UiDocument> UiDocument::from_json(const nlohmann::json& j) {
    UiDocument doc;

    auto root = struct_from_json(j);
    if (!root) {
        return root.error();
    }
    doc.root = std::move(root.value());

    if (j.contains("partials")) {
        if (!j["partials"].is_array()) {
            return json_error("Struct '" + doc.root.name + "': partials must be an array");
        }
        for (const auto& partial_json : j["partials"]) {
            auto partial = struct_from_json(partial_json);
            if (!partial) {
                return partial.error();
            }
            // Structs listed as partials are partial units whether or not they say so
            partial.value().partial = true;
            doc.partials.push_back(std::move(partial.value()));
        }
    }

    return doc;
}

loom_core::Result<UiDocument> UiDocument::from_json_string(const std::string& json_str) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(json_str);
    } catch (const nlohmann::json::parse_error& e) {
        return json_error("JSON parse error: " + std::string(e.what()));
    }
    return from_json(j);
}

loom_core::Result<UiDocument> UiDocument::load(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return loom_core::Error(loom_core::ErrorCode::IOError, "Failed to open UI description: " + path.string());
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    auto doc = from_json_string(buffer.str());
    if (!doc) {
        doc.error().with_context("file", path.string());
    }
    return doc;
}

} // namespace loom_derive
