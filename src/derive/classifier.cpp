/// @file classifier.cpp
/// @brief Field classification into UI graph roles

#include <loom/derive/classifier.hpp>
#include <loom/derive/events.hpp>
#include <loom/derive/parameters.hpp>

#include <loom/core/log.hpp>

#include <cctype>

namespace loom_derive {

std::string type_name_from_path(std::string_view declared) {
    std::string_view base = declared.substr(0, declared.find('<'));

    auto sep = base.rfind("::");
    if (sep != std::string_view::npos) {
        base = base.substr(sep + 2);
    }

    // Drop reference markers and whitespace around the name
    while (!base.empty() && (std::isspace(static_cast<unsigned char>(base.front())) || base.front() == '&')) {
        base.remove_prefix(1);
    }
    while (!base.empty() && std::isspace(static_cast<unsigned char>(base.back()))) {
        base.remove_suffix(1);
    }

    return std::string(base);
}

// =============================================================================
// FieldClassifier
// =============================================================================

loom_core::Result<Entity> FieldClassifier::classify(const FieldDecl& field, std::size_t index) const {
    const MarkerNames& markers = m_config.markers;

    const Attribute* role_attr = nullptr;
    Role role = Role::Plain;

    const std::pair<const std::string*, Role> role_markers[] = {
        {&markers.control, Role::Control},
        {&markers.resource, Role::Resource},
        {&markers.layout, Role::Layout},
        {&markers.partial, Role::Partial},
    };

    for (const auto& attr : field.attributes) {
        for (const auto& [marker, marker_role] : role_markers) {
            if (attr.marker != *marker) continue;
            if (role_attr) {
                return loom_core::Error(loom_core::DeriveError::classification(
                    field.name, "carries both `" + role_attr->marker + "` and `" + attr.marker + "` markers"));
            }
            role_attr = &attr;
            role = marker_role;
        }
    }

    const Attribute* item_attr = field.attribute(markers.layout_item);
    const Attribute* events_attr = field.attribute(markers.events);

    Entity entity;
    entity.name = field.name;
    entity.index = index;
    entity.role = role;

    if (role == Role::Plain) {
        if (item_attr) {
            return loom_core::Error(loom_core::DeriveError::classification(
                field.name, "`" + markers.layout_item + "` requires a `" + markers.control + "` marker"));
        }
        if (events_attr) {
            return loom_core::Error(loom_core::DeriveError::classification(
                field.name, "`" + markers.events + "` requires a `" + markers.control + "` marker"));
        }
        entity.type = type_name_from_path(field.type);
        return entity;
    }

    auto params = parse_parameters(role_attr->payload, field.name);
    if (!params) {
        return params.error();
    }

    auto type = resolve_type(field, params.value());
    if (!type) {
        return type.error();
    }
    entity.type = std::move(type.value());

    // `ty` only selects the type; it is never a builder call
    params.value().remove("ty");
    entity.params = std::move(params.value());

    if (item_attr) {
        if (role != Role::Control) {
            return loom_core::Error(loom_core::DeriveError::classification(
                field.name, "`" + markers.layout_item + "` requires a `" + markers.control + "` marker"));
        }
        auto placement = parse_placement(field, *item_attr);
        if (!placement) {
            return placement.error();
        }
        entity.placement = std::move(placement.value());
    }

    if (events_attr) {
        if (role != Role::Control && role != Role::Partial) {
            return loom_core::Error(loom_core::DeriveError::classification(
                field.name, "`" + markers.events + "` requires a `" + markers.control + "` marker"));
        }
        auto events = parse_events(events_attr->payload, field.name);
        if (!events) {
            return events.error();
        }
        entity.events = std::move(events.value());
    }

    loom_core::derive_logger()->trace("classified '{}' as {} {}", entity.name, role_name(role), entity.type);
    return entity;
}

loom_core::Result<std::string> FieldClassifier::resolve_type(const FieldDecl& field,
                                                             const ParameterList& params) const {
    if (const Expr* ty = params.find("ty")) {
        if (ty->is_path()) {
            return ty->last_segment();
        }
        loom_core::derive_logger()->warn("'{}': `ty: {}` is not a path, using the declared type",
                                         field.name, ty->text);
    }

    std::string name = type_name_from_path(field.type);
    if (name.empty()) {
        return loom_core::Error(loom_core::DeriveError::unknown_type(field.name));
    }
    return name;
}

loom_core::Result<Placement> FieldClassifier::parse_placement(const FieldDecl& field,
                                                              const Attribute& attr) const {
    auto params = parse_parameters(attr.payload, field.name);
    if (!params) {
        return params.error();
    }

    PendingPlacement pending;
    if (const Expr* layout = params.value().find("layout")) {
        if (!layout->is_path()) {
            return loom_core::Error(loom_core::DeriveError::invalid_placement(
                field.name, "`layout` must name a layout field, found `" + layout->text + "`"));
        }
        pending.layout = layout->last_segment();
    }
    params.value().remove("layout");
    pending.params = std::move(params.value());
    return Placement{std::move(pending)};
}

} // namespace loom_derive
