#pragma once

/// @file types.hpp
/// @brief Syntax, declaration and graph types for the UI graph compiler

#include "fwd.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace loom_derive {

// =============================================================================
// Expressions
// =============================================================================

/// Shape of a parsed annotation expression
enum class ExprKind : std::uint8_t {
    Path,     ///< a::b::C
    Field,    ///< a.b
    Integer,  ///< 42, -7
    Float,    ///< 1.5
    String,   ///< "text"
    Bool,     ///< true / false
    Array,    ///< [a, b]
    Tuple,    ///< (a, b)
    BitOr,    ///< a | b
    Call,     ///< f(a, b)
    Macro,    ///< name![a, b]
    Unary,    ///< &a, !a, -a
};

/// @brief Parsed annotation expression
///
/// Expressions are opaque to the parser. `text` is the normalised rendering
/// used when the expression is printed back into generated code.
struct Expr {
    ExprKind kind = ExprKind::Path;
    std::string text;
    std::vector<std::string> segments;  ///< Path/Field/Call/Macro name segments
    std::vector<Expr> items;            ///< Elements, operands or arguments

    std::int64_t int_value = 0;
    double float_value = 0.0;
    std::string string_value;  ///< String content, or the operator of a Unary
    bool bool_value = false;

    [[nodiscard]] bool is(ExprKind k) const noexcept { return kind == k; }
    [[nodiscard]] bool is_path() const noexcept { return kind == ExprKind::Path; }

    /// Single-segment path such as `VISIBLE`
    [[nodiscard]] bool is_bare_ident() const noexcept {
        return kind == ExprKind::Path && segments.size() == 1;
    }

    /// Last path segment, or the rendered text for other shapes
    [[nodiscard]] const std::string& last_segment() const {
        return segments.empty() ? text : segments.back();
    }

    [[nodiscard]] static Expr path(std::vector<std::string> segments);
    [[nodiscard]] static Expr field(std::vector<std::string> segments);
    [[nodiscard]] static Expr integer(std::int64_t value);
    [[nodiscard]] static Expr floating(double value, std::string text);
    [[nodiscard]] static Expr string(std::string value);
    [[nodiscard]] static Expr boolean(bool value);
    [[nodiscard]] static Expr array(std::vector<Expr> items);
    [[nodiscard]] static Expr tuple(std::vector<Expr> items);
    [[nodiscard]] static Expr bit_or(std::vector<Expr> operands);
    [[nodiscard]] static Expr call(std::vector<std::string> callee, std::vector<Expr> args);
    [[nodiscard]] static Expr macro(std::string name, std::vector<Expr> items);
    [[nodiscard]] static Expr unary(std::string op, Expr operand);
};

/// Render an expression in normalised source form
[[nodiscard]] std::string render(const Expr& expr);

/// Join path segments with `::`
[[nodiscard]] std::string join_path(const std::vector<std::string>& segments);

// =============================================================================
// Parameters
// =============================================================================

/// One `name: expr` pair of an annotation
struct Param {
    std::string name;
    Expr value;
};

/// @brief Ordered parameter list of an annotation
///
/// Order is builder-call order. Duplicate names are kept as written.
class ParameterList {
public:
    using iterator = std::vector<Param>::iterator;
    using const_iterator = std::vector<Param>::const_iterator;

    ParameterList() = default;
    explicit ParameterList(std::vector<Param> params) : m_params(std::move(params)) {}

    void add(std::string name, Expr value) {
        m_params.push_back(Param{std::move(name), std::move(value)});
    }

    /// First parameter with the given name
    [[nodiscard]] const Expr* find(std::string_view name) const;
    [[nodiscard]] Expr* find(std::string_view name);

    [[nodiscard]] bool contains(std::string_view name) const { return find(name) != nullptr; }

    /// Remove every parameter with the given name, returning how many were removed
    std::size_t remove(std::string_view name);

    [[nodiscard]] std::vector<std::string> names() const;

    [[nodiscard]] std::size_t size() const noexcept { return m_params.size(); }
    [[nodiscard]] bool empty() const noexcept { return m_params.empty(); }
    [[nodiscard]] const Param& operator[](std::size_t i) const { return m_params[i]; }

    [[nodiscard]] iterator begin() noexcept { return m_params.begin(); }
    [[nodiscard]] iterator end() noexcept { return m_params.end(); }
    [[nodiscard]] const_iterator begin() const noexcept { return m_params.begin(); }
    [[nodiscard]] const_iterator end() const noexcept { return m_params.end(); }

private:
    std::vector<Param> m_params;
};

// =============================================================================
// Declarations
// =============================================================================

/// One annotation attached to a field: marker name plus raw payload text
struct Attribute {
    std::string marker;
    std::string payload;
};

/// One field of an annotated UI struct
struct FieldDecl {
    std::string name;
    std::string type;  ///< Declared type as written, e.g. `loom::ListBox<String>`
    std::vector<Attribute> attributes;

    [[nodiscard]] const Attribute* attribute(std::string_view marker) const;
};

/// Annotated UI struct: a full UI or a partial unit
struct StructDecl {
    std::string name;
    bool partial = false;
    std::vector<FieldDecl> fields;
};

// =============================================================================
// Graph
// =============================================================================

/// Role a field plays in the UI graph
enum class Role : std::uint8_t {
    Plain,
    Control,
    Resource,
    Layout,
    Partial,
};

[[nodiscard]] const char* role_name(Role role);

/// Resolved parent of a control, layout or partial
struct ParentRef {
    enum class Kind : std::uint8_t {
        Field,          ///< Another field of the same struct
        PartialParent,  ///< The parent handed to a partial by its caller
    };

    Kind kind = Kind::Field;
    std::string name;

    [[nodiscard]] static ParentRef field(std::string name) { return ParentRef{Kind::Field, std::move(name)}; }
    [[nodiscard]] static ParentRef partial_parent() { return ParentRef{Kind::PartialParent, {}}; }

    [[nodiscard]] bool is_partial_parent() const noexcept { return kind == Kind::PartialParent; }

    bool operator==(const ParentRef& other) const {
        return kind == other.kind && name == other.name;
    }
};

/// Construction order key: nesting depth first, declaration order second
struct Weight {
    std::uint16_t depth = 0;
    std::uint16_t index = 0;

    [[nodiscard]] std::uint32_t packed() const noexcept {
        return (static_cast<std::uint32_t>(depth) << 16) | index;
    }
};

/// Event name bound to handler expressions
struct EventBinding {
    std::string event;
    std::string target;  ///< Inner field for `(field, Event)` keys, empty for the owner
    std::vector<Expr> handlers;
};

// -----------------------------------------------------------------------------
// Placements
// -----------------------------------------------------------------------------

/// Placement referencing a layout by name, not yet bound
struct PendingPlacement {
    std::string layout;
    ParameterList params;
};

struct GridPlacement {
    std::uint32_t col = 0;
    std::uint32_t row = 0;
    std::uint32_t col_span = 1;
    std::uint32_t row_span = 1;
};

struct BoxPlacement {
    std::uint32_t cell = 0;
    std::uint32_t cell_span = 1;
};

struct FlexPlacement {
    ParameterList style;
};

struct DynPlacement {
    std::int32_t move_x = 0;
    std::int32_t move_y = 0;
    std::int32_t size_x = 0;
    std::int32_t size_y = 0;
};

using Placement = std::variant<PendingPlacement, GridPlacement, BoxPlacement, FlexPlacement, DynPlacement>;

[[nodiscard]] inline bool is_pending(const Placement& p) {
    return std::holds_alternative<PendingPlacement>(p);
}

// -----------------------------------------------------------------------------
// Entities
// -----------------------------------------------------------------------------

/// Classified struct field
struct Entity {
    std::string name;
    std::string type;
    Role role = Role::Plain;
    ParameterList params;
    std::size_t index = 0;  ///< Field position in the struct
    std::optional<Placement> placement;
    std::vector<EventBinding> events;
};

struct ControlEntity : Entity {
    std::optional<ParentRef> resolved_parent;
    Weight weight;
    std::optional<std::size_t> layout_index;
};

struct ResourceEntity : Entity {};

/// Child bound to a layout
struct LayoutChild {
    std::string control;
    Placement placement;
};

struct LayoutEntity : Entity {
    std::optional<ParentRef> resolved_parent;
    std::vector<LayoutChild> children;
};

struct PartialEntity : Entity {
    std::optional<ParentRef> resolved_parent;
};

/// Classified entities of one struct
struct UiGraph {
    std::string name;
    bool partial = false;

    std::vector<ResourceEntity> resources;
    std::vector<ControlEntity> controls;
    std::vector<LayoutEntity> layouts;
    std::vector<PartialEntity> partials;

    [[nodiscard]] const ControlEntity* find_control(std::string_view name) const;
    [[nodiscard]] ControlEntity* find_control(std::string_view name);
};

} // namespace loom_derive
