/// @file types.cpp
/// @brief Expression rendering and graph helpers for loom_derive

#include <loom/derive/types.hpp>

#include <algorithm>
#include <sstream>

namespace loom_derive {

// =============================================================================
// Expr Factories
// =============================================================================

namespace {

std::string join_items(const std::vector<Expr>& items, const char* separator) {
    std::string out;
    for (std::size_t i = 0; i < items.size(); ++i) {
        if (i > 0) out += separator;
        out += items[i].text;
    }
    return out;
}

std::string quote(const std::string& value) {
    std::string out = "\"";
    for (char c : value) {
        switch (c) {
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\t': out += "\\t"; break;
            case '\r': out += "\\r"; break;
            default: out += c; break;
        }
    }
    out += '"';
    return out;
}

} // anonymous namespace

std::string join_path(const std::vector<std::string>& segments) {
    std::string out;
    for (std::size_t i = 0; i < segments.size(); ++i) {
        if (i > 0) out += "::";
        out += segments[i];
    }
    return out;
}

Expr Expr::path(std::vector<std::string> segments) {
    Expr e;
    e.kind = ExprKind::Path;
    e.segments = std::move(segments);
    e.text = render(e);
    return e;
}

Expr Expr::field(std::vector<std::string> segments) {
    Expr e;
    e.kind = ExprKind::Field;
    e.segments = std::move(segments);
    e.text = render(e);
    return e;
}

Expr Expr::integer(std::int64_t value) {
    Expr e;
    e.kind = ExprKind::Integer;
    e.int_value = value;
    e.float_value = static_cast<double>(value);
    e.text = render(e);
    return e;
}

Expr Expr::floating(double value, std::string text) {
    Expr e;
    e.kind = ExprKind::Float;
    e.float_value = value;
    e.text = std::move(text);
    if (e.text.empty()) {
        e.text = render(e);
    }
    return e;
}

Expr Expr::string(std::string value) {
    Expr e;
    e.kind = ExprKind::String;
    e.string_value = std::move(value);
    e.text = render(e);
    return e;
}

Expr Expr::boolean(bool value) {
    Expr e;
    e.kind = ExprKind::Bool;
    e.bool_value = value;
    e.text = render(e);
    return e;
}

Expr Expr::array(std::vector<Expr> items) {
    Expr e;
    e.kind = ExprKind::Array;
    e.items = std::move(items);
    e.text = render(e);
    return e;
}

Expr Expr::tuple(std::vector<Expr> items) {
    Expr e;
    e.kind = ExprKind::Tuple;
    e.items = std::move(items);
    e.text = render(e);
    return e;
}

Expr Expr::bit_or(std::vector<Expr> operands) {
    Expr e;
    e.kind = ExprKind::BitOr;
    e.items = std::move(operands);
    e.text = render(e);
    return e;
}

Expr Expr::call(std::vector<std::string> callee, std::vector<Expr> args) {
    Expr e;
    e.kind = ExprKind::Call;
    e.segments = std::move(callee);
    e.items = std::move(args);
    e.text = render(e);
    return e;
}

Expr Expr::macro(std::string name, std::vector<Expr> items) {
    Expr e;
    e.kind = ExprKind::Macro;
    e.segments.push_back(std::move(name));
    e.items = std::move(items);
    e.text = render(e);
    return e;
}

Expr Expr::unary(std::string op, Expr operand) {
    Expr e;
    e.kind = ExprKind::Unary;
    e.string_value = std::move(op);
    e.items.push_back(std::move(operand));
    e.text = render(e);
    return e;
}

// =============================================================================
// Rendering
// =============================================================================

std::string render(const Expr& expr) {
    switch (expr.kind) {
        case ExprKind::Path:
            return join_path(expr.segments);
        case ExprKind::Field: {
            std::string out;
            for (std::size_t i = 0; i < expr.segments.size(); ++i) {
                if (i > 0) out += '.';
                out += expr.segments[i];
            }
            return out;
        }
        case ExprKind::Integer:
            return std::to_string(expr.int_value);
        case ExprKind::Float: {
            if (!expr.text.empty()) return expr.text;
            std::ostringstream oss;
            oss << expr.float_value;
            return oss.str();
        }
        case ExprKind::String:
            return quote(expr.string_value);
        case ExprKind::Bool:
            return expr.bool_value ? "true" : "false";
        case ExprKind::Array:
            return "[" + join_items(expr.items, ", ") + "]";
        case ExprKind::Tuple:
            return "(" + join_items(expr.items, ", ") + ")";
        case ExprKind::BitOr:
            return join_items(expr.items, " | ");
        case ExprKind::Call:
            return join_path(expr.segments) + "(" + join_items(expr.items, ", ") + ")";
        case ExprKind::Macro:
            return expr.segments.front() + "![" + join_items(expr.items, ", ") + "]";
        case ExprKind::Unary:
            return expr.string_value + (expr.items.empty() ? std::string{} : expr.items.front().text);
    }
    return expr.text;
}

// =============================================================================
// ParameterList
// =============================================================================

const Expr* ParameterList::find(std::string_view name) const {
    for (const auto& p : m_params) {
        if (p.name == name) return &p.value;
    }
    return nullptr;
}

Expr* ParameterList::find(std::string_view name) {
    for (auto& p : m_params) {
        if (p.name == name) return &p.value;
    }
    return nullptr;
}

std::size_t ParameterList::remove(std::string_view name) {
    auto before = m_params.size();
    m_params.erase(
        std::remove_if(m_params.begin(), m_params.end(),
                       [name](const Param& p) { return p.name == name; }),
        m_params.end());
    return before - m_params.size();
}

std::vector<std::string> ParameterList::names() const {
    std::vector<std::string> out;
    out.reserve(m_params.size());
    for (const auto& p : m_params) {
        out.push_back(p.name);
    }
    return out;
}

// =============================================================================
// Declarations and Graph
// =============================================================================

const Attribute* FieldDecl::attribute(std::string_view marker) const {
    for (const auto& attr : attributes) {
        if (attr.marker == marker) return &attr;
    }
    return nullptr;
}

const char* role_name(Role role) {
    switch (role) {
        case Role::Plain: return "plain";
        case Role::Control: return "control";
        case Role::Resource: return "resource";
        case Role::Layout: return "layout";
        case Role::Partial: return "partial";
        default: return "unknown";
    }
}

const ControlEntity* UiGraph::find_control(std::string_view name) const {
    for (const auto& c : controls) {
        if (c.name == name) return &c;
    }
    return nullptr;
}

ControlEntity* UiGraph::find_control(std::string_view name) {
    for (auto& c : controls) {
        if (c.name == name) return &c;
    }
    return nullptr;
}

} // namespace loom_derive
