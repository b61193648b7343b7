/// @file printer.cpp
/// @brief Rendering of construction plans as C++ builder chains

#include <loom/derive/printer.hpp>

#include <cctype>
#include <variant>

namespace loom_derive {

namespace {

std::string join_cpp(const std::vector<Expr>& items, const char* separator) {
    std::string out;
    for (std::size_t i = 0; i < items.size(); ++i) {
        if (i > 0) out += separator;
        out += to_cpp(items[i]);
    }
    return out;
}

constexpr const char* k_indent = "    ";
constexpr const char* k_chain_indent = "        ";

} // anonymous namespace

std::string to_cpp(const Expr& expr) {
    switch (expr.kind) {
        case ExprKind::Array:
        case ExprKind::Tuple:
        case ExprKind::Macro:
            return "{" + join_cpp(expr.items, ", ") + "}";
        case ExprKind::BitOr:
            return join_cpp(expr.items, " | ");
        case ExprKind::Call:
            return join_path(expr.segments) + "(" + join_cpp(expr.items, ", ") + ")";
        case ExprKind::Unary:
            // References are implicit in C++ builder arguments
            if (expr.string_value.front() == '&') {
                return to_cpp(expr.items.front());
            }
            return expr.string_value + to_cpp(expr.items.front());
        default:
            return render(expr);
    }
}

std::string snake_case(std::string_view name) {
    std::string out;
    for (std::size_t i = 0; i < name.size(); ++i) {
        char c = name[i];
        if (std::isupper(static_cast<unsigned char>(c))) {
            bool prev_lower = i > 0 && (std::islower(static_cast<unsigned char>(name[i - 1])) ||
                                        std::isdigit(static_cast<unsigned char>(name[i - 1])));
            bool next_lower = i + 1 < name.size() && std::islower(static_cast<unsigned char>(name[i + 1]));
            bool prev_upper = i > 0 && std::isupper(static_cast<unsigned char>(name[i - 1]));
            if (i > 0 && (prev_lower || (prev_upper && next_lower))) {
                out += '_';
            }
            out += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        } else {
            out += c;
        }
    }
    return out;
}

// =============================================================================
// CodePrinter
// =============================================================================

std::string CodePrinter::function_name(const ConstructionPlan& plan) const {
    if (plan.partial) {
        return "build_partial_" + snake_case(plan.name);
    }
    return "build_" + snake_case(plan.name) + "_ui";
}

std::string CodePrinter::qualified(const std::string& type) const {
    if (m_config.library_namespace.empty()) {
        return type;
    }
    return m_config.library_namespace + "::" + type;
}

std::string CodePrinter::parent_expr(const ParentRef& parent) const {
    if (parent.is_partial_parent()) {
        return "parent";
    }
    return "data." + parent.name;
}

std::string CodePrinter::print(const ConstructionPlan& plan) const {
    std::string out;
    out += "// Generated by loom-derive from " + plan.name + ". Do not edit.\n";
    out += "loom_core::Result<void> " + function_name(plan) + "(" + plan.name + "& data";
    if (plan.partial) {
        out += ", " + qualified("ControlHandle") + " parent";
    }
    out += ") {\n";

    const char* headers[] = {"Resources", "Controls", "Events", "Layouts", "Partials"};
    bool first = true;
    std::optional<StepKind> section;

    for (const auto& step : plan.steps) {
        if (!section || *section != step.kind) {
            if (!first) out += "\n";
            out += std::string(k_indent) + "// " + headers[static_cast<std::size_t>(step.kind)] + "\n";
            section = step.kind;
            first = false;
        }

        switch (step.kind) {
            case StepKind::Resource:
            case StepKind::Control:
            case StepKind::Layout:
                print_builder(out, step);
                break;
            case StepKind::Event:
                print_events(out, step);
                break;
            case StepKind::Partial:
                print_partial(out, step);
                break;
        }
    }

    if (!first) out += "\n";
    out += std::string(k_indent) + "return loom_core::Ok();\n";
    out += "}\n";
    return out;
}

void CodePrinter::print_builder(std::string& out, const ConstructionStep& step) const {
    out += std::string(k_indent) + "LOOM_TRY(" + qualified(step.target_type) + "::builder()";

    // Every `parent` parameter, duplicates included, names the resolved parent
    bool parent_printed = false;
    for (const auto& param : step.params) {
        out += "\n" + std::string(k_chain_indent) + "." + param.name + "(";
        if (param.name == "parent" && step.parent) {
            out += parent_expr(*step.parent);
            parent_printed = true;
        } else {
            out += to_cpp(param.value);
        }
        out += ")";
    }

    if (step.parent && !parent_printed) {
        out += "\n" + std::string(k_chain_indent) + ".parent(" + parent_expr(*step.parent) + ")";
    }

    for (const auto& child : step.children) {
        out += "\n" + std::string(k_chain_indent) + ".child_item(" + child_item(child) + ")";
    }

    out += "\n" + std::string(k_chain_indent) + ".build(data." + step.target_slot + "));\n";
}

void CodePrinter::print_events(std::string& out, const ConstructionStep& step) const {
    for (const auto& binding : step.events) {
        std::string target = "data." + step.target_slot;
        if (!binding.target.empty()) {
            target += "." + binding.target;
        }
        for (const auto& handler : binding.handlers) {
            out += std::string(k_indent) + target + ".on(" + qualified("Event") + "::" + binding.event +
                   ", " + to_cpp(handler) + ");\n";
        }
    }
}

void CodePrinter::print_partial(std::string& out, const ConstructionStep& step) const {
    std::string parent = step.parent ? parent_expr(*step.parent) : qualified("ControlHandle") + "{}";
    out += std::string(k_indent) + "LOOM_TRY(build_partial_" + snake_case(step.target_type) +
           "(data." + step.target_slot + ", " + parent + "));\n";
}

std::string CodePrinter::child_item(const LayoutChild& child) const {
    const std::string slot = "data." + child.control;

    return std::visit([&](const auto& placement) -> std::string {
        using T = std::decay_t<decltype(placement)>;
        if constexpr (std::is_same_v<T, GridPlacement>) {
            return qualified("GridLayoutItem") + "(" + slot + ", " + std::to_string(placement.col) + ", " +
                   std::to_string(placement.row) + ", " + std::to_string(placement.col_span) + ", " +
                   std::to_string(placement.row_span) + ")";
        } else if constexpr (std::is_same_v<T, BoxPlacement>) {
            return qualified("BoxLayoutItem") + "(" + slot + ", " + std::to_string(placement.cell) + ", " +
                   std::to_string(placement.cell_span) + ")";
        } else if constexpr (std::is_same_v<T, DynPlacement>) {
            return qualified("DynLayoutItem") + "(" + slot + ", {" + std::to_string(placement.move_x) + ", " +
                   std::to_string(placement.move_y) + "}, {" + std::to_string(placement.size_x) + ", " +
                   std::to_string(placement.size_y) + "})";
        } else if constexpr (std::is_same_v<T, FlexPlacement>) {
            std::string item = qualified("FlexboxLayoutItem") + "(" + slot + ")";
            for (const auto& param : placement.style) {
                item += "." + param.name + "(" + to_cpp(param.value) + ")";
            }
            return item;
        } else {
            return slot;
        }
    }, child.placement);
}

} // namespace loom_derive
