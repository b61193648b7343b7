#pragma once

/// @file printer.hpp
/// @brief Rendering of construction plans as C++ builder chains

#include "config.hpp"
#include "plan.hpp"

#include <string>
#include <string_view>

namespace loom_derive {

/// @brief Prints a ConstructionPlan as a C++ build function
///
/// A full UI prints as `build_<name>_ui(Name& data)`, a partial as
/// `build_partial_<name>(Name& data, loom::ControlHandle parent)`. Every
/// step is a builder chain wrapped in LOOM_TRY so the first failure
/// returns from the function.
class CodePrinter {
public:
    explicit CodePrinter(const DeriveConfig& config) : m_config(config) {}

    [[nodiscard]] std::string print(const ConstructionPlan& plan) const;

    /// Name of the generated build function
    [[nodiscard]] std::string function_name(const ConstructionPlan& plan) const;

private:
    [[nodiscard]] std::string qualified(const std::string& type) const;
    [[nodiscard]] std::string parent_expr(const ParentRef& parent) const;

    void print_builder(std::string& out, const ConstructionStep& step) const;
    void print_events(std::string& out, const ConstructionStep& step) const;
    void print_partial(std::string& out, const ConstructionStep& step) const;
    [[nodiscard]] std::string child_item(const LayoutChild& child) const;

    const DeriveConfig& m_config;
};

/// Render an annotation expression as a C++ expression
[[nodiscard]] std::string to_cpp(const Expr& expr);

/// `PeopleUi` gives `people_ui`
[[nodiscard]] std::string snake_case(std::string_view name);

} // namespace loom_derive
