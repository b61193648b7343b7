// loom_derive parent resolution and construction order tests

#include <catch2/catch_test_macros.hpp>
#include <loom/derive/compiler.hpp>
#include <loom/derive/resolver.hpp>

#include <map>

using namespace loom_derive;

namespace {

FieldDecl control(std::string name, std::string type, std::string payload = "") {
    return FieldDecl{std::move(name), "loom::" + type, {{"control", std::move(payload)}}};
}

std::vector<std::string> order_of(const UiGraph& graph) {
    std::vector<std::string> out;
    for (const auto& c : graph.controls) {
        out.push_back(c.name);
    }
    return out;
}

std::string parent_of(const UiGraph& graph, const std::string& name) {
    const ControlEntity* c = graph.find_control(name);
    if (!c || !c->resolved_parent) return "";
    return c->resolved_parent->is_partial_parent() ? "<partial>" : c->resolved_parent->name;
}

} // anonymous namespace

TEST_CASE("Window, frame and button chain", "[derive][resolver]") {
    StructDecl decl{"App", false, {
        control("w", "Window"),
        control("f", "Frame"),
        control("b", "Button"),
    }};

    UiCompiler compiler;
    auto graph = compiler.analyze(decl);
    REQUIRE(graph.is_ok());

    REQUIRE(parent_of(graph.value(), "w").empty());
    REQUIRE(parent_of(graph.value(), "f") == "w");
    REQUIRE(parent_of(graph.value(), "b") == "f");

    REQUIRE(graph.value().find_control("w")->weight.depth == 0);
    REQUIRE(graph.value().find_control("f")->weight.depth == 1);
    REQUIRE(graph.value().find_control("b")->weight.depth == 2);
    REQUIRE(order_of(graph.value()) == std::vector<std::string>{"w", "f", "b"});
}

TEST_CASE("Implicit parent is the nearest earlier container", "[derive][resolver]") {
    StructDecl decl{"App", false, {
        control("window", "Window"),
        control("label", "Label"),
        control("tabs", "TabsContainer"),
        control("tab1", "Tab"),
        control("input", "TextInput"),
        control("tab2", "Tab", "(parent: tabs)"),
        control("check", "CheckBox"),
    }};

    UiCompiler compiler;
    auto graph = compiler.analyze(decl);
    REQUIRE(graph.is_ok());

    REQUIRE(parent_of(graph.value(), "label") == "window");
    REQUIRE(parent_of(graph.value(), "tabs") == "window");
    REQUIRE(parent_of(graph.value(), "tab1") == "tabs");
    REQUIRE(parent_of(graph.value(), "input") == "tab1");
    REQUIRE(parent_of(graph.value(), "tab2") == "tabs");
    REQUIRE(parent_of(graph.value(), "check") == "tab2");
}

TEST_CASE("Construction order invariants", "[derive][resolver]") {
    // Declared out of depth order: deep children early, shallow siblings late
    StructDecl decl{"App", false, {
        control("window", "Window"),
        control("frame", "Frame"),
        control("b1", "Button"),
        control("b2", "Button", "(parent: window)"),
        control("inner", "Frame", "(parent: frame)"),
        control("b3", "Button"),
        control("b4", "Button", "(parent: window)"),
        control("popup", "Window"),
    }};

    UiCompiler compiler;
    auto graph = compiler.analyze(decl);
    REQUIRE(graph.is_ok());
    const auto& controls = graph.value().controls;

    std::map<std::string, std::size_t> position;
    for (std::size_t i = 0; i < controls.size(); ++i) {
        position[controls[i].name] = i;
    }

    SECTION("parents precede their children") {
        for (const auto& c : controls) {
            if (c.resolved_parent) {
                REQUIRE(position[c.resolved_parent->name] < position[c.name]);
            }
        }
    }

    SECTION("equal depth keeps declaration order") {
        for (std::size_t i = 0; i < controls.size(); ++i) {
            for (std::size_t j = i + 1; j < controls.size(); ++j) {
                if (controls[i].weight.depth == controls[j].weight.depth) {
                    REQUIRE(controls[i].index < controls[j].index);
                }
            }
        }
    }

    SECTION("depth dominates declaration order") {
        REQUIRE(order_of(graph.value()) ==
                std::vector<std::string>{"window", "popup", "frame", "b2", "b4", "b1", "inner", "b3"});
    }

    SECTION("weight index is the declaration index") {
        for (const auto& c : controls) {
            REQUIRE(c.weight.index == c.index);
        }
    }
}

TEST_CASE("Parent resolution in partials", "[derive][resolver]") {
    StructDecl decl{"FormUi", true, {
        control("name_label", "Label"),
        control("frame", "Frame"),
        control("name_input", "TextInput"),
    }};

    UiCompiler compiler;
    auto graph = compiler.analyze(decl);
    REQUIRE(graph.is_ok());

    REQUIRE(parent_of(graph.value(), "name_label") == "<partial>");
    REQUIRE(parent_of(graph.value(), "frame") == "<partial>");
    REQUIRE(parent_of(graph.value(), "name_input") == "frame");
    REQUIRE(graph.value().find_control("frame")->weight.depth == 0);
    REQUIRE(graph.value().find_control("name_input")->weight.depth == 1);
}

TEST_CASE("Parentless controls", "[derive][resolver]") {
    StructDecl decl{"App", false, {
        control("notice", "Notice"),
        control("window", "Window"),
    }};

    SECTION("accepted by default") {
        UiCompiler compiler;
        auto graph = compiler.analyze(decl);
        REQUIRE(graph.is_ok());
        REQUIRE(parent_of(graph.value(), "notice").empty());
    }

    SECTION("rejected in strict mode") {
        DeriveConfig config;
        config.strict_parents = true;
        UiCompiler compiler(config);
        auto graph = compiler.analyze(decl);
        REQUIRE(graph.is_err());
        REQUIRE(graph.error().as<loom_core::DeriveError>()->kind == loom_core::DeriveError::Kind::MissingParent);
        REQUIRE(*graph.error().get_context("struct") == "App");
    }
}

TEST_CASE("Explicit parent errors", "[derive][resolver]") {
    UiCompiler compiler;

    SECTION("non path parent") {
        StructDecl decl{"App", false, {control("window", "Window"), control("b", "Button", "(parent: \"window\")")}};
        auto graph = compiler.analyze(decl);
        REQUIRE(graph.is_err());
        REQUIRE(graph.error().as<loom_core::DeriveError>()->kind == loom_core::DeriveError::Kind::InvalidParent);
        REQUIRE(graph.error().as<loom_core::DeriveError>()->field == "b");
    }

    SECTION("unknown parent") {
        StructDecl decl{"App", false, {control("b", "Button", "(parent: nowhere)")}};
        REQUIRE(compiler.analyze(decl).is_err());
    }

    SECTION("self parent") {
        StructDecl decl{"App", false, {control("b", "Frame", "(parent: b)")}};
        REQUIRE(compiler.analyze(decl).is_err());
    }

    SECTION("explicit parent cycle") {
        StructDecl decl{"App", false, {
            control("a", "Frame", "(parent: b)"),
            control("b", "Frame", "(parent: a)"),
        }};
        auto graph = compiler.analyze(decl);
        REQUIRE(graph.is_err());
        REQUIRE(graph.error().as<loom_core::DeriveError>()->kind == loom_core::DeriveError::Kind::ParentCycle);
    }
}

TEST_CASE("Explicit parent paths use the last segment", "[derive][resolver]") {
    UiGraph graph;
    graph.controls.push_back(ControlEntity{});
    graph.controls.back().name = "window";

    auto parent = ParentResolver::explicit_parent(graph, "b", Expr::path({"data", "window"}));
    REQUIRE(parent.is_ok());
    REQUIRE(parent.value() == ParentRef::field("window"));
}
