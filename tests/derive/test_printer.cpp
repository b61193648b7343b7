// loom_derive code printer tests

#include <catch2/catch_test_macros.hpp>
#include <loom/derive/compiler.hpp>
#include <loom/derive/parameters.hpp>
#include <loom/derive/printer.hpp>

using namespace loom_derive;

namespace {

bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

Expr expr(const char* text) {
    return parse_expression(text, "test").value();
}

} // anonymous namespace

TEST_CASE("Expressions as C++", "[derive][printer]") {
    REQUIRE(to_cpp(expr("(300, 115)")) == "{300, 115}");
    REQUIRE(to_cpp(expr("vec![\"a\", \"b\"]")) == "{\"a\", \"b\"}");
    REQUIRE(to_cpp(expr("&data.icon")) == "data.icon");
    REQUIRE(to_cpp(expr("Some(&data.font)")) == "Some(data.font)");
    REQUIRE(to_cpp(expr("1.5f32")) == "1.5");
    REQUIRE(to_cpp(expr("!enabled")) == "!enabled");
    REQUIRE(to_cpp(expr("loom::ButtonFlags::VISIBLE")) == "loom::ButtonFlags::VISIBLE");
}

TEST_CASE("Snake case names", "[derive][printer]") {
    REQUIRE(snake_case("PeopleUi") == "people_ui");
    REQUIRE(snake_case("BasicApp") == "basic_app");
    REQUIRE(snake_case("HTTPServer") == "http_server");
    REQUIRE(snake_case("Form2Ui") == "form2_ui");
    REQUIRE(snake_case("already_snake") == "already_snake");
}

TEST_CASE("Printed build functions", "[derive][printer]") {
    StructDecl decl{"BasicApp", false, {
        FieldDecl{"window", "loom::Window", {{"control", "(size: (300, 115), title: \"Basic\", flags: \"WINDOW|VISIBLE\")"},
                                             {"events", "(OnWindowClose: [BasicApp::say_goodbye])"}}},
        FieldDecl{"name_edit", "loom::TextInput", {{"control", "(text: \"Heisenberg\", focus: true)"},
                                                   {"layout_item", "(layout: grid, col: 0, row: 0, col_span: 2)"}}},
        FieldDecl{"font", "loom::Font", {{"resource", "(family: \"Arial\")"}}},
        FieldDecl{"grid", "loom::GridLayout", {{"layout", "(parent: window, spacing: 1)"}}},
        FieldDecl{"form", "FormUi", {{"partial", "(parent: window)"}}},
    }};

    DeriveConfig config;
    UiCompiler compiler(config);
    auto plan = compiler.compile(decl);
    REQUIRE(plan.is_ok());

    CodePrinter printer(config);
    std::string code = printer.print(plan.value());

    SECTION("function signature") {
        REQUIRE(printer.function_name(plan.value()) == "build_basic_app_ui");
        REQUIRE(contains(code, "loom_core::Result<void> build_basic_app_ui(BasicApp& data) {"));
        REQUIRE(contains(code, "return loom_core::Ok();\n}"));
    }

    SECTION("builder chains") {
        REQUIRE(contains(code, "LOOM_TRY(loom::Window::builder()\n        .size({300, 115})"));
        REQUIRE(contains(code, ".flags(loom::WindowFlags::WINDOW | loom::WindowFlags::VISIBLE)"));
        REQUIRE(contains(code, ".build(data.window));"));
        REQUIRE(contains(code, "LOOM_TRY(loom::Font::builder()\n        .family(\"Arial\")\n        .build(data.font));"));
    }

    SECTION("inferred parents are printed") {
        REQUIRE(contains(code, ".focus(true)\n        .parent(data.window)\n        .build(data.name_edit));"));
    }

    SECTION("explicit parent keeps its position") {
        REQUIRE(contains(code, "LOOM_TRY(loom::GridLayout::builder()\n        .parent(data.window)\n        .spacing(1)"));
    }

    SECTION("layout children") {
        REQUIRE(contains(code, ".child_item(loom::GridLayoutItem(data.name_edit, 0, 0, 2, 1))"));
    }

    SECTION("events") {
        REQUIRE(contains(code, "data.window.on(loom::Event::OnWindowClose, BasicApp::say_goodbye);"));
    }

    SECTION("partials") {
        REQUIRE(contains(code, "LOOM_TRY(build_partial_form_ui(data.form, data.window));"));
    }

    SECTION("sections appear in phase order") {
        auto resources = code.find("// Resources");
        auto controls = code.find("// Controls");
        auto events = code.find("// Events");
        auto layouts = code.find("// Layouts");
        auto partials = code.find("// Partials");
        REQUIRE(resources < controls);
        REQUIRE(controls < events);
        REQUIRE(events < layouts);
        REQUIRE(layouts < partials);
        REQUIRE(partials != std::string::npos);
    }
}

TEST_CASE("Repeated parent parameters", "[derive][printer]") {
    StructDecl decl{"DupApp", false, {
        FieldDecl{"window", "loom::Window", {{"control", "(title: \"Dup\")"}}},
        FieldDecl{"ok", "loom::Button", {{"control", "(parent: window, text: \"Ok\", parent: window)"}}},
    }};

    DeriveConfig config;
    UiCompiler compiler(config);
    auto plan = compiler.compile(decl);
    REQUIRE(plan.is_ok());
    std::string code = CodePrinter(config).print(plan.value());

    REQUIRE(contains(code, "LOOM_TRY(loom::Button::builder()\n        .parent(data.window)\n        .text(\"Ok\")\n        "
                           ".parent(data.window)\n        .build(data.ok));"));
    REQUIRE_FALSE(contains(code, ".parent(window)"));
}

TEST_CASE("Printed partial functions", "[derive][printer]") {
    StructDecl decl{"FormUi", true, {
        FieldDecl{"save", "loom::Button", {{"control", "(text: \"Save\")"},
                                           {"layout_item", "(layout: flex, flex_grow: 1.0, size: (Points(50.0), Auto))"}}},
        FieldDecl{"flex", "loom::FlexboxLayout", {{"layout", "(flex_direction: FlexDirection::Column)"}}},
    }};

    DeriveConfig config;
    UiCompiler compiler(config);
    auto plan = compiler.compile(decl);
    REQUIRE(plan.is_ok());

    CodePrinter printer(config);
    std::string code = printer.print(plan.value());

    REQUIRE(contains(code, "build_partial_form_ui(FormUi& data, loom::ControlHandle parent) {"));
    REQUIRE(contains(code, ".text(\"Save\")\n        .parent(parent)"));
    REQUIRE(contains(code, ".flex_direction(loom::FlexDirection::Column)"));
    REQUIRE(contains(code, ".child_item(loom::FlexboxLayoutItem(data.save).flex_grow(1.0).size({Points(50.0), Auto}))"));
}

TEST_CASE("Generated document puts partials first", "[derive][printer]") {
    UiDocument doc;
    doc.root = StructDecl{"App", false, {
        FieldDecl{"window", "loom::Window", {{"control", ""}}},
        FieldDecl{"form", "FormUi", {{"partial", "(parent: window)"}}},
    }};
    doc.partials.push_back(StructDecl{"FormUi", true, {
        FieldDecl{"label", "loom::Label", {{"control", "(text: \"Name\")"}}},
    }});

    UiCompiler compiler;
    auto code = compiler.generate(doc);
    REQUIRE(code.is_ok());
    auto partial = code.value().find("build_partial_form_ui(FormUi& data");
    auto root = code.value().find("build_app_ui(App& data)");
    REQUIRE(partial != std::string::npos);
    REQUIRE(root != std::string::npos);
    REQUIRE(partial < root);
}
