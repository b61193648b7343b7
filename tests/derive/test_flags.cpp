// loom_derive flag expansion tests

#include <catch2/catch_test_macros.hpp>
#include <loom/derive/flags.hpp>
#include <loom/derive/parameters.hpp>

using namespace loom_derive;

namespace {

Expr expr(const char* text) {
    return parse_expression(text, "test").value();
}

} // anonymous namespace

TEST_CASE("Flag expansion", "[derive][flags]") {
    DeriveConfig config;
    FlagExpander expander(config);

    SECTION("flags type name") {
        REQUIRE(expander.flags_type("Button") == "ButtonFlags");
    }

    SECTION("single bare symbol") {
        auto e = expander.expand("b", "Button", expr("VISIBLE"));
        REQUIRE(e.is_ok());
        REQUIRE(e.value().text == "loom::ButtonFlags::VISIBLE");
    }

    SECTION("bit-or of bare symbols") {
        auto e = expander.expand("w", "Window", expr("WINDOW | VISIBLE"));
        REQUIRE(e.value().is(ExprKind::BitOr));
        REQUIRE(e.value().text == "loom::WindowFlags::WINDOW | loom::WindowFlags::VISIBLE");
    }

    SECTION("compressed string form") {
        auto e = expander.expand("w", "Window", expr("\"WINDOW | VISIBLE\""));
        REQUIRE(e.value().text == "loom::WindowFlags::WINDOW | loom::WindowFlags::VISIBLE");

        auto single = expander.expand("w", "Window", expr("\"VISIBLE\""));
        REQUIRE(single.value().is_path());
    }

    SECTION("qualified operands pass through") {
        auto original = expr("loom::ButtonFlags::VISIBLE | DISABLED");
        auto e = expander.expand("b", "Button", original);
        REQUIRE(e.value().text == original.text);
    }

    SECTION("other shapes pass through") {
        auto e = expander.expand("b", "Button", expr("make_flags()"));
        REQUIRE(e.value().is(ExprKind::Call));
    }

    SECTION("invalid symbol in string") {
        auto e = expander.expand("w", "Window", expr("\"VISIBLE | 3D\""));
        REQUIRE(e.is_err());
        REQUIRE(e.error().code() == loom_core::ErrorCode::ParseError);
    }

    SECTION("empty library namespace") {
        DeriveConfig bare;
        bare.library_namespace.clear();
        FlagExpander bare_expander(bare);
        REQUIRE(bare_expander.expand("b", "Button", expr("VISIBLE")).value().text == "ButtonFlags::VISIBLE");
    }
}

TEST_CASE("Flag expansion applies to the flags parameter only", "[derive][flags]") {
    DeriveConfig config;
    FlagExpander expander(config);

    auto params = parse_parameters("text: VISIBLE, flags: VISIBLE | DISABLED", "b").value();
    REQUIRE(expander.apply("b", "Button", params).is_ok());
    REQUIRE(params.find("text")->text == "VISIBLE");
    REQUIRE(params.find("flags")->text == "loom::ButtonFlags::VISIBLE | loom::ButtonFlags::DISABLED");

    ParameterList none;
    REQUIRE(expander.apply("b", "Button", none).is_ok());
    REQUIRE(none.empty());
}

TEST_CASE("Enum parameter qualification", "[derive][flags]") {
    DeriveConfig config;

    auto params = parse_parameters(
        "h_align: HTextAlign::Center, layout_type: loom::BoxLayoutType::Vertical, text: Foo::Bar, "
        "flex_direction: \"Row\"", "x").value();
    qualify_enum_params(config, params);

    REQUIRE(params.find("h_align")->text == "loom::HTextAlign::Center");
    REQUIRE(params.find("layout_type")->text == "loom::BoxLayoutType::Vertical");
    REQUIRE(params.find("text")->text == "Foo::Bar");
    REQUIRE(params.find("flex_direction")->is(ExprKind::String));
}
