// loom_derive annotation parameter parser tests

#include <catch2/catch_test_macros.hpp>
#include <loom/derive/parameters.hpp>

using namespace loom_derive;

TEST_CASE("Parameter lists", "[derive][parameters]") {
    SECTION("empty payload") {
        auto params = parse_parameters("", "window");
        REQUIRE(params.is_ok());
        REQUIRE(params.value().empty());
    }

    SECTION("order and values are kept") {
        auto params = parse_parameters(R"(size: (300, 115), title: "Basic example", flags: "WINDOW|VISIBLE")", "window");
        REQUIRE(params.is_ok());
        REQUIRE(params.value().names() == std::vector<std::string>{"size", "title", "flags"});

        const Expr* size = params.value().find("size");
        REQUIRE(size != nullptr);
        REQUIRE(size->is(ExprKind::Tuple));
        REQUIRE(size->items.size() == 2);
        REQUIRE(size->items[1].int_value == 115);
        REQUIRE(params.value().find("title")->string_value == "Basic example");
    }

    SECTION("outer parentheses are optional") {
        auto params = parse_parameters("(parent: window, focus: true)", "button");
        REQUIRE(params.is_ok());
        REQUIRE(params.value().size() == 2);
        REQUIRE(params.value().find("parent")->is_bare_ident());
        REQUIRE(params.value().find("focus")->bool_value);
    }

    SECTION("a tuple value in parentheses is not stripped") {
        auto params = parse_parameters("(position: (1, 2))", "label");
        REQUIRE(params.is_ok());
        REQUIRE(params.value().find("position")->is(ExprKind::Tuple));
    }

    SECTION("duplicate names are kept") {
        auto params = parse_parameters("parent: a, parent: b", "x");
        REQUIRE(params.is_ok());
        REQUIRE(params.value().size() == 2);
        REQUIRE(params.value().find("parent")->text == "a");
    }

    SECTION("trailing comma") {
        auto params = parse_parameters("text: \"a\",", "label");
        REQUIRE(params.is_ok());
        REQUIRE(params.value().size() == 1);
    }
}

TEST_CASE("Parameter expressions", "[derive][parameters]") {
    SECTION("paths and fields") {
        auto e = parse_expression("loom::ButtonFlags::VISIBLE", "f");
        REQUIRE(e.is_ok());
        REQUIRE(e.value().is_path());
        REQUIRE(e.value().last_segment() == "VISIBLE");

        auto f = parse_expression("data.window", "f");
        REQUIRE(f.value().is(ExprKind::Field));
        REQUIRE(f.value().text == "data.window");
    }

    SECTION("bit-or of paths") {
        auto e = parse_expression("VISIBLE | TAB_STOP", "f");
        REQUIRE(e.value().is(ExprKind::BitOr));
        REQUIRE(e.value().items.size() == 2);
        REQUIRE(e.value().text == "VISIBLE | TAB_STOP");
    }

    SECTION("calls and macros") {
        auto call = parse_expression("Points(10.5)", "f");
        REQUIRE(call.value().is(ExprKind::Call));
        REQUIRE(call.value().items.front().float_value == 10.5);

        auto mac = parse_expression("vec![\"a\", \"b\"]", "f");
        REQUIRE(mac.value().is(ExprKind::Macro));
        REQUIRE(mac.value().text == R"(vec!["a", "b"])");
    }

    SECTION("unary operators") {
        REQUIRE(parse_expression("-5", "f").value().int_value == -5);
        REQUIRE(parse_expression("&data.icon", "f").value().text == "&data.icon");
        REQUIRE(parse_expression("!flag", "f").value().is(ExprKind::Unary));
    }

    SECTION("grouping versus one-element tuple") {
        REQUIRE(parse_expression("(3)", "f").value().is(ExprKind::Integer));
        REQUIRE(parse_expression("(3,)", "f").value().is(ExprKind::Tuple));
    }
}

TEST_CASE("Parameter parse errors", "[derive][parameters]") {
    SECTION("missing colon") {
        auto params = parse_parameters("text \"a\"", "label");
        REQUIRE(params.is_err());
        REQUIRE(params.error().code() == loom_core::ErrorCode::ParseError);
        REQUIRE(params.error().as<loom_core::DeriveError>()->field == "label");
    }

    SECTION("non identifier name") {
        auto params = parse_parameters("a::b: 1", "label");
        REQUIRE(params.is_err());
        REQUIRE(params.error().message().find("identifier") != std::string::npos);
    }

    SECTION("generic arguments") {
        auto e = parse_expression("Vec::<u8>::new()", "f");
        REQUIRE(e.is_err());
    }

    SECTION("lexer errors surface as parse errors") {
        auto params = parse_parameters("text: \"open", "label");
        REQUIRE(params.is_err());
        REQUIRE(params.error().message().find("Unterminated string") != std::string::npos);
    }

    SECTION("unclosed list") {
        REQUIRE(parse_expression("[1, 2", "f").is_err());
    }
}
