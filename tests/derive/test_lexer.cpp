// loom_derive annotation lexer tests

#include <catch2/catch_test_macros.hpp>
#include <loom/derive/lexer.hpp>

using namespace loom_derive;

namespace {

std::vector<TokenType> types_of(std::string_view source) {
    Lexer lexer(source);
    std::vector<TokenType> out;
    for (const auto& tok : lexer.tokenize()) {
        out.push_back(tok.type);
    }
    return out;
}

} // anonymous namespace

TEST_CASE("Lexer punctuation", "[derive][lexer]") {
    SECTION("path separators") {
        auto types = types_of("a::b: c");
        REQUIRE(types == std::vector<TokenType>{
            TokenType::Identifier, TokenType::ColonColon, TokenType::Identifier,
            TokenType::Colon, TokenType::Identifier, TokenType::Eof});
    }

    SECTION("flag expressions") {
        auto types = types_of("VISIBLE | TAB_STOP");
        REQUIRE(types == std::vector<TokenType>{
            TokenType::Identifier, TokenType::Pipe, TokenType::Identifier, TokenType::Eof});
    }

    SECTION("brackets and operators") {
        auto types = types_of("[&x, !y, -1]");
        REQUIRE(types.front() == TokenType::LeftBracket);
        REQUIRE(types[1] == TokenType::Ampersand);
        REQUIRE(types[4] == TokenType::Bang);
        REQUIRE(types[7] == TokenType::Minus);
        REQUIRE(types.back() == TokenType::Eof);
    }
}

TEST_CASE("Lexer literals", "[derive][lexer]") {
    SECTION("integers") {
        Lexer lexer("1_000 42u32");
        Token a = lexer.next_token();
        Token b = lexer.next_token();
        REQUIRE(a.is(TokenType::Integer));
        REQUIRE(a.int_value == 1000);
        REQUIRE(b.int_value == 42);
    }

    SECTION("floats") {
        Lexer lexer("1.5 2e3");
        Token a = lexer.next_token();
        Token b = lexer.next_token();
        REQUIRE(a.is(TokenType::Float));
        REQUIRE(a.float_value == 1.5);
        REQUIRE(b.is(TokenType::Float));
        REQUIRE(b.float_value == 2000.0);
    }

    SECTION("tuple index stays an integer") {
        auto types = types_of("x.0");
        REQUIRE(types == std::vector<TokenType>{
            TokenType::Identifier, TokenType::Dot, TokenType::Integer, TokenType::Eof});
    }

    SECTION("strings with escapes") {
        Lexer lexer(R"("Say \"hi\"\n")");
        Token tok = lexer.next_token();
        REQUIRE(tok.is(TokenType::String));
        REQUIRE(tok.string_value == "Say \"hi\"\n");
    }

    SECTION("booleans") {
        auto types = types_of("true false truthy");
        REQUIRE(types == std::vector<TokenType>{
            TokenType::True, TokenType::False, TokenType::Identifier, TokenType::Eof});
    }
}

TEST_CASE("Lexer errors", "[derive][lexer]") {
    SECTION("unterminated string") {
        Lexer lexer("\"open");
        auto tokens = lexer.tokenize();
        REQUIRE(tokens.back().is(TokenType::Error));
        REQUIRE(tokens.back().string_value == "Unterminated string");
    }

    SECTION("unexpected character stops tokenizing") {
        Lexer lexer("a # b");
        auto tokens = lexer.tokenize();
        REQUIRE(tokens.size() == 2);
        REQUIRE(tokens.back().is(TokenType::Error));
    }

    SECTION("locations track lines") {
        Lexer lexer("a,\n  b");
        auto tokens = lexer.tokenize();
        REQUIRE(tokens[2].location.line == 2);
        REQUIRE(tokens[2].location.column == 3);
    }
}

TEST_CASE("Lexer peek", "[derive][lexer]") {
    Lexer lexer("x y");
    REQUIRE(lexer.peek_token().lexeme == "x");
    REQUIRE(lexer.next_token().lexeme == "x");
    REQUIRE(lexer.next_token().lexeme == "y");
    REQUIRE(lexer.next_token().is(TokenType::Eof));
}
