#pragma once

/// @file lexer.hpp
/// @brief Tokenizer for annotation payloads

#include "fwd.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace loom_derive {

// =============================================================================
// Tokens
// =============================================================================

enum class TokenType : std::uint8_t {
    Identifier,
    Integer,
    Float,
    String,
    True,
    False,

    LeftParen,
    RightParen,
    LeftBracket,
    RightBracket,
    LeftBrace,
    RightBrace,
    Comma,
    Colon,
    ColonColon,
    Pipe,
    Ampersand,
    Dot,
    Bang,
    Minus,
    Less,
    Greater,

    Eof,
    Error,
};

[[nodiscard]] const char* token_type_name(TokenType type);

/// @brief Position inside an annotation payload
struct SourceLocation {
    std::uint32_t line = 1;     ///< Line number (1-based)
    std::uint32_t column = 1;   ///< Column number (1-based)
    std::uint32_t offset = 0;   ///< Byte offset from start

    [[nodiscard]] std::string to_string() const;
};

/// @brief Lexical token
struct Token {
    TokenType type = TokenType::Error;
    std::string_view lexeme;
    SourceLocation location;

    std::int64_t int_value = 0;
    double float_value = 0.0;
    std::string string_value;  ///< Unescaped string, or the error message

    [[nodiscard]] bool is(TokenType t) const { return type == t; }
};

// =============================================================================
// Lexer
// =============================================================================

/// @brief Lexical analyzer for annotation payloads
class Lexer {
public:
    explicit Lexer(std::string_view source);

    /// @brief Get the next token
    [[nodiscard]] Token next_token();

    /// @brief Peek at the next token without consuming it
    [[nodiscard]] const Token& peek_token();

    /// @brief Check if at end of input
    [[nodiscard]] bool is_at_end() const { return m_current >= m_source.size(); }

    /// @brief Get all tokens, ending with Eof or the first Error
    [[nodiscard]] std::vector<Token> tokenize();

    [[nodiscard]] std::string_view source() const { return m_source; }

private:
    [[nodiscard]] SourceLocation location() const;

    [[nodiscard]] char peek() const;
    [[nodiscard]] char peek_next() const;
    char advance();
    bool match(char expected);

    void skip_whitespace();

    Token make_token(TokenType type);
    Token error_token(const std::string& message);

    Token scan_identifier();
    Token scan_number();
    Token scan_string();

    std::string_view m_source;
    std::size_t m_start = 0;
    std::size_t m_current = 0;
    std::uint32_t m_line = 1;
    std::uint32_t m_column = 1;
    std::uint32_t m_start_line = 1;
    std::uint32_t m_start_column = 1;

    std::optional<Token> m_peeked;
};

} // namespace loom_derive
