#pragma once

/// @file parameters.hpp
/// @brief Parser for `name: expr, ...` annotation payloads

#include "lexer.hpp"
#include "types.hpp"

#include <loom/core/error.hpp>

#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace loom_derive {

/// Raw `key: value` entry; keys are expressions so event tables can use tuple keys
struct Entry {
    Expr key;
    Expr value;
};

/// @brief Recursive-descent parser for annotation payloads
///
/// Accepts an optional outer pair of parentheses. Expressions are parsed
/// structurally but not interpreted.
class ParameterParser {
public:
    /// @param payload Annotation payload text
    /// @param field Field name used in diagnostics
    ParameterParser(std::string_view payload, std::string field);

    /// Parse `name: expr, ...` where every name is a bare identifier
    [[nodiscard]] loom_core::Result<ParameterList> parse_parameters();

    /// Parse `key: expr, ...` where keys may be any expression
    [[nodiscard]] loom_core::Result<std::vector<Entry>> parse_entries();

    /// Parse the whole payload as one expression
    [[nodiscard]] loom_core::Result<Expr> parse_expression();

private:
    [[nodiscard]] const Token& current() const { return m_pos < m_end ? m_tokens[m_pos] : m_eof; }
    [[nodiscard]] bool check(TokenType type) const { return current().is(type); }
    const Token& consume();
    bool match(TokenType type);

    [[nodiscard]] loom_core::Error error_here(const std::string& what) const;
    [[nodiscard]] loom_core::Result<void> expect(TokenType type, const char* context);

    [[nodiscard]] loom_core::Result<Expr> expression();
    [[nodiscard]] loom_core::Result<Expr> unary();
    [[nodiscard]] loom_core::Result<Expr> primary();
    [[nodiscard]] loom_core::Result<Expr> path_expression();
    [[nodiscard]] loom_core::Result<std::vector<Expr>> list(TokenType close);

    /// Strip one outer `( ... )` wrapping the whole payload
    void strip_outer_parens();

    std::string m_source;
    std::string m_field;
    std::vector<Token> m_tokens;
    Token m_eof;
    std::size_t m_pos = 0;
    std::size_t m_end = 0;  ///< Index of the token that ends the payload
};

/// Convenience wrapper for ParameterParser::parse_parameters
[[nodiscard]] loom_core::Result<ParameterList> parse_parameters(std::string_view payload,
                                                                const std::string& field);

/// Convenience wrapper for ParameterParser::parse_expression
[[nodiscard]] loom_core::Result<Expr> parse_expression(std::string_view text, const std::string& field);

} // namespace loom_derive
