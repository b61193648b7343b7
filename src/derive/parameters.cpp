/// @file parameters.cpp
/// @brief Parser for `name: expr, ...` annotation payloads

#include <loom/derive/parameters.hpp>

#include <cctype>

namespace loom_derive {

// =============================================================================
// ParameterParser
// =============================================================================

ParameterParser::ParameterParser(std::string_view payload, std::string field)
    : m_source(payload)
    , m_field(std::move(field))
{
    Lexer lexer(m_source);
    m_tokens = lexer.tokenize();
    m_end = m_tokens.size() - 1;
    m_eof.type = TokenType::Eof;
    m_eof.location = m_tokens.back().location;
}

loom_core::Result<ParameterList> ParameterParser::parse_parameters() {
    auto entries = parse_entries();
    if (!entries) {
        return entries.error();
    }

    ParameterList params;
    for (auto& entry : entries.value()) {
        if (!entry.key.is_bare_ident()) {
            return loom_core::Error(loom_core::DeriveError::parse(
                m_field, "parameter name must be an identifier, found `" + entry.key.text + "`"));
        }
        params.add(entry.key.segments.front(), std::move(entry.value));
    }
    return params;
}

loom_core::Result<std::vector<Entry>> ParameterParser::parse_entries() {
    if (m_tokens.back().is(TokenType::Error)) {
        m_pos = m_tokens.size() - 1;
        m_end = m_tokens.size();
        return error_here(m_tokens.back().string_value);
    }

    strip_outer_parens();

    std::vector<Entry> entries;
    while (!check(TokenType::Eof)) {
        auto key = primary();
        if (!key) {
            return key.error();
        }

        auto colon = expect(TokenType::Colon, "after parameter name");
        if (!colon) {
            return colon.error();
        }

        auto value = expression();
        if (!value) {
            return value.error();
        }

        entries.push_back(Entry{std::move(key.value()), std::move(value.value())});

        if (!match(TokenType::Comma)) {
            break;
        }
    }

    if (!check(TokenType::Eof)) {
        return error_here(std::string("expected ',' or end of parameters, found ") +
                          token_type_name(current().type));
    }
    return entries;
}

loom_core::Result<Expr> ParameterParser::parse_expression() {
    if (m_tokens.back().is(TokenType::Error)) {
        m_pos = m_tokens.size() - 1;
        m_end = m_tokens.size();
        return error_here(m_tokens.back().string_value);
    }

    if (check(TokenType::Eof)) {
        return error_here("empty expression");
    }

    auto expr = expression();
    if (!expr) {
        return expr.error();
    }

    if (!check(TokenType::Eof)) {
        return error_here(std::string("unexpected ") + token_type_name(current().type) +
                          " after expression");
    }
    return expr;
}

// =============================================================================
// Token Helpers
// =============================================================================

const Token& ParameterParser::consume() {
    const Token& tok = current();
    if (m_pos < m_end) {
        ++m_pos;
    }
    return tok;
}

bool ParameterParser::match(TokenType type) {
    if (!check(type)) return false;
    consume();
    return true;
}

loom_core::Error ParameterParser::error_here(const std::string& what) const {
    return loom_core::DeriveError::parse(m_field, what + " at " + current().location.to_string());
}

loom_core::Result<void> ParameterParser::expect(TokenType type, const char* context) {
    if (match(type)) {
        return loom_core::Ok();
    }
    return error_here(std::string("expected ") + token_type_name(type) + " " + context +
                      ", found " + token_type_name(current().type));
}

void ParameterParser::strip_outer_parens() {
    if (m_end < 2 || !m_tokens[0].is(TokenType::LeftParen)) {
        return;
    }

    int depth = 0;
    for (std::size_t i = 0; i < m_end; ++i) {
        switch (m_tokens[i].type) {
            case TokenType::LeftParen:
            case TokenType::LeftBracket:
            case TokenType::LeftBrace:
                ++depth;
                break;
            case TokenType::RightParen:
            case TokenType::RightBracket:
            case TokenType::RightBrace:
                --depth;
                break;
            default:
                break;
        }
        if (depth == 0) {
            if (i == m_end - 1) {
                m_eof.location = m_tokens[i].location;
                m_pos = 1;
                m_end = i;
            }
            return;
        }
    }
}

// =============================================================================
// Expressions
// =============================================================================

loom_core::Result<Expr> ParameterParser::expression() {
    auto first = unary();
    if (!first) {
        return first;
    }
    if (!check(TokenType::Pipe)) {
        return first;
    }

    std::vector<Expr> operands;
    operands.push_back(std::move(first.value()));
    while (match(TokenType::Pipe)) {
        auto next = unary();
        if (!next) {
            return next;
        }
        operands.push_back(std::move(next.value()));
    }
    return Expr::bit_or(std::move(operands));
}

loom_core::Result<Expr> ParameterParser::unary() {
    if (match(TokenType::Minus)) {
        auto operand = unary();
        if (!operand) {
            return operand;
        }
        Expr& e = operand.value();
        if (e.is(ExprKind::Integer)) {
            return Expr::integer(-e.int_value);
        }
        if (e.is(ExprKind::Float)) {
            return Expr::floating(-e.float_value, "-" + e.text);
        }
        return Expr::unary("-", std::move(e));
    }

    if (match(TokenType::Ampersand)) {
        std::string op = "&";
        if (check(TokenType::Identifier) && current().lexeme == "mut" &&
            m_pos + 1 < m_end && m_tokens[m_pos + 1].is(TokenType::Identifier)) {
            consume();
            op = "&mut ";
        }
        auto operand = unary();
        if (!operand) {
            return operand;
        }
        return Expr::unary(op, std::move(operand.value()));
    }

    if (match(TokenType::Bang)) {
        auto operand = unary();
        if (!operand) {
            return operand;
        }
        return Expr::unary("!", std::move(operand.value()));
    }

    return primary();
}

loom_core::Result<Expr> ParameterParser::primary() {
    const Token& tok = current();

    switch (tok.type) {
        case TokenType::Integer: {
            auto value = tok.int_value;
            consume();
            return Expr::integer(value);
        }
        case TokenType::Float: {
            auto value = tok.float_value;
            std::string text(tok.lexeme);
            // Drop a type suffix such as `f32`, keeping any exponent
            for (std::size_t i = 0; i < text.size(); ++i) {
                char c = text[i];
                bool exponent = (c == 'e' || c == 'E') && i + 1 < text.size() &&
                                (std::isdigit(static_cast<unsigned char>(text[i + 1])) ||
                                 text[i + 1] == '+' || text[i + 1] == '-');
                if (std::isalpha(static_cast<unsigned char>(c)) && !exponent) {
                    text.resize(i);
                    break;
                }
            }
            consume();
            return Expr::floating(value, std::move(text));
        }
        case TokenType::String: {
            std::string value = tok.string_value;
            consume();
            return Expr::string(std::move(value));
        }
        case TokenType::True:
            consume();
            return Expr::boolean(true);
        case TokenType::False:
            consume();
            return Expr::boolean(false);

        case TokenType::Identifier:
            return path_expression();

        case TokenType::LeftParen: {
            consume();
            std::vector<Expr> items;
            bool trailing_comma = false;
            while (!check(TokenType::RightParen)) {
                auto item = expression();
                if (!item) {
                    return item;
                }
                items.push_back(std::move(item.value()));
                trailing_comma = match(TokenType::Comma);
                if (!trailing_comma) {
                    break;
                }
            }
            auto close = expect(TokenType::RightParen, "to close tuple");
            if (!close) {
                return close.error();
            }
            // `(x)` is grouping, `(x,)` is a one-element tuple
            if (items.size() == 1 && !trailing_comma) {
                return std::move(items.front());
            }
            return Expr::tuple(std::move(items));
        }

        case TokenType::LeftBracket: {
            consume();
            auto items = list(TokenType::RightBracket);
            if (!items) {
                return items.error();
            }
            return Expr::array(std::move(items.value()));
        }

        default:
            return error_here(std::string("unexpected ") + token_type_name(tok.type));
    }
}

loom_core::Result<Expr> ParameterParser::path_expression() {
    std::vector<std::string> segments;
    segments.emplace_back(consume().lexeme);

    while (match(TokenType::ColonColon)) {
        if (check(TokenType::Less)) {
            return error_here("generic arguments are not supported in annotations");
        }
        if (!check(TokenType::Identifier)) {
            return error_here(std::string("expected identifier after '::', found ") +
                              token_type_name(current().type));
        }
        segments.emplace_back(consume().lexeme);
    }

    // Macro invocation: vec![...] or name!(...)
    if (segments.size() == 1 && check(TokenType::Bang)) {
        consume();
        TokenType close;
        if (match(TokenType::LeftBracket)) {
            close = TokenType::RightBracket;
        } else if (match(TokenType::LeftParen)) {
            close = TokenType::RightParen;
        } else {
            return error_here("expected '[' or '(' after macro name");
        }
        auto items = list(close);
        if (!items) {
            return items.error();
        }
        return Expr::macro(segments.front(), std::move(items.value()));
    }

    bool is_field = false;
    std::vector<std::string> fields;
    if (check(TokenType::Dot)) {
        is_field = true;
        fields.push_back(join_path(segments));
        while (match(TokenType::Dot)) {
            if (check(TokenType::Identifier)) {
                fields.emplace_back(consume().lexeme);
            } else if (check(TokenType::Integer)) {
                fields.emplace_back(consume().lexeme);
            } else {
                return error_here(std::string("expected field name after '.', found ") +
                                  token_type_name(current().type));
            }
        }
    }

    if (match(TokenType::LeftParen)) {
        auto args = list(TokenType::RightParen);
        if (!args) {
            return args.error();
        }
        if (is_field) {
            std::string callee = fields.front();
            for (std::size_t i = 1; i < fields.size(); ++i) {
                callee += "." + fields[i];
            }
            return Expr::call({callee}, std::move(args.value()));
        }
        return Expr::call(std::move(segments), std::move(args.value()));
    }

    if (is_field) {
        return Expr::field(std::move(fields));
    }
    return Expr::path(std::move(segments));
}

loom_core::Result<std::vector<Expr>> ParameterParser::list(TokenType close) {
    std::vector<Expr> items;
    while (!check(close)) {
        auto item = expression();
        if (!item) {
            return item.error();
        }
        items.push_back(std::move(item.value()));
        if (!match(TokenType::Comma)) {
            break;
        }
    }
    auto closed = expect(close, "to close list");
    if (!closed) {
        return closed.error();
    }
    return items;
}

// =============================================================================
// Convenience
// =============================================================================

loom_core::Result<ParameterList> parse_parameters(std::string_view payload, const std::string& field) {
    ParameterParser parser(payload, field);
    return parser.parse_parameters();
}

loom_core::Result<Expr> parse_expression(std::string_view text, const std::string& field) {
    ParameterParser parser(text, field);
    return parser.parse_expression();
}

} // namespace loom_derive
