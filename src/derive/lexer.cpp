/// @file lexer.cpp
/// @brief Tokenizer for annotation payloads

#include <loom/derive/lexer.hpp>

#include <cctype>
#include <charconv>

namespace loom_derive {

const char* token_type_name(TokenType type) {
    switch (type) {
        case TokenType::Identifier: return "identifier";
        case TokenType::Integer: return "integer";
        case TokenType::Float: return "float";
        case TokenType::String: return "string";
        case TokenType::True: return "'true'";
        case TokenType::False: return "'false'";
        case TokenType::LeftParen: return "'('";
        case TokenType::RightParen: return "')'";
        case TokenType::LeftBracket: return "'['";
        case TokenType::RightBracket: return "']'";
        case TokenType::LeftBrace: return "'{'";
        case TokenType::RightBrace: return "'}'";
        case TokenType::Comma: return "','";
        case TokenType::Colon: return "':'";
        case TokenType::ColonColon: return "'::'";
        case TokenType::Pipe: return "'|'";
        case TokenType::Ampersand: return "'&'";
        case TokenType::Dot: return "'.'";
        case TokenType::Bang: return "'!'";
        case TokenType::Minus: return "'-'";
        case TokenType::Less: return "'<'";
        case TokenType::Greater: return "'>'";
        case TokenType::Eof: return "end of input";
        case TokenType::Error: return "error";
        default: return "unknown";
    }
}

std::string SourceLocation::to_string() const {
    return std::to_string(line) + ":" + std::to_string(column);
}

// =============================================================================
// Lexer Implementation
// =============================================================================

Lexer::Lexer(std::string_view source)
    : m_source(source) {}

Token Lexer::next_token() {
    if (m_peeked) {
        Token tok = std::move(*m_peeked);
        m_peeked.reset();
        return tok;
    }

    skip_whitespace();

    m_start = m_current;
    m_start_line = m_line;
    m_start_column = m_column;

    if (is_at_end()) {
        return make_token(TokenType::Eof);
    }

    char c = advance();

    if (std::isalpha(static_cast<unsigned char>(c)) || c == '_') {
        return scan_identifier();
    }

    if (std::isdigit(static_cast<unsigned char>(c))) {
        return scan_number();
    }

    switch (c) {
        case '(': return make_token(TokenType::LeftParen);
        case ')': return make_token(TokenType::RightParen);
        case '[': return make_token(TokenType::LeftBracket);
        case ']': return make_token(TokenType::RightBracket);
        case '{': return make_token(TokenType::LeftBrace);
        case '}': return make_token(TokenType::RightBrace);
        case ',': return make_token(TokenType::Comma);
        case '|': return make_token(TokenType::Pipe);
        case '&': return make_token(TokenType::Ampersand);
        case '.': return make_token(TokenType::Dot);
        case '!': return make_token(TokenType::Bang);
        case '-': return make_token(TokenType::Minus);
        case '<': return make_token(TokenType::Less);
        case '>': return make_token(TokenType::Greater);

        case ':':
            if (match(':')) return make_token(TokenType::ColonColon);
            return make_token(TokenType::Colon);

        case '"': return scan_string();

        default:
            return error_token(std::string("Unexpected character '") + c + "'");
    }
}

const Token& Lexer::peek_token() {
    if (!m_peeked) {
        m_peeked = next_token();
    }
    return *m_peeked;
}

std::vector<Token> Lexer::tokenize() {
    std::vector<Token> tokens;
    while (true) {
        Token tok = next_token();
        bool done = tok.is(TokenType::Eof) || tok.is(TokenType::Error);
        tokens.push_back(std::move(tok));
        if (done) break;
    }
    return tokens;
}

SourceLocation Lexer::location() const {
    return {m_start_line, m_start_column, static_cast<std::uint32_t>(m_start)};
}

char Lexer::peek() const {
    if (is_at_end()) return '\0';
    return m_source[m_current];
}

char Lexer::peek_next() const {
    if (m_current + 1 >= m_source.size()) return '\0';
    return m_source[m_current + 1];
}

char Lexer::advance() {
    char c = m_source[m_current++];
    if (c == '\n') {
        ++m_line;
        m_column = 1;
    } else {
        ++m_column;
    }
    return c;
}

bool Lexer::match(char expected) {
    if (is_at_end()) return false;
    if (m_source[m_current] != expected) return false;
    advance();
    return true;
}

void Lexer::skip_whitespace() {
    while (!is_at_end()) {
        char c = peek();
        if (c == ' ' || c == '\t' || c == '\r' || c == '\n') {
            advance();
        } else {
            return;
        }
    }
}

Token Lexer::make_token(TokenType type) {
    Token tok;
    tok.type = type;
    tok.lexeme = m_source.substr(m_start, m_current - m_start);
    tok.location = location();
    return tok;
}

Token Lexer::error_token(const std::string& message) {
    Token tok;
    tok.type = TokenType::Error;
    tok.lexeme = m_source.substr(m_start, m_current - m_start);
    tok.location = location();
    tok.string_value = message;
    return tok;
}

Token Lexer::scan_identifier() {
    while (std::isalnum(static_cast<unsigned char>(peek())) || peek() == '_') {
        advance();
    }

    std::string_view text = m_source.substr(m_start, m_current - m_start);
    if (text == "true") return make_token(TokenType::True);
    if (text == "false") return make_token(TokenType::False);
    return make_token(TokenType::Identifier);
}

Token Lexer::scan_number() {
    bool is_float = false;

    while (std::isdigit(static_cast<unsigned char>(peek())) || peek() == '_') {
        advance();
    }

    // A dot followed by a digit is a fraction; `1.max` stays a field access
    if (peek() == '.' && std::isdigit(static_cast<unsigned char>(peek_next()))) {
        is_float = true;
        advance();
        while (std::isdigit(static_cast<unsigned char>(peek()))) {
            advance();
        }
    }

    if (peek() == 'e' || peek() == 'E') {
        is_float = true;
        advance();
        if (peek() == '+' || peek() == '-') {
            advance();
        }
        while (std::isdigit(static_cast<unsigned char>(peek()))) {
            advance();
        }
    }

    std::size_t digits_end = m_current;

    // Type suffixes such as 5u32 or 1.0f32 are accepted and ignored
    if (std::isalpha(static_cast<unsigned char>(peek()))) {
        while (std::isalnum(static_cast<unsigned char>(peek()))) {
            advance();
        }
    }

    Token tok = make_token(is_float ? TokenType::Float : TokenType::Integer);

    std::string digits;
    for (std::size_t i = m_start; i < digits_end; ++i) {
        if (m_source[i] != '_') digits += m_source[i];
    }

    const char* first = digits.data();
    const char* last = digits.data() + digits.size();
    if (is_float) {
        auto result = std::from_chars(first, last, tok.float_value);
        if (result.ec != std::errc{} || result.ptr != last) {
            return error_token("Invalid number");
        }
    } else {
        auto result = std::from_chars(first, last, tok.int_value);
        if (result.ec != std::errc{} || result.ptr != last) {
            return error_token("Invalid number");
        }
        tok.float_value = static_cast<double>(tok.int_value);
    }

    return tok;
}

Token Lexer::scan_string() {
    std::string value;

    while (!is_at_end() && peek() != '"') {
        char c = advance();
        if (c == '\\') {
            if (is_at_end()) break;
            char esc = advance();
            switch (esc) {
                case 'n': value += '\n'; break;
                case 't': value += '\t'; break;
                case 'r': value += '\r'; break;
                case '0': value += '\0'; break;
                case '\\': value += '\\'; break;
                case '"': value += '"'; break;
                case '\'': value += '\''; break;
                default:
                    return error_token(std::string("Unknown escape sequence '\\") + esc + "'");
            }
        } else {
            value += c;
        }
    }

    if (is_at_end()) {
        return error_token("Unterminated string");
    }

    advance();  // closing quote

    Token tok = make_token(TokenType::String);
    tok.string_value = std::move(value);
    return tok;
}

} // namespace loom_derive
