/// @file lexer.cpp
/// @brief Tokenizer for expressions

#include <manifold/expr/lexer.hpp>

#include <cctype>
#include <charconv>
#include <cstdlib>

namespace manifold_expr {

const char* token_type_name(TokenType type) {
    switch (type) {
        case TokenType::Integer: return "integer";
        case TokenType::Float: return "float";
        case TokenType::String: return "string";
        case TokenType::True: return "true";
        case TokenType::False: return "false";
        case TokenType::Null: return "null";
        case TokenType::Identifier: return "identifier";
        case TokenType::In: return "in";
        case TokenType::Plus: return "+";
        case TokenType::Minus: return "-";
        case TokenType::Star: return "*";
        case TokenType::Slash: return "/";
        case TokenType::Percent: return "%";
        case TokenType::Equal: return "==";
        case TokenType::NotEqual: return "!=";
        case TokenType::Less: return "<";
        case TokenType::LessEqual: return "<=";
        case TokenType::Greater: return ">";
        case TokenType::GreaterEqual: return ">=";
        case TokenType::And: return "&&";
        case TokenType::Or: return "||";
        case TokenType::Not: return "!";
        case TokenType::LeftParen: return "(";
        case TokenType::RightParen: return ")";
        case TokenType::LeftBrace: return "{";
        case TokenType::RightBrace: return "}";
        case TokenType::LeftBracket: return "[";
        case TokenType::RightBracket: return "]";
        case TokenType::Comma: return ",";
        case TokenType::Dot: return ".";
        case TokenType::Colon: return ":";
        case TokenType::Question: return "?";
        case TokenType::Eof: return "end of expression";
        case TokenType::Error: return "error";
    }
    return "unknown";
}

// =============================================================================
// Keyword Map
// =============================================================================

const std::unordered_map<std::string_view, TokenType> Lexer::keywords_ = {
    {"true", TokenType::True},
    {"false", TokenType::False},
    {"null", TokenType::Null},
    {"in", TokenType::In},
};

// =============================================================================
// Lexer Implementation
// =============================================================================

Lexer::Lexer(std::string_view source)
    : source_(source) {}

Token Lexer::next_token() {
    skip_whitespace();

    start_ = current_;

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
        case '{': return make_token(TokenType::LeftBrace);
        case '}': return make_token(TokenType::RightBrace);
        case '[': return make_token(TokenType::LeftBracket);
        case ']': return make_token(TokenType::RightBracket);
        case ',': return make_token(TokenType::Comma);
        case '.': return make_token(TokenType::Dot);
        case ':': return make_token(TokenType::Colon);
        case '?': return make_token(TokenType::Question);
        case '+': return make_token(TokenType::Plus);
        case '-': return make_token(TokenType::Minus);
        case '*': return make_token(TokenType::Star);
        case '/': return make_token(TokenType::Slash);
        case '%': return make_token(TokenType::Percent);

        case '&':
            if (match('&')) return make_token(TokenType::And);
            return error_token("Expected '&&'");

        case '|':
            if (match('|')) return make_token(TokenType::Or);
            return error_token("Expected '||'");

        case '=':
            if (match('=')) return make_token(TokenType::Equal);
            return error_token("Assignment is not supported, use '=='");

        case '!':
            if (match('=')) return make_token(TokenType::NotEqual);
            return make_token(TokenType::Not);

        case '<':
            if (match('=')) return make_token(TokenType::LessEqual);
            return make_token(TokenType::Less);

        case '>':
            if (match('=')) return make_token(TokenType::GreaterEqual);
            return make_token(TokenType::Greater);

        case '"': return scan_string('"');
        case '\'': return scan_string('\'');

        default:
            return error_token(std::string("Unexpected character '") + c + "'");
    }
}

std::vector<Token> Lexer::tokenize() {
    std::vector<Token> tokens;
    while (true) {
        Token tok = next_token();
        tokens.push_back(tok);
        if (tok.type == TokenType::Eof || tok.type == TokenType::Error) break;
    }
    return tokens;
}

char Lexer::peek() const {
    if (is_at_end()) return '\0';
    return source_[current_];
}

char Lexer::peek_next() const {
    if (current_ + 1 >= source_.size()) return '\0';
    return source_[current_ + 1];
}

char Lexer::advance() {
    return source_[current_++];
}

bool Lexer::match(char expected) {
    if (is_at_end()) return false;
    if (source_[current_] != expected) return false;
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
    tok.lexeme = source_.substr(start_, current_ - start_);
    tok.offset = start_;
    return tok;
}

Token Lexer::error_token(const std::string& message) {
    Token tok;
    tok.type = TokenType::Error;
    tok.lexeme = source_.substr(start_, current_ - start_);
    tok.offset = start_;
    tok.string_value = message;
    return tok;
}

Token Lexer::scan_identifier() {
    while (std::isalnum(static_cast<unsigned char>(peek())) || peek() == '_') {
        advance();
    }

    std::string_view text = source_.substr(start_, current_ - start_);
    auto it = keywords_.find(text);

    TokenType type = (it != keywords_.end()) ? it->second : TokenType::Identifier;
    Token tok = make_token(type);
    tok.string_value = std::string(text);
    return tok;
}

Token Lexer::scan_number() {
    bool is_float = false;

    while (std::isdigit(static_cast<unsigned char>(peek()))) {
        advance();
    }

    // Fractional part
    if (peek() == '.' && std::isdigit(static_cast<unsigned char>(peek_next()))) {
        is_float = true;
        advance();
        while (std::isdigit(static_cast<unsigned char>(peek()))) {
            advance();
        }
    }

    // Exponent
    if (peek() == 'e' || peek() == 'E') {
        std::size_t save = current_;
        advance();
        if (peek() == '+' || peek() == '-') {
            advance();
        }
        if (std::isdigit(static_cast<unsigned char>(peek()))) {
            is_float = true;
            while (std::isdigit(static_cast<unsigned char>(peek()))) {
                advance();
            }
        } else {
            current_ = save;
        }
    }

    Token tok = make_token(is_float ? TokenType::Float : TokenType::Integer);
    std::string text(tok.lexeme);

    if (is_float) {
        tok.float_value = std::strtod(text.c_str(), nullptr);
    } else {
        auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), tok.int_value);
        if (ec != std::errc()) {
            return error_token("Integer literal out of range");
        }
    }

    return tok;
}

Token Lexer::scan_string(char quote) {
    std::string value;
    bool escape = false;

    while (!is_at_end()) {
        char c = peek();

        if (escape) {
            escape = false;
            switch (c) {
                case 'n': value += '\n'; break;
                case 't': value += '\t'; break;
                case 'r': value += '\r'; break;
                case '\\': value += '\\'; break;
                case '"': value += '"'; break;
                case '\'': value += '\''; break;
                default:
                    advance();
                    return error_token("Invalid escape sequence");
            }
            advance();
        } else if (c == '\\') {
            escape = true;
            advance();
        } else if (c == quote) {
            advance();
            Token tok = make_token(TokenType::String);
            tok.string_value = std::move(value);
            return tok;
        } else {
            value += c;
            advance();
        }
    }

    return error_token("Unterminated string");
}

} // namespace manifold_expr
