#pragma once

/// @file types.hpp
/// @brief Tokens and diagnostics for the manifold expression language

#include <cstdint>
#include <string>
#include <string_view>

namespace manifold_expr {

// =============================================================================
// Token Types
// =============================================================================

/// @brief Token types for the lexer
enum class TokenType : std::uint8_t {
    // Literals
    Integer,            ///< 123
    Float,              ///< 1.5, 1e10
    String,             ///< "hello", 'world'
    True,               ///< true
    False,              ///< false
    Null,               ///< null

    Identifier,         ///< foo, bar_123
    In,                 ///< in

    // Operators
    Plus,               ///< +
    Minus,              ///< -
    Star,               ///< *
    Slash,              ///< /
    Percent,            ///< %

    // Comparison
    Equal,              ///< ==
    NotEqual,           ///< !=
    Less,               ///< <
    LessEqual,          ///< <=
    Greater,            ///< >
    GreaterEqual,       ///< >=

    // Logical
    And,                ///< &&
    Or,                 ///< ||
    Not,                ///< !

    // Punctuation
    LeftParen,          ///< (
    RightParen,         ///< )
    LeftBrace,          ///< {
    RightBrace,         ///< }
    LeftBracket,        ///< [
    RightBracket,       ///< ]
    Comma,              ///< ,
    Dot,                ///< .
    Colon,              ///< :
    Question,           ///< ?

    // Special
    Eof,                ///< End of input
    Error,              ///< Lexer error
};

/// @brief Get string name for token type
[[nodiscard]] const char* token_type_name(TokenType type);

// =============================================================================
// Token
// =============================================================================

/// @brief Lexical token
struct Token {
    TokenType type = TokenType::Error;
    std::string_view lexeme;        ///< Text of the token
    std::size_t offset = 0;         ///< Byte offset in the expression

    // Literal values
    std::int64_t int_value = 0;
    double float_value = 0.0;
    std::string string_value;       ///< String literal, identifier, or error message

    [[nodiscard]] bool is(TokenType t) const { return type == t; }
};

// =============================================================================
// Diagnostics
// =============================================================================

/// @brief Syntax error found while lexing or parsing
struct SyntaxError {
    std::string message;
    std::size_t offset = 0;

    [[nodiscard]] std::string to_string() const {
        return message + " at offset " + std::to_string(offset);
    }
};

} // namespace manifold_expr
