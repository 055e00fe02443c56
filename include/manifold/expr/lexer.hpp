#pragma once

/// @file lexer.hpp
/// @brief Lexical analyzer for expressions

#include "types.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace manifold_expr {

/// @brief Lexical analyzer for expressions
class Lexer {
public:
    /// @brief Construct a lexer for the given source
    explicit Lexer(std::string_view source);

    // ==========================================================================
    // Tokenization
    // ==========================================================================

    /// @brief Get the next token
    [[nodiscard]] Token next_token();

    /// @brief Check if at end of input
    [[nodiscard]] bool is_at_end() const { return current_ >= source_.size(); }

    /// @brief Get all tokens, ending with Eof
    [[nodiscard]] std::vector<Token> tokenize();

    /// @brief Get source
    [[nodiscard]] std::string_view source() const { return source_; }

private:
    // Character helpers
    [[nodiscard]] char peek() const;
    [[nodiscard]] char peek_next() const;
    char advance();
    bool match(char expected);

    void skip_whitespace();

    // Token helpers
    Token make_token(TokenType type);
    Token error_token(const std::string& message);

    // Scanning
    Token scan_identifier();
    Token scan_number();
    Token scan_string(char quote);

    std::string_view source_;
    std::size_t start_ = 0;
    std::size_t current_ = 0;

    static const std::unordered_map<std::string_view, TokenType> keywords_;
};

} // namespace manifold_expr
