#pragma once

/// @file parser.hpp
/// @brief Pratt parser for expressions

#include "ast.hpp"
#include "lexer.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace manifold_expr {

/// @brief Parser for a single expression
class Parser {
public:
    explicit Parser(std::string_view source);

    /// @brief Parse the whole input as one expression
    /// @return nullptr on failure, see error()
    [[nodiscard]] ExprPtr parse();

    [[nodiscard]] bool has_error() const { return error_.has_value(); }
    [[nodiscard]] const std::optional<SyntaxError>& error() const { return error_; }

private:
    // Token helpers
    [[nodiscard]] bool check(TokenType type) const;
    Token advance();
    bool match(TokenType type);
    bool consume(TokenType type, const std::string& message);

    void fail(const Token& token, const std::string& message);

    // ==========================================================================
    // Expression Parsing (Pratt parser)
    // ==========================================================================

    ExprPtr parse_precedence(int precedence);
    ExprPtr parse_prefix();
    ExprPtr parse_infix(ExprPtr left, int precedence);

    ExprPtr parse_literal();
    ExprPtr parse_identifier();
    ExprPtr parse_grouping();
    ExprPtr parse_list();
    ExprPtr parse_map();
    ExprPtr parse_unary();
    ExprPtr parse_call(ExprPtr callee);
    ExprPtr parse_member(ExprPtr object);
    ExprPtr parse_index(ExprPtr object);
    ExprPtr parse_ternary(ExprPtr condition);

    bool parse_arguments(std::vector<ExprPtr>& out);

    // ==========================================================================
    // Precedence
    // ==========================================================================

    enum class Precedence {
        None = 0,
        Ternary,        // ?:
        Or,             // ||
        And,            // &&
        Relation,       // == != < <= > >= in
        Term,           // + -
        Factor,         // * / %
        Unary,          // ! -
        Call,           // () [] .
        Primary
    };

    [[nodiscard]] static int get_precedence(TokenType type);

    Lexer lexer_;
    Token current_;
    Token previous_;
    std::optional<SyntaxError> error_;
};

} // namespace manifold_expr
