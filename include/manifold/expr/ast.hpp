#pragma once

/// @file ast.hpp
/// @brief Abstract Syntax Tree nodes for expressions

#include "types.hpp"

#include <nlohmann/json.hpp>

#include <memory>
#include <string>
#include <vector>

namespace manifold_expr {

// =============================================================================
// Expressions
// =============================================================================

/// @brief Base class for expressions
class Expression {
public:
    virtual ~Expression() = default;

    std::size_t offset = 0;  ///< Byte offset of the first token
};

using ExprPtr = std::unique_ptr<Expression>;

/// @brief Literal value expression
class LiteralExpr : public Expression {
public:
    nlohmann::json value;

    explicit LiteralExpr(nlohmann::json v) : value(std::move(v)) {}
};

/// @brief Identifier expression
class IdentifierExpr : public Expression {
public:
    std::string name;

    explicit IdentifierExpr(std::string n) : name(std::move(n)) {}
};

/// @brief Binary operator expression
class BinaryExpr : public Expression {
public:
    TokenType op;
    ExprPtr left;
    ExprPtr right;

    BinaryExpr(TokenType op, ExprPtr left, ExprPtr right)
        : op(op), left(std::move(left)), right(std::move(right)) {}
};

/// @brief Unary operator expression
class UnaryExpr : public Expression {
public:
    TokenType op;
    ExprPtr operand;

    UnaryExpr(TokenType op, ExprPtr operand)
        : op(op), operand(std::move(operand)) {}
};

/// @brief Function, method or macro call
///
/// `size(x)` has no target; `x.size()` has target `x`.
class CallExpr : public Expression {
public:
    ExprPtr target;
    std::string function;
    std::vector<ExprPtr> arguments;

    CallExpr(ExprPtr target, std::string function, std::vector<ExprPtr> args)
        : target(std::move(target)), function(std::move(function)), arguments(std::move(args)) {}
};

/// @brief Member access expression (a.b)
class MemberExpr : public Expression {
public:
    ExprPtr object;
    std::string member;

    MemberExpr(ExprPtr obj, std::string member)
        : object(std::move(obj)), member(std::move(member)) {}
};

/// @brief Index access expression (a[b])
class IndexExpr : public Expression {
public:
    ExprPtr object;
    ExprPtr index;

    IndexExpr(ExprPtr obj, ExprPtr idx)
        : object(std::move(obj)), index(std::move(idx)) {}
};

/// @brief Ternary conditional expression (a ? b : c)
class TernaryExpr : public Expression {
public:
    ExprPtr condition;
    ExprPtr then_expr;
    ExprPtr else_expr;

    TernaryExpr(ExprPtr cond, ExprPtr then_e, ExprPtr else_e)
        : condition(std::move(cond)), then_expr(std::move(then_e)), else_expr(std::move(else_e)) {}
};

/// @brief List literal expression
class ListExpr : public Expression {
public:
    std::vector<ExprPtr> elements;

    explicit ListExpr(std::vector<ExprPtr> elems) : elements(std::move(elems)) {}
};

/// @brief Map literal expression
class MapExpr : public Expression {
public:
    struct Entry {
        ExprPtr key;
        ExprPtr value;
    };

    std::vector<Entry> entries;

    explicit MapExpr(std::vector<Entry> ents) : entries(std::move(ents)) {}
};

} // namespace manifold_expr
