/// @file parser.cpp
/// @brief Recursive-descent expression parser

#include <manifold/expr/parser.hpp>

namespace manifold_expr {

// =============================================================================
// Parser Implementation
// =============================================================================

Parser::Parser(std::string_view source)
    : lexer_(source) {
    advance();
}

ExprPtr Parser::parse() {
    if (error_) return nullptr;

    if (check(TokenType::Eof)) {
        fail(current_, "Empty expression");
        return nullptr;
    }

    ExprPtr expr = parse_precedence(0);
    if (!expr || error_) return nullptr;

    if (!check(TokenType::Eof)) {
        fail(current_, std::string("Unexpected '") + std::string(current_.lexeme) + "'");
        return nullptr;
    }

    return expr;
}

bool Parser::check(TokenType type) const {
    return current_.type == type;
}

Token Parser::advance() {
    previous_ = current_;
    current_ = lexer_.next_token();

    if (current_.type == TokenType::Error) {
        fail(current_, current_.string_value);
    }

    return previous_;
}

bool Parser::match(TokenType type) {
    if (!check(type)) return false;
    advance();
    return true;
}

bool Parser::consume(TokenType type, const std::string& message) {
    if (check(type)) {
        advance();
        return true;
    }
    fail(current_, message);
    return false;
}

void Parser::fail(const Token& token, const std::string& message) {
    // Keep the first error only
    if (error_) return;
    error_ = SyntaxError{message, token.offset};
}

// =============================================================================
// Precedence
// =============================================================================

int Parser::get_precedence(TokenType type) {
    switch (type) {
        case TokenType::Question:
            return static_cast<int>(Precedence::Ternary);

        case TokenType::Or:
            return static_cast<int>(Precedence::Or);

        case TokenType::And:
            return static_cast<int>(Precedence::And);

        case TokenType::Equal:
        case TokenType::NotEqual:
        case TokenType::Less:
        case TokenType::LessEqual:
        case TokenType::Greater:
        case TokenType::GreaterEqual:
        case TokenType::In:
            return static_cast<int>(Precedence::Relation);

        case TokenType::Plus:
        case TokenType::Minus:
            return static_cast<int>(Precedence::Term);

        case TokenType::Star:
        case TokenType::Slash:
        case TokenType::Percent:
            return static_cast<int>(Precedence::Factor);

        case TokenType::LeftParen:
        case TokenType::LeftBracket:
        case TokenType::Dot:
            return static_cast<int>(Precedence::Call);

        default:
            return 0;
    }
}

// =============================================================================
// Expression Parsing
// =============================================================================

ExprPtr Parser::parse_precedence(int precedence) {
    ExprPtr left = parse_prefix();
    if (!left) return nullptr;

    while (!error_ && precedence < get_precedence(current_.type)) {
        left = parse_infix(std::move(left), get_precedence(current_.type));
        if (!left) return nullptr;
    }

    if (error_) return nullptr;
    return left;
}

ExprPtr Parser::parse_prefix() {
    switch (current_.type) {
        case TokenType::Integer:
        case TokenType::Float:
        case TokenType::String:
        case TokenType::True:
        case TokenType::False:
        case TokenType::Null:
            return parse_literal();

        case TokenType::Identifier:
            return parse_identifier();

        case TokenType::LeftParen:
            return parse_grouping();

        case TokenType::LeftBracket:
            return parse_list();

        case TokenType::LeftBrace:
            return parse_map();

        case TokenType::Minus:
        case TokenType::Not:
            return parse_unary();

        default:
            fail(current_, std::string("Expected expression, found ") + token_type_name(current_.type));
            return nullptr;
    }
}

ExprPtr Parser::parse_infix(ExprPtr left, int precedence) {
    switch (current_.type) {
        case TokenType::LeftParen:
            return parse_call(std::move(left));

        case TokenType::Dot:
            return parse_member(std::move(left));

        case TokenType::LeftBracket:
            return parse_index(std::move(left));

        case TokenType::Question:
            return parse_ternary(std::move(left));

        default: {
            Token op = advance();
            ExprPtr right = parse_precedence(precedence);
            if (!right) return nullptr;
            auto expr = std::make_unique<BinaryExpr>(op.type, std::move(left), std::move(right));
            expr->offset = op.offset;
            return expr;
        }
    }
}

ExprPtr Parser::parse_literal() {
    Token tok = advance();
    nlohmann::json value;

    switch (tok.type) {
        case TokenType::Integer: value = tok.int_value; break;
        case TokenType::Float: value = tok.float_value; break;
        case TokenType::String: value = tok.string_value; break;
        case TokenType::True: value = true; break;
        case TokenType::False: value = false; break;
        default: value = nullptr; break;
    }

    auto expr = std::make_unique<LiteralExpr>(std::move(value));
    expr->offset = tok.offset;
    return expr;
}

ExprPtr Parser::parse_identifier() {
    Token tok = advance();
    auto expr = std::make_unique<IdentifierExpr>(tok.string_value);
    expr->offset = tok.offset;
    return expr;
}

ExprPtr Parser::parse_grouping() {
    advance();  // (
    ExprPtr expr = parse_precedence(0);
    if (!expr) return nullptr;
    if (!consume(TokenType::RightParen, "Expected ')' after expression")) return nullptr;
    return expr;
}

ExprPtr Parser::parse_list() {
    Token open = advance();  // [
    std::vector<ExprPtr> elements;

    if (!check(TokenType::RightBracket)) {
        do {
            if (check(TokenType::RightBracket)) break;  // trailing comma
            ExprPtr element = parse_precedence(0);
            if (!element) return nullptr;
            elements.push_back(std::move(element));
        } while (match(TokenType::Comma));
    }

    if (!consume(TokenType::RightBracket, "Expected ']' after list elements")) return nullptr;

    auto expr = std::make_unique<ListExpr>(std::move(elements));
    expr->offset = open.offset;
    return expr;
}

ExprPtr Parser::parse_map() {
    Token open = advance();  // {
    std::vector<MapExpr::Entry> entries;

    if (!check(TokenType::RightBrace)) {
        do {
            if (check(TokenType::RightBrace)) break;
            ExprPtr key = parse_precedence(0);
            if (!key) return nullptr;
            if (!consume(TokenType::Colon, "Expected ':' after map key")) return nullptr;
            ExprPtr value = parse_precedence(0);
            if (!value) return nullptr;
            entries.push_back(MapExpr::Entry{std::move(key), std::move(value)});
        } while (match(TokenType::Comma));
    }

    if (!consume(TokenType::RightBrace, "Expected '}' after map entries")) return nullptr;

    auto expr = std::make_unique<MapExpr>(std::move(entries));
    expr->offset = open.offset;
    return expr;
}

ExprPtr Parser::parse_unary() {
    Token op = advance();
    ExprPtr operand = parse_precedence(static_cast<int>(Precedence::Unary));
    if (!operand) return nullptr;

    auto expr = std::make_unique<UnaryExpr>(op.type, std::move(operand));
    expr->offset = op.offset;
    return expr;
}

bool Parser::parse_arguments(std::vector<ExprPtr>& out) {
    advance();  // (

    if (!check(TokenType::RightParen)) {
        do {
            ExprPtr arg = parse_precedence(0);
            if (!arg) return false;
            out.push_back(std::move(arg));
        } while (match(TokenType::Comma));
    }

    return consume(TokenType::RightParen, "Expected ')' after arguments");
}

ExprPtr Parser::parse_call(ExprPtr callee) {
    std::size_t offset = callee->offset;
    ExprPtr target;
    std::string function;

    if (auto* ident = dynamic_cast<IdentifierExpr*>(callee.get())) {
        function = ident->name;
    } else if (auto* member = dynamic_cast<MemberExpr*>(callee.get())) {
        function = member->member;
        target = std::move(member->object);
    } else {
        fail(current_, "Only named functions and methods can be called");
        return nullptr;
    }

    std::vector<ExprPtr> args;
    if (!parse_arguments(args)) return nullptr;

    auto expr = std::make_unique<CallExpr>(std::move(target), std::move(function), std::move(args));
    expr->offset = offset;
    return expr;
}

ExprPtr Parser::parse_member(ExprPtr object) {
    advance();  // .

    if (!check(TokenType::Identifier)) {
        fail(current_, "Expected member name after '.'");
        return nullptr;
    }

    Token name = advance();
    auto expr = std::make_unique<MemberExpr>(std::move(object), name.string_value);
    expr->offset = name.offset;
    return expr;
}

ExprPtr Parser::parse_index(ExprPtr object) {
    Token open = advance();  // [
    ExprPtr index = parse_precedence(0);
    if (!index) return nullptr;
    if (!consume(TokenType::RightBracket, "Expected ']' after index")) return nullptr;

    auto expr = std::make_unique<IndexExpr>(std::move(object), std::move(index));
    expr->offset = open.offset;
    return expr;
}

ExprPtr Parser::parse_ternary(ExprPtr condition) {
    advance();  // ?
    ExprPtr then_expr = parse_precedence(0);
    if (!then_expr) return nullptr;
    if (!consume(TokenType::Colon, "Expected ':' in conditional expression")) return nullptr;
    ExprPtr else_expr = parse_precedence(static_cast<int>(Precedence::Ternary) - 1);
    if (!else_expr) return nullptr;

    std::size_t offset = condition->offset;
    auto expr = std::make_unique<TernaryExpr>(std::move(condition), std::move(then_expr), std::move(else_expr));
    expr->offset = offset;
    return expr;
}

} // namespace manifold_expr
