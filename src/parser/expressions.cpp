// src/parser/expressions.cpp
#include <cstdlib>

#include "parser.hpp"

std::unique_ptr<ExpressionNode> Parser::parse_expression() {
    NestingGuard guard(*this, peek(), "Expression");
    return parse_logical_or();
}

std::unique_ptr<ExpressionNode> Parser::parse_logical_or() {
    auto left = parse_logical_and();
    while (peek().type == TokenType::OR) {
        Token op = consume();
        auto right = parse_logical_and();
        auto node = std::make_unique<LogicalExpressionNode>();
        node->op = TokenType::OR;
        node->left = std::move(left);
        node->right = std::move(right);
        node->token = op;
        left = std::move(node);
    }
    return left;
}

std::unique_ptr<ExpressionNode> Parser::parse_logical_and() {
    auto left = parse_equality();
    while (peek().type == TokenType::AND) {
        Token op = consume();
        auto right = parse_equality();
        auto node = std::make_unique<LogicalExpressionNode>();
        node->op = TokenType::AND;
        node->left = std::move(left);
        node->right = std::move(right);
        node->token = op;
        left = std::move(node);
    }
    return left;
}

std::unique_ptr<ExpressionNode> Parser::parse_equality() {
    auto left = parse_comparison();
    while (peek().type == TokenType::EQUALITY || peek().type == TokenType::NOTEQUAL) {
        Token op = consume();
        auto right = parse_comparison();
        auto node = std::make_unique<BinaryExpressionNode>();
        node->op = op.value;
        node->left = std::move(left);
        node->right = std::move(right);
        node->token = op;
        left = std::move(node);
    }
    return left;
}

std::unique_ptr<ExpressionNode> Parser::parse_comparison() {
    auto left = parse_additive();
    while (peek().type == TokenType::GREATERTHAN || peek().type == TokenType::GREATEROREQUALTHAN ||
        peek().type == TokenType::LESSTHAN || peek().type == TokenType::LESSOREQUALTHAN) {
        Token op = consume();
        auto right = parse_additive();
        auto node = std::make_unique<BinaryExpressionNode>();
        node->op = op.value;
        node->left = std::move(left);
        node->right = std::move(right);
        node->token = op;
        left = std::move(node);
    }
    return left;
}

std::unique_ptr<ExpressionNode> Parser::parse_additive() {
    auto left = parse_multiplicative();
    while (peek().type == TokenType::PLUS || peek().type == TokenType::MINUS) {
        Token op = consume();
        auto right = parse_multiplicative();
        auto node = std::make_unique<BinaryExpressionNode>();
        node->op = op.type == TokenType::PLUS ? "+": "-";
        node->left = std::move(left);
        node->right = std::move(right);
        node->token = op;
        left = std::move(node);
    }
    return left;
}

std::unique_ptr<ExpressionNode> Parser::parse_multiplicative() {
    auto left = parse_unary();
    while (peek().type == TokenType::STAR || peek().type == TokenType::SLASH || peek().type == TokenType::PERCENT) {
        Token op = consume();
        auto right = parse_unary();
        auto node = std::make_unique<BinaryExpressionNode>();
        if (op.type == TokenType::STAR) node->op = "*";
        else if (op.type == TokenType::SLASH) node->op = "/";
        else node->op = "%";
        node->left = std::move(left);
        node->right = std::move(right);
        node->token = op;
        left = std::move(node);
    }
    return left;
}

std::unique_ptr<ExpressionNode> Parser::parse_unary() {
    if (peek().type == TokenType::NOT || peek().type == TokenType::MINUS) {
        Token op = consume();
        NestingGuard guard(*this, op, "Unary operators");
        auto operand = parse_unary();
        auto node = std::make_unique<UnaryExpressionNode>();
        node->op = op.type == TokenType::NOT ? "չի": "-";
        node->operand = std::move(operand);
        node->token = op;
        return node;
    }

    auto primary = parse_primary();
    // calls chain: f(1)(2)
    while (peek().type == TokenType::OPENPARENTHESIS) {
        primary = parse_call(std::move(primary));
    }
    return primary;
}

std::unique_ptr<ExpressionNode> Parser::parse_primary() {
    Token t = peek();
    if (t.type == TokenType::NUMBER) {
        Token numTok = consume();
        auto n = std::make_unique<NumericLiteralNode>();
        // strtod saturates to inf on overflow instead of throwing
        n->value = std::strtod(numTok.value.c_str(), nullptr);
        n->token = numTok;
        return n;
    }

    // both double-quoted and single-quoted strings arrive as STRING
    if (t.type == TokenType::STRING) {
        Token s = consume();
        auto node = std::make_unique<StringLiteralNode>();
        node->value = s.value;
        node->token = s;
        return node;
    }

    if (t.type == TokenType::NULL_LITERAL) {
        return std::make_unique<NullNode>(consume());
    }

    if (t.type == TokenType::BOOLEAN) {
        Token b = consume();
        auto node = std::make_unique<BooleanLiteralNode>();
        node->value = (b.value == "այո");
        node->token = b;
        return node;
    }

    if (t.type == TokenType::IDENTIFIER) {
        Token id = consume();
        auto node = std::make_unique<IdentifierNode>();
        node->name = id.value;
        node->token = id;
        return node;
    }

    if (t.type == TokenType::OPENPARENTHESIS) {
        consume(); // '('
        auto expr = parse_expression();
        expect(TokenType::CLOSEPARENTHESIS, "Expected ')' after expression");
        return expr;
    }

    if (t.type == TokenType::EOF_TOKEN) {
        throw parse_error(t, "Unexpected end of input, expected an expression");
    }
    if (t.type == TokenType::NEWLINE || t.type == TokenType::SEMICOLON) {
        throw parse_error(t, "Expected an expression before end of statement");
    }
    throw parse_error(t, "Unexpected token '" + t.value + "', expected an expression");
}

std::unique_ptr<ExpressionNode> Parser::parse_call(std::unique_ptr<ExpressionNode> callee) {
    expect(TokenType::OPENPARENTHESIS, "Expected '(' in call");
    Token openTok = tokens[position - 1]; // the '(' token
    auto call = std::make_unique<CallExpressionNode>();
    call->callee = std::move(callee);
    call->token = openTok;
    if (peek().type != TokenType::CLOSEPARENTHESIS) {
        do {
            call->arguments.push_back(parse_expression());
        } while (match(TokenType::COMMA));
    }

    expect(TokenType::CLOSEPARENTHESIS, "Expected ')' after call arguments");
    return call;
}
