// src/parser/control_flow.cpp
#include "parser.hpp"

std::unique_ptr<StatementNode> Parser::parse_if_statement() {
    // consume 'եթե' and capture token for diagnostics
    Token ifTok = consume();

    auto node = std::make_unique<IfStatementNode>();
    node->token = ifTok;
    node->condition = parse_expression();

    // the '{' may open on the line after the condition
    skip_newlines();
    if (peek().type != TokenType::OPENBRACE) {
        expect(TokenType::OPENBRACE, "Expected '{' to begin 'եթե' body");
    }
    node->then_body = parse_block();

    // 'հպ' may sit on a later line than the closing '}'
    size_t saved = position;
    skip_newlines();

    if (match(TokenType::HP)) {
        node->has_else = true;
        skip_newlines();
        if (peek().type != TokenType::OPENBRACE) {
            expect(TokenType::OPENBRACE, "Expected '{' to begin 'հպ' body");
        }
        node->else_body = parse_block();
    } else {
        position = saved;
    }

    return node;
}

std::unique_ptr<StatementNode> Parser::parse_while_statement() {
    // consume 'մինչև' and capture token for diagnostics
    Token whileTok = consume();

    auto node = std::make_unique<WhileStatementNode>();
    node->token = whileTok;
    node->condition = parse_expression();

    // the '{' may open on the line after the condition
    skip_newlines();
    if (peek().type != TokenType::OPENBRACE) {
        expect(TokenType::OPENBRACE, "Expected '{' to begin 'մինչև' body");
    }
    node->body = parse_block();

    return node;
}
