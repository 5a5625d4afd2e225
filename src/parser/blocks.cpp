// src/parser/blocks.cpp
#include "parser.hpp"

// ---------- helper: parse block ----------
std::vector<std::unique_ptr<StatementNode>> Parser::parse_block() {
    std::vector<std::unique_ptr<StatementNode>> body;
    NestingGuard guard(*this, peek(), "Blocks");

    expect(TokenType::OPENBRACE, "Expected '{' to begin block");

    // loop until closing brace
    skip_separators();
    while (peek().type != TokenType::CLOSEBRACE && peek().type != TokenType::EOF_TOKEN) {
        body.push_back(parse_statement());
        expect_statement_end();
        skip_separators();
    }
    expect(TokenType::CLOSEBRACE, "Expected '}' to close block");

    return body;
}

std::unique_ptr<StatementNode> Parser::parse_block_statement() {
    auto node = std::make_unique<BlockStatementNode>();
    node->token = peek();
    node->body = parse_block();
    return node;
}
