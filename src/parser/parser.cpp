// src/parser/parser.cpp
#include "parser.hpp"

#include <sstream>

Parser::Parser(const std::vector<Token>& tokens) : tokens(tokens) {}

// Return current token or EOF token
Token Parser::peek() const {
    if (position < tokens.size()) return tokens[position];
    if (!tokens.empty()) return tokens.back();
    return Token{
        TokenType::EOF_TOKEN,
        "",
        TokenLocation("<eof>", 0, 0, 0)};
}

Token Parser::peek_next(size_t offset) const {
    if (position + offset < tokens.size()) {
        return tokens[position + offset];
    }
    if (!tokens.empty()) return tokens.back();
    return Token{
        TokenType::EOF_TOKEN,
        "",
        TokenLocation("<eof>", 0, 0, 0)};
}

// Consume and return the next token; EOF is never consumed past
Token Parser::consume() {
    if (position < tokens.size()) {
        Token t = tokens[position];
        if (t.type != TokenType::EOF_TOKEN) position++;
        return t;
    }
    return peek();
}

bool Parser::match(TokenType t) {
    if (peek().type == t) {
        consume();
        return true;
    }
    return false;
}

void Parser::expect(TokenType t, const std::string& errMsg) {
    if (peek().type != t) {
        Token tok = peek();
        std::string found = tok.type == TokenType::EOF_TOKEN ? "end of input"
            : tok.type == TokenType::NEWLINE                 ? "end of line"
                                                             : "'" + tok.value + "'";
        throw parse_error(tok, errMsg + " (found " + found + ")");
    }
    consume();
}

SoorjError Parser::parse_error(const Token& tok, const std::string& message) const {
    return SoorjError(ErrorKind::ParseError, message, tok.loc);
}

bool Parser::at_separator() const {
    TokenType t = peek().type;
    return t == TokenType::NEWLINE || t == TokenType::SEMICOLON;
}

void Parser::skip_separators() {
    while (at_separator()) consume();
}

void Parser::skip_newlines() {
    while (peek().type == TokenType::NEWLINE) consume();
}

void Parser::expect_statement_end() {
    if (at_separator()) {
        consume();
        return;
    }
    TokenType t = peek().type;
    if (t == TokenType::CLOSEBRACE || t == TokenType::EOF_TOKEN) return;

    throw parse_error(peek(), "Expected newline or ';' after statement, found '" + peek().value + "'");
}

std::unique_ptr<ProgramNode> Parser::parse() {
    auto program = std::make_unique<ProgramNode>();
    if (!tokens.empty()) program->token = tokens.front();

    skip_separators();
    while (peek().type != TokenType::EOF_TOKEN) {
        program->body.push_back(parse_statement());
        expect_statement_end();
        skip_separators();
    }
    return program;
}

// ---------- statements ----------
std::unique_ptr<StatementNode> Parser::parse_statement() {
    Token p = peek();

    switch (p.type) {
        case TokenType::GORTS:
            return parse_function_declaration();
        case TokenType::TUR:
            return parse_return_statement();
        case TokenType::YETE:
            return parse_if_statement();
        case TokenType::MINCHEV:
            return parse_while_statement();
        case TokenType::OPENBRACE:
            return parse_block_statement();
        default:
            return parse_assignment_or_expression_statement();
    }
}
