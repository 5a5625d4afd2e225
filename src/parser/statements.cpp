// src/parser/statements.cpp
#include <sstream>

#include "parser.hpp"

std::unique_ptr<StatementNode> Parser::parse_assignment_or_expression_statement() {
    // name '=' expression
    if (peek().type == TokenType::IDENTIFIER && peek_next().type == TokenType::ASSIGN) {
        Token idTok = consume();
        consume(); // '='

        auto node = std::make_unique<AssignmentNode>();
        node->token = idTok;
        node->name = idTok.value;
        node->value = parse_expression();
        return node;
    }

    Token startTok = peek();
    auto expr = parse_expression();

    // anything else in front of '=' is not a valid target: f() = 1, (ա) = 1, 3 = 4
    if (peek().type == TokenType::ASSIGN) {
        throw parse_error(peek(), "Invalid assignment target '" + expr->to_string() + "', only a name can be assigned");
    }

    auto stmt = std::make_unique<ExpressionStatementNode>();
    stmt->token = startTok;
    stmt->expression = std::move(expr);
    return stmt;
}

std::unique_ptr<StatementNode> Parser::parse_function_declaration() {
    consume(); // 'գործ'

    expect(TokenType::IDENTIFIER, "Expected function name after 'գործ'");
    Token idTok = tokens[position - 1];

    auto funcNode = std::make_unique<FunctionDeclarationNode>();
    funcNode->name = idTok.value;
    funcNode->token = idTok;

    // Parse parameters
    expect(TokenType::OPENPARENTHESIS, "Expected '(' after function name");
    if (peek().type != TokenType::CLOSEPARENTHESIS) {
        while (true) {
            expect(TokenType::IDENTIFIER, "Expected parameter name");
            Token paramTok = tokens[position - 1];

            for (const auto& existing : funcNode->parameters) {
                if (existing->name == paramTok.value) {
                    throw parse_error(paramTok, "Duplicate parameter name '" + paramTok.value + "' in function '" + funcNode->name + "'");
                }
            }

            auto p = std::make_unique<ParameterNode>();
            p->token = paramTok;
            p->name = paramTok.value;
            funcNode->parameters.push_back(std::move(p));

            if (!match(TokenType::COMMA)) break;
        }
    }
    expect(TokenType::CLOSEPARENTHESIS, "Expected ')' after parameter list");

    skip_newlines();
    funcNode->body = parse_block();
    return funcNode;
}

std::unique_ptr<StatementNode> Parser::parse_return_statement() {
    Token kwTok = consume(); // 'տուր'

    auto retNode = std::make_unique<ReturnStatementNode>();
    retNode->token = kwTok;

    // The return value is optional: nothing follows before the statement ends.
    TokenType next = peek().type;
    if (next != TokenType::SEMICOLON && next != TokenType::NEWLINE && next != TokenType::CLOSEBRACE && next != TokenType::EOF_TOKEN) {
        retNode->value = parse_expression();
    }

    return retNode;
}
