#pragma once
#include <memory>
#include <string>
#include <vector>

#include "SoorjError.hpp"
#include "ast.hpp"
#include "token.hpp"

class Parser {
   public:
    Parser(const std::vector<Token>& tokens);
    std::unique_ptr<ProgramNode> parse();

    // nested parentheses, call arguments, unary operators and blocks, counted together
    static constexpr int MAX_NESTING_DEPTH = 200;

   private:
    std::vector<Token> tokens;
    size_t position = 0;
    int nesting_depth = 0;

    struct NestingGuard {
        Parser& parser;
        NestingGuard(Parser& p, const Token& at, const char* what) : parser(p) {
            if (parser.nesting_depth >= MAX_NESTING_DEPTH) {
                throw parser.parse_error(at, std::string(what) + " nested too deeply (limit " + std::to_string(MAX_NESTING_DEPTH) + ")");
            }
            ++parser.nesting_depth;
        }
        ~NestingGuard() { --parser.nesting_depth; }
    };

    Token peek() const;
    Token peek_next(size_t offset = 1) const;

    Token consume();
    bool match(TokenType t);
    void expect(TokenType t, const std::string& errMsg);
    SoorjError parse_error(const Token& tok, const std::string& message) const;

    // NEWLINE or ';'
    bool at_separator() const;
    void skip_separators();
    void skip_newlines();
    // a statement ends at a separator, before '}' or at end of input
    void expect_statement_end();

    // expression parsing (precedence chain)
    std::unique_ptr<ExpressionNode> parse_expression();
    std::unique_ptr<ExpressionNode> parse_logical_or();
    std::unique_ptr<ExpressionNode> parse_logical_and();
    std::unique_ptr<ExpressionNode> parse_equality();
    std::unique_ptr<ExpressionNode> parse_comparison();
    std::unique_ptr<ExpressionNode> parse_additive();
    std::unique_ptr<ExpressionNode> parse_multiplicative();
    std::unique_ptr<ExpressionNode> parse_unary();
    std::unique_ptr<ExpressionNode> parse_primary();
    std::unique_ptr<ExpressionNode> parse_call(std::unique_ptr<ExpressionNode> callee);

    // statements
    std::unique_ptr<StatementNode> parse_statement();
    std::unique_ptr<StatementNode> parse_assignment_or_expression_statement();
    std::unique_ptr<StatementNode> parse_function_declaration();
    std::unique_ptr<StatementNode> parse_return_statement();

    // control-flow parsing
    std::unique_ptr<StatementNode> parse_if_statement();
    std::unique_ptr<StatementNode> parse_while_statement();

    // '{' separators* (statement separators*)* '}'
    std::vector<std::unique_ptr<StatementNode>> parse_block();
    std::unique_ptr<StatementNode> parse_block_statement();
};
