#pragma once
#include <iostream>
#include <string>
#include <vector>

#include "ast.hpp"
#include "token.hpp"

std::string token_type_name(TokenType t);

// JSON-like dumps used by --tokens / --ast
void print_tokens(const std::vector<Token>& tokens, std::ostream& out = std::cerr);

void print_program_debug(ProgramNode* ast, std::ostream& out = std::cerr, int indent = 0);
