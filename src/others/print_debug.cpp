#include "print_debug.hpp"

#include <string>
#include <unordered_map>

std::string token_type_name(TokenType t) {
    static const std::unordered_map<TokenType, std::string> names = {
        {TokenType::GORTS, "GORTS"}, {TokenType::TUR, "TUR"},
        {TokenType::YETE, "YETE"}, {TokenType::HP, "HP"}, {TokenType::MINCHEV, "MINCHEV"},
        {TokenType::IDENTIFIER, "IDENTIFIER"}, {TokenType::NUMBER, "NUMBER"}, {TokenType::STRING, "STRING"},
        {TokenType::BOOLEAN, "BOOLEAN"}, {TokenType::NULL_LITERAL, "NULL_LITERAL"},
        {TokenType::SEMICOLON, "SEMICOLON"}, {TokenType::COMMA, "COMMA"},
        {TokenType::OPENPARENTHESIS, "OPENPARENTHESIS"}, {TokenType::CLOSEPARENTHESIS, "CLOSEPARENTHESIS"},
        {TokenType::OPENBRACE, "OPENBRACE"}, {TokenType::CLOSEBRACE, "CLOSEBRACE"},
        {TokenType::ASSIGN, "ASSIGN"}, {TokenType::EOF_TOKEN, "EOF_TOKEN"},
        {TokenType::PLUS, "PLUS"}, {TokenType::MINUS, "MINUS"}, {TokenType::STAR, "STAR"}, {TokenType::SLASH, "SLASH"},
        {TokenType::PERCENT, "PERCENT"},
        {TokenType::AND, "AND"}, {TokenType::OR, "OR"}, {TokenType::NOT, "NOT"},
        {TokenType::GREATERTHAN, "GREATERTHAN"}, {TokenType::GREATEROREQUALTHAN, "GREATEROREQUALTHAN"},
        {TokenType::LESSTHAN, "LESSTHAN"}, {TokenType::LESSOREQUALTHAN, "LESSOREQUALTHAN"},
        {TokenType::EQUALITY, "EQUALITY"}, {TokenType::NOTEQUAL, "NOTEQUAL"},
        {TokenType::NEWLINE, "NEWLINE"}};
    auto it = names.find(t);
    return it != names.end() ? it->second : "TOKEN(?)";
}

static std::string escape(const std::string& s) {
    std::string out;
    for (char c : s) {
        if (c == '"' || c == '\\') {
            out.push_back('\\');
            out.push_back(c);
        } else if (c == '\n') {
            out += "\\n";
        } else if (c == '\t') {
            out += "\\t";
        } else if (c == '\r') {
            out += "\\r";
        } else {
            out.push_back(c);
        }
    }
    return out;
}

void print_tokens(const std::vector<Token>& tokens, std::ostream& out) {
    out << "[\n";
    for (size_t i = 0; i < tokens.size(); ++i) {
        const auto& tok = tokens[i];
        out << "  {\n";
        out << "    \"type\": \"" << token_type_name(tok.type) << "\",\n";
        out << "    \"value\": \"" << escape(tok.value) << "\",\n";
        out << "    \"loc\": \"" << escape(tok.loc.to_string()) << "\",\n";
        out << "    \"length\": " << tok.loc.length << "\n";
        out << "  }" << (i + 1 < tokens.size() ? "," : "") << "\n";
    }
    out << "]\n";
}

static std::string statement_kind(const StatementNode* stmt) {
    if (dynamic_cast<const AssignmentNode*>(stmt)) return "Assignment";
    if (dynamic_cast<const ExpressionStatementNode*>(stmt)) return "ExpressionStatement";
    if (dynamic_cast<const BlockStatementNode*>(stmt)) return "Block";
    if (dynamic_cast<const IfStatementNode*>(stmt)) return "If";
    if (dynamic_cast<const WhileStatementNode*>(stmt)) return "While";
    if (dynamic_cast<const FunctionDeclarationNode*>(stmt)) return "FunctionDeclaration";
    if (dynamic_cast<const ReturnStatementNode*>(stmt)) return "Return";
    return "Statement";
}

static void print_statement_list(const std::vector<std::unique_ptr<StatementNode>>& stmts, std::ostream& out, int indent);

static void print_statement(const StatementNode* stmt, std::ostream& out, int indent) {
    std::string ind(indent, ' ');
    if (!stmt) {
        out << ind << "null";
        return;
    }

    out << ind << "{\n";
    out << ind << "  \"type\": \"" << statement_kind(stmt) << "\",\n";
    out << ind << "  \"loc\": \"" << escape(stmt->token.loc.to_string()) << "\",\n";

    const std::vector<std::unique_ptr<StatementNode>>* body = nullptr;
    const std::vector<std::unique_ptr<StatementNode>>* else_body = nullptr;
    if (auto b = dynamic_cast<const BlockStatementNode*>(stmt)) body = &b->body;
    if (auto w = dynamic_cast<const WhileStatementNode*>(stmt)) body = &w->body;
    if (auto f = dynamic_cast<const FunctionDeclarationNode*>(stmt)) body = &f->body;
    if (auto i = dynamic_cast<const IfStatementNode*>(stmt)) {
        body = &i->then_body;
        if (i->has_else) else_body = &i->else_body;
    }

    out << ind << "  \"text\": \"" << escape(stmt->to_string()) << "\"";
    if (body) {
        out << ",\n" << ind << "  \"body\": ";
        print_statement_list(*body, out, indent + 2);
    }
    if (else_body) {
        out << ",\n" << ind << "  \"else\": ";
        print_statement_list(*else_body, out, indent + 2);
    }
    out << "\n" << ind << "}";
}

static void print_statement_list(const std::vector<std::unique_ptr<StatementNode>>& stmts, std::ostream& out, int indent) {
    std::string ind(indent, ' ');
    if (stmts.empty()) {
        out << "[]";
        return;
    }
    out << "[\n";
    for (size_t i = 0; i < stmts.size(); ++i) {
        print_statement(stmts[i].get(), out, indent + 2);
        if (i + 1 < stmts.size()) out << ",";
        out << "\n";
    }
    out << ind << "]";
}

void print_program_debug(ProgramNode* ast, std::ostream& out, int indent) {
    if (!ast) {
        out << "{}\n";
        return;
    }

    std::string ind(indent, ' ');
    out << ind << "{\n";
    out << ind << "  \"type\": \"Program\",\n";
    out << ind << "  \"body\": ";
    print_statement_list(ast->body, out, indent + 2);
    out << "\n" << ind << "}\n";
}
