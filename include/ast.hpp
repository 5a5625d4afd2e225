#pragma once
#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include "token.hpp"

// Base class for all AST nodes
struct Node {
    virtual ~Node() = default;
    Token token;  // filename, line, column for this node (set by the parser)

    virtual std::string to_string() const {
        return "<node>";
    }
};

// Expressions
struct ExpressionNode : public Node {
    // Function bodies are cloned when a function is defined so they outlive
    // the AST of the unit that declared them.
    virtual std::unique_ptr<ExpressionNode> clone() const = 0;
};

struct NumericLiteralNode : public ExpressionNode {
    double value = 0.0;
    std::string to_string() const override {
        std::ostringstream ss;
        ss << value;
        return ss.str();
    }
    std::unique_ptr<ExpressionNode> clone() const override {
        auto n = std::make_unique<NumericLiteralNode>();
        n->value = value;
        n->token = token;
        return n;
    }
};

struct StringLiteralNode : public ExpressionNode {
    std::string value;
    std::string to_string() const override {
        return "\"" + value + "\"";
    }
    std::unique_ptr<ExpressionNode> clone() const override {
        auto n = std::make_unique<StringLiteralNode>();
        n->value = value;
        n->token = token;
        return n;
    }
};

struct BooleanLiteralNode : public ExpressionNode {
    bool value = false;
    std::string to_string() const override {
        return value ? "այո" : "ոչ";
    }
    std::unique_ptr<ExpressionNode> clone() const override {
        auto n = std::make_unique<BooleanLiteralNode>();
        n->value = value;
        n->token = token;
        return n;
    }
};

struct NullNode : public ExpressionNode {
    explicit NullNode(const Token& t) { token = t; }

    std::string to_string() const override {
        return "հեչ";
    }

    std::unique_ptr<ExpressionNode> clone() const override {
        return std::make_unique<NullNode>(*this);
    }
};

struct IdentifierNode : public ExpressionNode {
    std::string name;
    std::string to_string() const override {
        return name;
    }
    std::unique_ptr<ExpressionNode> clone() const override {
        auto n = std::make_unique<IdentifierNode>();
        n->name = name;
        n->token = token;
        return n;
    }
};

struct UnaryExpressionNode : public ExpressionNode {
    std::string op;  // "-" or "չի"
    std::unique_ptr<ExpressionNode> operand;
    std::string to_string() const override {
        std::string opnd = operand ? operand->to_string() : "<null>";
        return "(" + op + (op == "-" ? "" : " ") + opnd + ")";
    }
    std::unique_ptr<ExpressionNode> clone() const override {
        auto n = std::make_unique<UnaryExpressionNode>();
        n->op = op;
        n->token = token;
        if (operand) n->operand = operand->clone();
        return n;
    }
};

// Eager binary operators: arithmetic, comparison and equality
struct BinaryExpressionNode : public ExpressionNode {
    std::string op;  // e.g. "+", "%", "<=", "=="
    std::unique_ptr<ExpressionNode> left;
    std::unique_ptr<ExpressionNode> right;
    std::string to_string() const override {
        std::string l = left ? left->to_string() : "<null>";
        std::string r = right ? right->to_string() : "<null>";
        return "(" + l + " " + op + " " + r + ")";
    }
    std::unique_ptr<ExpressionNode> clone() const override {
        auto n = std::make_unique<BinaryExpressionNode>();
        n->op = op;
        n->token = token;
        if (left) n->left = left->clone();
        if (right) n->right = right->clone();
        return n;
    }
};

// 'և' / 'կամ'. The right operand is only evaluated when needed.
struct LogicalExpressionNode : public ExpressionNode {
    TokenType op = TokenType::AND;  // AND or OR
    std::unique_ptr<ExpressionNode> left;
    std::unique_ptr<ExpressionNode> right;
    std::string to_string() const override {
        std::string l = left ? left->to_string() : "<null>";
        std::string r = right ? right->to_string() : "<null>";
        return "(" + l + (op == TokenType::AND ? " և " : " կամ ") + r + ")";
    }
    std::unique_ptr<ExpressionNode> clone() const override {
        auto n = std::make_unique<LogicalExpressionNode>();
        n->op = op;
        n->token = token;
        if (left) n->left = left->clone();
        if (right) n->right = right->clone();
        return n;
    }
};

struct CallExpressionNode : public ExpressionNode {
    std::unique_ptr<ExpressionNode> callee;
    std::vector<std::unique_ptr<ExpressionNode>> arguments;

    std::string to_string() const override {
        std::string c = callee ? callee->to_string() : "<null>";
        std::string args;
        for (size_t i = 0; i < arguments.size(); ++i) {
            if (i) args += ", ";
            args += arguments[i] ? arguments[i]->to_string() : "<null>";
        }
        return c + "(" + args + ")";
    }

    std::unique_ptr<ExpressionNode> clone() const override {
        auto n = std::make_unique<CallExpressionNode>();
        n->token = token;
        if (callee) n->callee = callee->clone();
        n->arguments.reserve(arguments.size());
        for (const auto& a : arguments) n->arguments.push_back(a ? a->clone() : nullptr);
        return n;
    }
};

// Statements
struct StatementNode : public Node {
    virtual std::unique_ptr<StatementNode> clone() const = 0;
};

// Assignment: the target is always a plain name
struct AssignmentNode : public StatementNode {
    std::string name;
    std::unique_ptr<ExpressionNode> value;

    std::string to_string() const override {
        return name + " = " + (value ? value->to_string() : "<null>");
    }

    std::unique_ptr<StatementNode> clone() const override {
        auto n = std::make_unique<AssignmentNode>();
        n->token = token;
        n->name = name;
        n->value = value ? value->clone() : nullptr;
        return n;
    }
};

struct ExpressionStatementNode : public StatementNode {
    std::unique_ptr<ExpressionNode> expression;

    std::string to_string() const override {
        return expression ? expression->to_string() : "<null>";
    }

    std::unique_ptr<StatementNode> clone() const override {
        auto n = std::make_unique<ExpressionStatementNode>();
        n->token = token;
        n->expression = expression ? expression->clone() : nullptr;
        return n;
    }
};

// A bare { ... } block. Runs in its own frame.
struct BlockStatementNode : public StatementNode {
    std::vector<std::unique_ptr<StatementNode>> body;

    std::string to_string() const override {
        return "{ ... }";
    }

    std::unique_ptr<StatementNode> clone() const override {
        auto n = std::make_unique<BlockStatementNode>();
        n->token = token;
        n->body.reserve(body.size());
        for (const auto& s : body) n->body.push_back(s ? s->clone() : nullptr);
        return n;
    }
};

// If statement
struct IfStatementNode : public StatementNode {
    std::unique_ptr<ExpressionNode> condition;
    std::vector<std::unique_ptr<StatementNode>> then_body;
    std::vector<std::unique_ptr<StatementNode>> else_body;
    bool has_else = false;

    std::string to_string() const override {
        return std::string("եթե ") + (condition ? condition->to_string() : "<null>") +
            (has_else ? " { ... } հպ { ... }" : " { ... }");
    }

    std::unique_ptr<StatementNode> clone() const override {
        auto n = std::make_unique<IfStatementNode>();
        n->token = token;
        n->condition = condition ? condition->clone() : nullptr;
        n->has_else = has_else;
        n->then_body.reserve(then_body.size());
        for (const auto& s : then_body) n->then_body.push_back(s ? s->clone() : nullptr);
        n->else_body.reserve(else_body.size());
        for (const auto& s : else_body) n->else_body.push_back(s ? s->clone() : nullptr);
        return n;
    }
};

// While loop
struct WhileStatementNode : public StatementNode {
    std::unique_ptr<ExpressionNode> condition;
    std::vector<std::unique_ptr<StatementNode>> body;

    std::string to_string() const override {
        return std::string("մինչև ") + (condition ? condition->to_string() : "<null>") + " { ... }";
    }

    std::unique_ptr<StatementNode> clone() const override {
        auto n = std::make_unique<WhileStatementNode>();
        n->token = token;
        n->condition = condition ? condition->clone() : nullptr;
        n->body.reserve(body.size());
        for (const auto& s : body) n->body.push_back(s ? s->clone() : nullptr);
        return n;
    }
};

struct ParameterNode : public Node {
    std::string name;

    ParameterNode() = default;

    std::unique_ptr<ParameterNode> clone() const {
        auto n = std::make_unique<ParameterNode>();
        n->token = token;
        n->name = name;
        return n;
    }

    std::string to_string() const override {
        return name;
    }
};

// Function declaration
struct FunctionDeclarationNode : public StatementNode {
    std::string name;
    std::vector<std::unique_ptr<ParameterNode>> parameters;
    std::vector<std::unique_ptr<StatementNode>> body;  // function body statements

    std::string to_string() const override {
        std::string s = "գործ " + name + "(";
        for (size_t i = 0; i < parameters.size(); ++i) {
            if (i) s += ", ";
            s += parameters[i] ? parameters[i]->to_string() : "<null>";
        }
        return s + ") { ... }";
    }

    std::unique_ptr<StatementNode> clone() const override {
        auto n = std::make_unique<FunctionDeclarationNode>();
        n->token = token;
        n->name = name;
        n->parameters.reserve(parameters.size());
        for (const auto& p : parameters) {
            n->parameters.push_back(p ? p->clone() : nullptr);
        }
        n->body.reserve(body.size());
        for (const auto& s : body) n->body.push_back(s ? s->clone() : nullptr);
        return n;
    }
};

struct ReturnStatementNode : public StatementNode {
    std::unique_ptr<ExpressionNode> value;  // optional; absent means հեչ

    std::string to_string() const override {
        return value ? "տուր " + value->to_string() : "տուր";
    }

    std::unique_ptr<StatementNode> clone() const override {
        auto n = std::make_unique<ReturnStatementNode>();
        n->token = token;
        n->value = value ? value->clone() : nullptr;
        return n;
    }
};

// Program root
struct ProgramNode : public Node {
    std::vector<std::unique_ptr<StatementNode>> body;
};
