#include <cmath>
#include <string>

#include "SoorjError.hpp"
#include "evaluator.hpp"

Value Evaluator::evaluate_expression(ExpressionNode* expr, EnvPtr env) {
    if (!expr) return std::monostate{};

    if (auto n = dynamic_cast<NumericLiteralNode*>(expr)) {
        return Value{n->value};
    }
    if (auto s = dynamic_cast<StringLiteralNode*>(expr)) {
        return Value{s->value};
    }
    if (auto b = dynamic_cast<BooleanLiteralNode*>(expr)) {
        return Value{b->value};
    }
    if (dynamic_cast<NullNode*>(expr)) {
        return std::monostate{};
    }

    if (auto id = dynamic_cast<IdentifierNode*>(expr)) {
        return env->get(id->name, id->token);
    }

    if (auto u = dynamic_cast<UnaryExpressionNode*>(expr)) {
        Value operand = evaluate_expression(u->operand.get(), env);

        if (u->op == "չի") {
            return Value{!to_bool(operand)};
        }

        if (u->op == "-") {
            if (!std::holds_alternative<double>(operand)) {
                throw SoorjError(ErrorKind::TypeError,
                    "Unary '-' needs a number, got " + type_name(operand),
                    u->token.loc);
            }
            return Value{-std::get<double>(operand)};
        }

        throw SoorjError(ErrorKind::TypeError, "Unknown unary operator '" + u->op + "'", u->token.loc);
    }

    // short-circuit: the deciding operand itself is the result
    if (auto lg = dynamic_cast<LogicalExpressionNode*>(expr)) {
        Value left = evaluate_expression(lg->left.get(), env);
        if (lg->op == TokenType::AND) {
            if (!to_bool(left)) return left;
        } else {
            if (to_bool(left)) return left;
        }
        return evaluate_expression(lg->right.get(), env);
    }

    if (auto b = dynamic_cast<BinaryExpressionNode*>(expr)) {
        return evaluate_binary(b, env);
    }

    if (auto call = dynamic_cast<CallExpressionNode*>(expr)) {
        return evaluate_call(call, env);
    }

    throw SoorjError(ErrorKind::TypeError, "Unsupported expression '" + expr->to_string() + "'", expr->token.loc);
}

Value Evaluator::evaluate_binary(BinaryExpressionNode* b, EnvPtr env) {
    // both sides always run, left first
    Value left = evaluate_expression(b->left.get(), env);
    Value right = evaluate_expression(b->right.get(), env);
    const std::string& op = b->op;

    if (op == "==") return Value{is_equal(left, right)};
    if (op == "!=") return Value{!is_equal(left, right)};

    bool both_numbers = std::holds_alternative<double>(left) && std::holds_alternative<double>(right);

    if (op == "<" || op == ">" || op == "<=" || op == ">=") {
        if (both_numbers) {
            double l = std::get<double>(left);
            double r = std::get<double>(right);
            if (op == "<") return Value{l < r};
            if (op == ">") return Value{l > r};
            if (op == "<=") return Value{l <= r};
            return Value{l >= r};
        }
        if (std::holds_alternative<std::string>(left) && std::holds_alternative<std::string>(right)) {
            // byte order of UTF-8 is code point order
            int c = std::get<std::string>(left).compare(std::get<std::string>(right));
            if (op == "<") return Value{c < 0};
            if (op == ">") return Value{c > 0};
            if (op == "<=") return Value{c <= 0};
            return Value{c >= 0};
        }
        throw SoorjError(ErrorKind::TypeError,
            "Cannot compare " + type_name(left) + " and " + type_name(right) + " with '" + op + "'",
            b->token.loc);
    }

    if (!both_numbers) {
        throw SoorjError(ErrorKind::TypeError,
            "Operator '" + op + "' needs two numbers, got " + type_name(left) + " and " + type_name(right),
            b->token.loc);
    }

    double l = std::get<double>(left);
    double r = std::get<double>(right);

    if (op == "+") return Value{l + r};
    if (op == "-") return Value{l - r};
    if (op == "*") return Value{l * r};
    if (op == "/") {
        if (r == 0.0) {
            throw SoorjError(ErrorKind::ArithmeticError, "Division by zero", b->token.loc);
        }
        return Value{l / r};
    }
    if (op == "%") {
        if (r == 0.0) {
            throw SoorjError(ErrorKind::ArithmeticError, "Modulo by zero", b->token.loc);
        }
        // floored: the result takes the sign of the divisor
        double m = std::fmod(l, r);
        if (m != 0.0 && ((m < 0) != (r < 0))) m += r;
        return Value{m};
    }

    throw SoorjError(ErrorKind::TypeError, "Unknown binary operator '" + op + "'", b->token.loc);
}
