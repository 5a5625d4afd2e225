#include <string>

#include "SoorjError.hpp"
#include "evaluator.hpp"

// a user function keeps its defining frame alive
static bool holds_closure(const Value& v) {
    auto fn = std::get_if<FunctionPtr>(&v);
    return fn && *fn && (*fn)->closure;
}

ExecResult Evaluator::execute_block(const std::vector<std::unique_ptr<StatementNode>>& stmts, EnvPtr env) {
    for (auto& s : stmts) {
        ExecResult r = execute_statement(s.get(), env);
        if (r.is_returned()) return r;
    }
    return ExecResult::completed();
}

ExecResult Evaluator::execute_statement(StatementNode* stmt, EnvPtr env) {
    if (!stmt) return ExecResult::completed();

    if (auto ss = dynamic_cast<ExpressionStatementNode*>(stmt)) {
        evaluate_expression(ss->expression.get(), env);
        return ExecResult::completed();
    }

    // right-hand side first, then nearest binding or a new one in this frame
    if (auto an = dynamic_cast<AssignmentNode*>(stmt)) {
        Value val = evaluate_expression(an->value.get(), env);
        Environment* target = env->assign(an->name, val);
        if (holds_closure(val)) track_function_frame(target);
        return ExecResult::completed();
    }

    if (auto fd = dynamic_cast<FunctionDeclarationNode*>(stmt)) {
        // Persist a copy of the declaration: the unit's AST is released after the unit runs.
        std::shared_ptr<FunctionDeclarationNode> persisted(
            static_cast<FunctionDeclarationNode*>(fd->clone().release()));

        auto fn = std::make_shared<FunctionValue>(persisted->name, persisted, env, persisted->token);
        env->set(persisted->name, fn);
        track_function_frame(env.get());
        return ExecResult::completed();
    }

    if (auto rn = dynamic_cast<ReturnStatementNode*>(stmt)) {
        Value v;  // bare 'տուր' gives հեչ
        if (rn->value) v = evaluate_expression(rn->value.get(), env);
        return ExecResult::returned(v);
    }

    if (auto bn = dynamic_cast<BlockStatementNode*>(stmt)) {
        auto blockEnv = std::make_shared<Environment>(env);
        return execute_block(bn->body, blockEnv);
    }

    if (auto ifn = dynamic_cast<IfStatementNode*>(stmt)) {
        Value condVal = evaluate_expression(ifn->condition.get(), env);
        if (to_bool(condVal)) {
            auto blockEnv = std::make_shared<Environment>(env);
            return execute_block(ifn->then_body, blockEnv);
        } else if (ifn->has_else) {
            auto blockEnv = std::make_shared<Environment>(env);
            return execute_block(ifn->else_body, blockEnv);
        }
        return ExecResult::completed();
    }

    // --- WhileStatementNode (մինչև) ---
    if (auto wn = dynamic_cast<WhileStatementNode*>(stmt)) {
        while (true) {
            maybe_collect_cycles(env);
            Value condVal = evaluate_expression(wn->condition.get(), env);
            if (!to_bool(condVal)) break;

            // one frame per iteration
            auto bodyEnv = std::make_shared<Environment>(env);
            ExecResult r = execute_block(wn->body, bodyEnv);
            if (r.is_returned()) return r;
        }
        return ExecResult::completed();
    }

    throw SoorjError(ErrorKind::TypeError, "Unsupported statement '" + stmt->to_string() + "'", stmt->token.loc);
}
