// src/evaluator/Evaluator.cpp
#include "evaluator.hpp"

#include "globals.hpp"

Evaluator::Evaluator() = default;

// ----------------- Program evaluation -----------------
ExecResult Evaluator::evaluate(ProgramNode* program, EnvPtr env) {
    if (!program) return ExecResult::completed();

    for (auto& stmt_uptr : program->body) {
        ExecResult r = execute_statement(stmt_uptr.get(), env);
        // a top-level 'տուր' ends the unit
        if (r.is_returned()) return r;
        maybe_collect_cycles(env);
    }
    return ExecResult::completed();
}

EnvPtr make_global_env(Evaluator* evaluator) {
    auto env = std::make_shared<Environment>(nullptr);
    init_globals(env, evaluator);
    return env;
}
