// src/evaluator/FunctionCall.cpp
#include <string>

#include "SoorjError.hpp"
#include "evaluator.hpp"

Value Evaluator::evaluate_call(CallExpressionNode* call, EnvPtr env) {
    Value calleeVal = evaluate_expression(call->callee.get(), env);

    if (!std::holds_alternative<FunctionPtr>(calleeVal) || !std::get<FunctionPtr>(calleeVal)) {
        throw SoorjError(ErrorKind::TypeError,
            "'" + call->callee->to_string() + "' is not callable (it is a " + type_name(calleeVal) + ")",
            call->token.loc);
    }
    FunctionPtr fn = std::get<FunctionPtr>(calleeVal);

    // arguments left to right
    std::vector<Value> args;
    args.reserve(call->arguments.size());
    for (auto& a : call->arguments) {
        args.push_back(evaluate_expression(a.get(), env));
    }

    return call_function(fn, args, env, call->token);
}

Value Evaluator::call_function(FunctionPtr fn, const std::vector<Value>& args, EnvPtr caller_env, const Token& callToken) {
    if (!fn) {
        throw SoorjError(ErrorKind::TypeError, "Attempted to call a null function", callToken.loc);
    }

    if (fn->is_native) {
        if (!fn->native_impl) {
            throw SoorjError(ErrorKind::TypeError, "Native function '" + fn->name + "' has no implementation", callToken.loc);
        }
        return fn->native_impl(args, caller_env, callToken);
    }

    return call_user_function(fn, args, callToken);
}

// Restores the depth counter on every exit path, errors included.
struct CallDepthGuard {
    int& depth;
    explicit CallDepthGuard(int& d) : depth(d) { ++depth; }
    ~CallDepthGuard() { --depth; }
};

Value Evaluator::call_user_function(FunctionPtr fn, const std::vector<Value>& args, const Token& callToken) {
    if (args.size() != fn->parameters.size()) {
        throw SoorjError(ErrorKind::ArityError,
            "Function '" + fn->name + "' expects " + std::to_string(fn->parameters.size()) +
                " argument(s) but got " + std::to_string(args.size()),
            callToken.loc);
    }

    if (call_depth_ >= max_call_depth_) {
        throw FatalError(
            "Maximum call depth of " + std::to_string(max_call_depth_) + " exceeded in '" + fn->name +
            "' at " + callToken.loc.to_string() + ". Reduce recursion depth.");
    }
    CallDepthGuard guard(call_depth_);

    // parent is the defining frame, never the caller's
    auto local = std::make_shared<Environment>(fn->closure);
    for (size_t i = 0; i < fn->parameters.size(); ++i) {
        local->set(fn->parameters[i]->name, args[i]);
        if (auto arg = std::get_if<FunctionPtr>(&args[i]); arg && *arg && (*arg)->closure) {
            track_function_frame(local.get());
        }
    }

    ExecResult r = execute_block(fn->body->body, local);
    if (r.is_returned()) return r.value;
    return std::monostate{};
}
