#pragma once

#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

#include "ast.hpp"
#include "token.hpp"

// Forward declaration
class Environment;

// Our language's value types
struct FunctionValue;
using FunctionPtr = std::shared_ptr<FunctionValue>;

// Environment
using EnvPtr = std::shared_ptr<Environment>;

// Null, Number, String, Boolean, Function. There is no integer type.
using Value = std::variant<std::monostate, double, std::string, bool, FunctionPtr>;

using NativeFn = std::function<Value(const std::vector<Value>&, EnvPtr, const Token&)>;

struct FunctionValue {
    std::string name;
    std::vector<std::shared_ptr<ParameterNode>> parameters;
    std::shared_ptr<FunctionDeclarationNode> body;
    EnvPtr closure;  // defining frame, fixed for the function's lifetime
    Token token;
    bool is_native = false;
    NativeFn native_impl;

    // user function: parameters and body are shared with the cloned declaration
    FunctionValue(
        const std::string& nm,
        const std::shared_ptr<FunctionDeclarationNode>& b,
        const EnvPtr& env,
        const Token& tok) : name(nm),
                            body(b),
                            closure(env),
                            token(tok),
                            is_native(false) {
        if (!b) return;
        parameters.reserve(b->parameters.size());
        for (const auto& p : b->parameters) {
            parameters.emplace_back(std::shared_ptr<ParameterNode>(p->clone().release()));
        }
    }

    // native builtin
    FunctionValue(
        const std::string& nm,
        const NativeFn& impl,
        const EnvPtr& env,
        const Token& tok) : name(nm),
                            closure(env),
                            token(tok),
                            is_native(true),
                            native_impl(impl) {}
};

class Environment : public std::enable_shared_from_this<Environment> {
   public:
    Environment(EnvPtr parent = nullptr) : parent(parent) {
    }

    // map from name -> value, this frame only
    std::unordered_map<std::string, Value> values;
    EnvPtr parent;
    // registered with the evaluator's cycle collector
    bool tracked = false;

    // nearest binding up the chain, nullptr when unbound
    Value* find(const std::string& name);

    // nearest binding up the chain. Throws NameError at tok if unbound.
    Value& get(const std::string& name, const Token& tok);

    // create or replace in this frame
    void set(const std::string& name, const Value& value);

    // update the nearest existing binding, or create one in this frame.
    // Returns the frame that now holds the binding.
    Environment* assign(const std::string& name, const Value& value);
};

// Outcome of running a statement or a statement list.
struct ExecResult {
    enum class Kind {
        Completed,
        Returned
    };
    Kind kind = Kind::Completed;
    Value value;  // the returned value when kind == Returned

    bool is_returned() const { return kind == Kind::Returned; }

    static ExecResult completed() { return ExecResult{}; }
    static ExecResult returned(const Value& v) { return ExecResult{Kind::Returned, v}; }
};

class Evaluator {
   public:
    static constexpr int DEFAULT_MAX_CALL_DEPTH = 1000;

    Evaluator();

    // Run a whole unit against env. A 'տուր' reaching the top level ends the unit
    // and is reported as Returned. The caller keeps program alive during the call.
    ExecResult evaluate(ProgramNode* program, EnvPtr env);

    // Expression & statement evaluators. Pass the environment explicitly for lexical scoping.
    ExecResult execute_statement(StatementNode* stmt, EnvPtr env);
    Value evaluate_expression(ExpressionNode* expr, EnvPtr env);

    // invoke a user or native function; callToken is used for diagnostics
    Value call_function(FunctionPtr fn, const std::vector<Value>& args, EnvPtr caller_env, const Token& callToken);

    // helpers: conversions and formatting
    std::string type_name(const Value& v) const;
    std::string to_string_value(const Value& v) const;
    static std::string format_number(double d);
    bool to_bool(const Value& v) const;
    // same variant and same payload; functions by identity
    bool is_equal(const Value& a, const Value& b) const;

    inline bool is_nullish(const Value& v) const {
        return std::holds_alternative<std::monostate>(v);
    }

    void set_max_call_depth(int depth) { max_call_depth_ = depth; }
    int max_call_depth() const { return max_call_depth_; }
    int call_depth() const { return call_depth_; }

    // A frame holding a user function can sit on a frame -> function -> frame
    // cycle that reference counting never frees. Such frames are registered here;
    // collect_cycles clears every registered frame that is not reachable from
    // root or keep through bindings, closures and parents.
    void track_function_frame(Environment* frame);
    void collect_cycles(const EnvPtr& root, const Value& keep = Value{});
    size_t tracked_frames() const { return function_frames_.size(); }

   private:
    static constexpr size_t MIN_COLLECT_THRESHOLD = 256;

    int max_call_depth_ = DEFAULT_MAX_CALL_DEPTH;
    int call_depth_ = 0;

    std::vector<std::weak_ptr<Environment>> function_frames_;
    size_t collect_threshold_ = MIN_COLLECT_THRESHOLD;

    // Collects once enough frames were registered. Only valid between statements
    // outside any call, where env and its parents are the only frames in use.
    void maybe_collect_cycles(const EnvPtr& env);

    // runs stmts in order in env, stopping at the first Returned
    ExecResult execute_block(const std::vector<std::unique_ptr<StatementNode>>& stmts, EnvPtr env);

    Value evaluate_binary(BinaryExpressionNode* b, EnvPtr env);
    Value evaluate_call(CallExpressionNode* call, EnvPtr env);
    Value call_user_function(FunctionPtr fn, const std::vector<Value>& args, const Token& callToken);
};

// Fresh root environment with the builtins bound. The builtins keep a
// pointer to evaluator, which must outlive the environment's use.
EnvPtr make_global_env(Evaluator* evaluator);
