#pragma once
#include <string>

#include "evaluator.hpp"

struct SessionOptions {
    // print the value of each top-level expression statement (REPL)
    bool echo = false;
    // dump tokens / AST to stderr before running each unit
    bool dump_tokens = false;
    bool dump_ast = false;
    int max_call_depth = Evaluator::DEFAULT_MAX_CALL_DEPTH;
};

// One root environment (with the builtins) shared by every unit run through it.
class Session {
   public:
    explicit Session(const SessionOptions& options = SessionOptions{});
    // Clears the root and every frame still held only by closure cycles.
    ~Session();

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    // Lex, parse and evaluate one unit. Language errors propagate as SoorjError,
    // runaway recursion as FatalError. Bindings made before an error persist.
    // Frames the unit left unreachable are reclaimed before it returns.
    ExecResult run(const std::string& source, const std::string& filename = "<repl>");

    Evaluator& evaluator() { return evaluator_; }
    EnvPtr global_env() const { return global_env_; }
    const SessionOptions& options() const { return options_; }

   private:
    // top-level expression values are printed as they are evaluated
    ExecResult run_echo(ProgramNode* program);

    SessionOptions options_;
    Evaluator evaluator_;
    EnvPtr global_env_;
};
