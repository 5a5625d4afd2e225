#include "session.hpp"

#include <iostream>

#include "lexer.hpp"
#include "parser.hpp"
#include "print_debug.hpp"

Session::Session(const SessionOptions& options) : options_(options) {
    evaluator_.set_max_call_depth(options_.max_call_depth);
    global_env_ = make_global_env(&evaluator_);
}

Session::~Session() {
    global_env_->values.clear();
    evaluator_.collect_cycles(nullptr);
}

ExecResult Session::run(const std::string& source, const std::string& filename) {
    Lexer lexer(source, filename);
    std::vector<Token> tokens = lexer.tokenize();
    if (options_.dump_tokens) print_tokens(tokens, std::cerr);

    Parser parser(tokens);
    std::unique_ptr<ProgramNode> ast = parser.parse();
    if (options_.dump_ast) print_program_debug(ast.get(), std::cerr);

    ExecResult result = options_.echo ? run_echo(ast.get()) : evaluator_.evaluate(ast.get(), global_env_);
    evaluator_.collect_cycles(global_env_, result.value);
    return result;
}

ExecResult Session::run_echo(ProgramNode* program) {
    for (auto& stmt : program->body) {
        if (auto exprStmt = dynamic_cast<ExpressionStatementNode*>(stmt.get())) {
            Value v = evaluator_.evaluate_expression(exprStmt->expression.get(), global_env_);
            if (!evaluator_.is_nullish(v)) {
                std::cout << evaluator_.to_string_value(v) << std::endl;
            }
            continue;
        }
        ExecResult r = evaluator_.execute_statement(stmt.get(), global_env_);
        if (r.is_returned()) return r;
    }
    return ExecResult::completed();
}
