#include <cctype>
#include <cstdlib>
#include <iostream>
#include <string>

#include "SoorjError.hpp"
#include "evaluator.hpp"
#include "globals.hpp"
#include "token.hpp"

static void require_arity(const std::string& name, const std::vector<Value>& args, size_t expected, const Token& tok) {
    if (args.size() != expected) {
        throw SoorjError(ErrorKind::ArityError,
            "Function '" + name + "' expects " + std::to_string(expected) + " argument(s) but got " +
                std::to_string(args.size()),
            tok.loc);
    }
}

bool parse_number_literal(const std::string& text, double& out) {
    size_t begin = 0;
    size_t end = text.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(text[begin]))) begin++;
    while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1]))) end--;
    if (begin == end) return false;

    std::string trimmed = text.substr(begin, end - begin);
    // strtod also takes hex floats and nan(...) payloads
    for (char c : trimmed) {
        if (c == 'x' || c == 'X' || c == '(' || c == ')') return false;
    }

    const char* start = trimmed.c_str();
    char* stop = nullptr;
    double d = std::strtod(start, &stop);
    if (stop != start + trimmed.size()) return false;
    // overflow saturates to +-inf, underflow keeps the nearest value
    out = d;
    return true;
}

// գրէ(v1, v2, ...): one line on stdout, arguments joined by a space
static Value builtin_gre(Evaluator* evaluator, const std::vector<Value>& args) {
    std::string line;
    for (size_t i = 0; i < args.size(); ++i) {
        if (i) line += " ";
        line += evaluator->to_string_value(args[i]);
    }
    std::cout << line << std::endl;
    return std::monostate{};
}

// թիվ(v): number from a number or a numeric string
static Value builtin_tiv(const std::vector<Value>& args, const Token& tok, Evaluator* evaluator) {
    require_arity("թիվ", args, 1, tok);
    const Value& v = args[0];

    if (std::holds_alternative<double>(v)) return v;

    if (std::holds_alternative<std::string>(v)) {
        const std::string& s = std::get<std::string>(v);
        double d = 0.0;
        if (parse_number_literal(s, d)) return Value{d};
        throw SoorjError(ErrorKind::ValueError, "Cannot convert \"" + s + "\" to a number", tok.loc);
    }

    throw SoorjError(ErrorKind::ValueError,
        "Cannot convert " + evaluator->type_name(v) + " '" + evaluator->to_string_value(v) + "' to a number",
        tok.loc);
}

// բառ(v): canonical text of any value
static Value builtin_bar(const std::vector<Value>& args, const Token& tok, Evaluator* evaluator) {
    require_arity("բառ", args, 1, tok);
    return Value{evaluator->to_string_value(args[0])};
}

void init_globals(EnvPtr env, Evaluator* evaluator) {
    if (!env || !evaluator) return;

    auto add_fn = [&](const std::string& name, NativeFn impl) {
        // natives need no captured frame
        auto fn = std::make_shared<FunctionValue>(name, impl, nullptr, Token{});
        env->set(name, fn);
    };

    add_fn("գրէ", [evaluator](const std::vector<Value>& args, EnvPtr, const Token&) -> Value {
        return builtin_gre(evaluator, args);
    });
    add_fn("թիվ", [evaluator](const std::vector<Value>& args, EnvPtr, const Token& tok) -> Value {
        return builtin_tiv(args, tok, evaluator);
    });
    add_fn("բառ", [evaluator](const std::vector<Value>& args, EnvPtr, const Token& tok) -> Value {
        return builtin_bar(args, tok, evaluator);
    });
}
