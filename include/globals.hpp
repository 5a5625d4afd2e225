#pragma once
#include <string>

#include "evaluator.hpp"

// Binds the builtin functions (գրէ, թիվ, բառ) in env.
void init_globals(EnvPtr env, Evaluator* evaluator);

// Whole-string decimal parse for թիվ: surrounding whitespace allowed, hex rejected.
bool parse_number_literal(const std::string& text, double& out);
