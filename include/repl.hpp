#pragma once
#include <string>

#include "session.hpp"

void run_repl_mode();

// Unclosed '{' and '(' in s, ignoring quoted text and comments. Zero when balanced.
int unclosed_brackets_depth(const std::string& s);

// Parser messages that mean the unit simply has not ended yet.
bool is_likely_incomplete_input(const std::string& err);

std::string repl_banner();
std::string repl_help_text();
std::string repl_example_text();

// Prints a SoorjError (or any other failure) to stderr, colored on a terminal.
void report_error(const std::string& what);
