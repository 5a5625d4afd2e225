#include "repl.hpp"

#include <iostream>
#include <string>

#include "SoorjError.hpp"
#include "linenoise.h"

static std::string trim(const std::string& s) {
    size_t b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return "";
    size_t e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

// Returns false when the REPL should quit.
static bool handle_command(const std::string& cmd) {
    if (cmd == ".exit" || cmd == "exit" || cmd == "quit") return false;
    if (cmd == ".help") {
        std::cout << repl_help_text() << std::endl;
    } else if (cmd == ".example") {
        std::cout << repl_example_text() << std::endl;
    } else if (cmd == ".clear") {
        linenoiseClearScreen();
    } else {
        std::cerr << "Unknown command '" << cmd << "'. Type .help for the list of commands." << std::endl;
    }
    return true;
}

void run_repl_mode() {
    SessionOptions options;
    options.echo = true;
    Session session(options);

    std::string buffer;

    std::cout << repl_banner();

#ifdef LINENOISE_MULTILINE
    linenoiseSetMultiLine(1);
#endif

    std::string last_added_history;

    while (true) {
        std::string prompt = buffer.empty() ? "soorj> " : "....> ";
        char* raw = linenoise(prompt.c_str());
        if (!raw) {  // EOF (Ctrl-D) or error
            std::cout << "\n";
            break;
        }

        std::string line(raw);
        linenoiseFree(raw);

        // commands are only recognised at the start of a unit
        if (buffer.empty()) {
            std::string cmd = trim(line);
            if (cmd.empty()) continue;
            if (cmd[0] == '.' || cmd == "exit" || cmd == "quit") {
                if (!handle_command(cmd)) break;
                continue;
            }
        }

        if (!line.empty() && line != last_added_history) {
            linenoiseHistoryAdd(line.c_str());
            last_added_history = line;
        }

        // a blank line ends a pending unit even if it still looks incomplete
        bool force_run = !buffer.empty() && trim(line).empty();

        buffer += line;
        buffer.push_back('\n');

        // If there are unclosed bracket tokens, continue reading.
        if (unclosed_brackets_depth(buffer) > 0) {
            continue;
        }

        // ---- Try lex/parse/evaluate the accumulated buffer ----
        try {
            session.run(buffer, "<repl>");
            buffer.clear();
        } catch (const SoorjError& e) {
            if (!force_run && e.kind() == ErrorKind::ParseError && is_likely_incomplete_input(e.what())) {
                // incomplete -> keep buffer and continue reading
                continue;
            }
            report_error(e.what());
            buffer.clear();
        }
        // FatalError is not caught here: runaway recursion ends the process
    }

    std::cout << "Ցտեսություն!" << std::endl;
}
