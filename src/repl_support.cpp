#include <iostream>
#include <sstream>

#include "colors.hpp"
#include "repl.hpp"

bool is_likely_incomplete_input(const std::string& err) {
    // the unit stopped at end of input: open block, open call, trailing operator
    return err.find("found end of input") != std::string::npos ||
        err.find("Unexpected end of input") != std::string::npos;
}

// Return the count of *unclosed* bracket-like tokens: {...}, (...)
// This ignores characters inside single or double quotes and '#' comments.
int unclosed_brackets_depth(const std::string& s) {
    int braces = 0, paren = 0;
    bool in_single = false, in_double = false, in_comment = false;
    for (size_t i = 0; i < s.size(); ++i) {
        char c = s[i];
        if (in_comment) {
            if (c == '\n') in_comment = false;
            continue;
        }
        if ((in_single || in_double) && c == '\\') {  // skip escaped char
            ++i;
            continue;
        }
        if (!in_double && c == '\'') {
            in_single = !in_single;
            continue;
        }
        if (!in_single && c == '"') {
            in_double = !in_double;
            continue;
        }
        if (in_single || in_double) continue;

        if (c == '#')
            in_comment = true;
        else if (c == '{')
            ++braces;
        else if (c == '}')
            --braces;
        else if (c == '(')
            ++paren;
        else if (c == ')')
            --paren;
    }

    int openOnly = 0;
    if (braces > 0) openOnly += braces;
    if (paren > 0) openOnly += paren;
    return openOnly;  // zero if all balanced (or more closes than opens)
}

std::string repl_banner() {
    std::ostringstream ss;
    ss << "Սուրճ (Soorj) v" << SOORJ_VERSION << " | built on " << __DATE__ << "\n";
    ss << "Type .help for help, .exit or Ctrl-D to quit\n";
    return ss.str();
}

std::string repl_help_text() {
    return R"(
Commands:
  .help     - Show this help message
  .example  - Show example programs
  .clear    - Clear the screen
  .exit     - Exit the REPL (also: exit, quit, Ctrl-D)

Keywords:
  եթե   - if          հպ    - else
  մինչև - while       գործ  - function
  տուր  - return      հեչ   - null
  այո   - true        ոչ    - false
  և     - and         կամ   - or
  չի    - not

Built-in functions:
  գրէ(...)  - print values separated by spaces
  թիվ(x)    - convert to number
  բառ(x)    - convert to string
)";
}

std::string repl_example_text() {
    return R"(
1. Hello world:
   գրէ("Բարեւ աշխարհ!")

2. Variables and arithmetic:
   ա = 10
   բ = 20
   գրէ("Գումարը:", ա + բ)

3. Conditional:
   եթե ա > 5 {
       գրէ("մեծ")
   } հպ {
       գրէ("փոքր")
   }

4. Loop:
   ի = 1
   մինչև ի <= 3 {
       գրէ(ի)
       ի = ի + 1
   }

5. Function:
   գործ աստիճան(հիմք, ցուցիչ) {
       արդյունք = 1
       մինչև ցուցիչ > 0 {
           արդյունք = արդյունք * հիմք
           ցուցիչ = ցուցիչ - 1
       }
       տուր արդյունք
   }
   գրէ(աստիճան(2, 3))
)";
}

void report_error(const std::string& what) {
    if (Color::supports_color(STDERR_FILENO)) {
        std::cerr << Color::bright_red << "Error: " << Color::reset << what << std::endl;
    } else {
        std::cerr << "Error: " << what << std::endl;
    }
}
