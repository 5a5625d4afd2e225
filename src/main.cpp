#include <exception>
#include <iostream>
#include <string>

#include "repl.hpp"
#include "runner.hpp"

int main(int argc, char* argv[]) {
  auto print_usage = []() {
    std::cout << "Usage: soorj [options] [file]\n"
    << "Options:\n"
    << "  -v, --version    Print version and exit\n"
    << "  -i               Start REPL (interactive)\n"
    << "  -h, --help       Show this help message\n"
    << "  --tokens         Dump the token stream to stderr before running\n"
    << "  --ast            Dump the syntax tree to stderr before running\n"
    << "\n"
    << "If a filename starts with '-', either use `--` to end options\n"
    << "or prefix the filename with a path (for example `./-weird.srj`):\n"
    << "  soorj -- -weird.srj\n";
  };

  // Simple options parser: scan argv until we hit a non-option or `--`.
  std::string potential;
  bool seen_double_dash = false;
  bool force_repl = false;
  SessionOptions options;
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];

    if (seen_double_dash) {
      // After `--` everything is a filename argument; take first one
      potential = arg;
      break;
    }

    if (arg == "--") {
      seen_double_dash = true;
      continue;
    }

    // If it looks like an option (starts with '-') handle/validate it
    if (!arg.empty() && arg[0] == '-') {
      if (arg == "-v" || arg == "--version") {
        std::cout << "soorj v" << SOORJ_VERSION << std::endl;
        return 0;
      } else if (arg == "-i") {
        force_repl = true;
      } else if (arg == "-h" || arg == "--help") {
        print_usage();
        return 0;
      } else if (arg == "--tokens") {
        options.dump_tokens = true;
      } else if (arg == "--ast") {
        options.dump_ast = true;
      } else {
        std::cerr << "soorj: unknown option '" << arg << "'\n";
        std::cerr << "Try 'soorj --help' for more information.\n";
        return 1;
      }
      continue;
    }

    // First non-option argument is treated as filename
    potential = arg;
    break;
  }

  try {
    if (force_repl || potential.empty()) {
      run_repl_mode();
      return 0;
    }
    return run_file_mode(potential, options);
  } catch (const std::exception& e) {
    // FatalError from runaway recursion lands here, in both modes
    report_error(e.what());
    return 1;
  }
}
