#include "runner.hpp"

#include <fstream>
#include <iostream>
#include <sstream>

#include "SoorjError.hpp"
#include "repl.hpp"

int run_file_mode(const std::string& filename, const SessionOptions& options) {
    std::ifstream file(filename, std::ios::binary);
    if (!file.is_open()) {
        report_error("Could not open file " + filename);
        return 1;
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        report_error("Could not read file " + filename);
        return 1;
    }
    std::string source_code = buffer.str();

    SessionOptions file_options = options;
    file_options.echo = false;

    try {
        Session session(file_options);
        session.run(source_code, filename);
    } catch (const SoorjError& e) {
        report_error(e.what());
        return 1;
    } catch (const FatalError& e) {
        report_error(e.what());
        return 1;
    }
    return 0;
}
