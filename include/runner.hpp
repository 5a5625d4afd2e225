#pragma once
#include <string>

#include "session.hpp"

// Read filename whole and run it once in a fresh Session. Returns the process
// exit status: 0 on success, 1 when the file cannot be read or the run fails.
int run_file_mode(const std::string& filename, const SessionOptions& options = SessionOptions{});
