#pragma once
#include <unistd.h>  // for isatty(), STDERR_FILENO

#include <string>

namespace Color {
// ANSI escapes are only written when the stream is a terminal
inline bool supports_color(int fd = STDERR_FILENO) {
    return isatty(fd);
}
const std::string reset = "\033[0m";
const std::string bright_red = "\033[91m";
}  // namespace Color
