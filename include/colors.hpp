#pragma once
#include <unistd.h>  // for isatty(), STDOUT_FILENO, STDERR_FILENO

#include <cstdlib>
#include <string>

namespace Color {
// NO_COLOR (any value) and TERM=dumb turn colours off.
inline bool supports_color(int fd = STDOUT_FILENO) {
    if (std::getenv("NO_COLOR")) return false;
    const char* term = std::getenv("TERM");
    if (term && std::string(term) == "dumb") return false;
    return isatty(fd);
}

const std::string reset = "\033[0m";
const std::string bold = "\033[1m";

const std::string red = "\033[31m";
const std::string yellow = "\033[33m";
const std::string cyan = "\033[36m";
const std::string bright_black = "\033[90m";  // gray
}  // namespace Color
