#pragma once
#include <iostream>
#include <string>

#include "diagnostics.hpp"
#include "evaluator.hpp"

// sysexits.h values
constexpr int EXIT_USAGE = 64;
constexpr int EXIT_DATAERR = 65;
constexpr int EXIT_NOINPUT = 66;
constexpr int EXIT_SOFTWARE = 70;

// Writes every diagnostic as `[line N] Phase error at 'x': msg`, followed by
// the source line and a caret when the location is known.
void print_diagnostics(std::ostream& err, const Diagnostics& diagnostics, bool color);

// Runs a script file in a fresh session and returns the process exit code.
int run_file(const std::string& path,
             const EvaluatorOptions& options,
             std::ostream& out = std::cout,
             std::ostream& err = std::cerr,
             bool color = false);
