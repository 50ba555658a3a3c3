#pragma once
#include "evaluator.hpp"
#include "linenoise.h"

// Interactive prompt: one session for every line, with history kept in
// ~/.lox_history. Errors are shown and the prompt goes on.
void run_repl_mode(const EvaluatorOptions& options, bool color);
