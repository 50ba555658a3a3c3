#pragma once

#include "evaluator.hpp"

// Binds the host-provided natives (clock) in the global environment.
void init_globals(EnvPtr env);
