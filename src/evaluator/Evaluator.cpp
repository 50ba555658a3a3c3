// src/evaluator/Evaluator.cpp
#include <algorithm>

#include "evaluator.hpp"

#include "globals.hpp"

// Cycles between closures and their scopes are broken here; without it the
// global scope and everything it reaches would outlive the evaluator.
Evaluator::~Evaluator() {
    heap_.release_all();
}

Evaluator::Evaluator(std::ostream& out, EvaluatorOptions options)
    : out(out), options_(options) {
    options_.max_call_depth = std::max(1, std::min(options_.max_call_depth, kMaxCallDepthLimit));
    global_env = heap_.new_env(nullptr);
    init_globals(global_env);
}

// ----------------- Program evaluation -----------------
void Evaluator::evaluate(const ProgramNode* program, const ResolutionTable& resolutions) {
    if (!program) return;

    for (const auto& entry : resolutions) locals[entry.first] = entry.second;

    // a failed previous run may have unwound mid-call
    depth = 0;

    Value dummy_ret;
    bool did_return = false;

    for (const auto& stmt_uptr : program->body) {
        maybe_collect();
        evaluate_statement(stmt_uptr.get(), global_env, &dummy_ret, &did_return);
        if (did_return) break;
    }
}

void Evaluator::maybe_collect() {
    if (heap_.should_collect()) heap_.collect(global_env);
}

size_t Evaluator::collect_garbage() {
    return heap_.collect(global_env);
}
