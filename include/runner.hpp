#pragma once
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "SourceManager.hpp"
#include "ast.hpp"
#include "diagnostics.hpp"
#include "evaluator.hpp"
#include "resolver.hpp"

enum class RunStatus {
    Ok,
    StaticError,   // lexical, syntax or semantic errors; nothing was executed
    RuntimeError   // execution stopped at the first runtime error
};

// One interpreter session: lex, parse, resolve and evaluate source units
// against a shared global environment.
class Runner {
   public:
    explicit Runner(std::ostream& out = std::cout, EvaluatorOptions options = {});

    RunStatus run(const std::string& source, const std::string& filename = "<script>");

    // diagnostics of the most recent run
    const Diagnostics& diagnostics() const { return diagnostics_; }
    Evaluator& evaluator() { return evaluator_; }

   private:
    Diagnostics diagnostics_;
    // one resolver per session: it remembers the globals earlier runs declared
    Resolver resolver_;
    // Kept for the whole session: functions and classes point into the
    // trees, and token locations point at the source managers.
    std::vector<std::unique_ptr<SourceManager>> sources_;
    std::vector<std::unique_ptr<ProgramNode>> programs_;
    Evaluator evaluator_;
};

// Stack size of the thread a run evaluates on.
size_t evaluation_stack_size(int max_call_depth);
