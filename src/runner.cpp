#include "runner.hpp"

#include <uv.h>

#include <exception>
#include <stdexcept>

#include "LoxError.hpp"
#include "lexer.hpp"
#include "parser.hpp"
#include "resolver.hpp"

namespace {

// Native stack for one evaluation: a fixed base for expression nesting plus
// room for every Lox call frame up to the depth limit.
constexpr size_t kEvalStackBase = 8u * 1024 * 1024;
constexpr size_t kEvalStackPerCall = 32u * 1024;

struct EvalTask {
    Evaluator* evaluator;
    const ProgramNode* program;
    const ResolutionTable* resolutions;
    std::exception_ptr error;
};

// Errors cross back to the joining thread through exception_ptr.
void run_eval_task(void* arg) {
    auto* task = static_cast<EvalTask*>(arg);
    try {
        task->evaluator->evaluate(task->program, *task->resolutions);
    } catch (...) {
        task->error = std::current_exception();
    }
}

}  // namespace

size_t evaluation_stack_size(int max_call_depth) {
    return kEvalStackBase + static_cast<size_t>(max_call_depth) * kEvalStackPerCall;
}

Runner::Runner(std::ostream& out, EvaluatorOptions options)
    : resolver_(diagnostics_), evaluator_(out, options) {}

RunStatus Runner::run(const std::string& source, const std::string& filename) {
    diagnostics_.clear();

    sources_.push_back(std::make_unique<SourceManager>(filename, source));
    const SourceManager* mgr = sources_.back().get();

    Lexer lexer(source, filename, diagnostics_, mgr);
    std::vector<Token> tokens = lexer.tokenize();
    if (diagnostics_.has_errors()) return RunStatus::StaticError;

    Parser parser(tokens, diagnostics_);
    std::unique_ptr<ProgramNode> program = parser.parse();
    if (diagnostics_.has_errors()) return RunStatus::StaticError;

    ResolutionTable resolutions = resolver_.resolve(program.get());
    if (diagnostics_.has_errors()) return RunStatus::StaticError;

    programs_.push_back(std::move(program));

    // The tree walk recurses once per Lox call, so it runs on a thread whose
    // stack fits max_call_depth frames; the depth check fires before the
    // native stack runs out.
    EvalTask task{&evaluator_, programs_.back().get(), &resolutions, nullptr};
    uv_thread_options_t thread_options;
    thread_options.flags = UV_THREAD_HAS_STACK_SIZE;
    thread_options.stack_size = evaluation_stack_size(evaluator_.options().max_call_depth);

    uv_thread_t thread;
    int rc = uv_thread_create_ex(&thread, &thread_options, run_eval_task, &task);
    if (rc != 0) {
        diagnostics_.report(Phase::Runtime, 0, std::string("InternalError: cannot start evaluation thread: ") + uv_strerror(rc));
        return RunStatus::RuntimeError;
    }
    uv_thread_join(&thread);

    try {
        if (task.error) std::rethrow_exception(task.error);
    } catch (const LoxError& e) {
        diagnostics_.report(Phase::Runtime, e.location(), e.type() + ": " + e.message());
        return RunStatus::RuntimeError;
    } catch (const std::logic_error& e) {
        diagnostics_.report(Phase::Runtime, 0, std::string("InternalError: ") + e.what());
        return RunStatus::RuntimeError;
    }

    return RunStatus::Ok;
}
