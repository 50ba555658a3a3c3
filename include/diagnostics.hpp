#pragma once
#include <string>
#include <vector>

#include "token.hpp"

// Pipeline stage that produced a diagnostic
enum class Phase {
    Lexical,
    Syntax,
    Semantic,
    Runtime
};

const char* phase_name(Phase phase);

struct Diagnostic {
    Phase phase = Phase::Syntax;
    int line = 0;
    std::string where;  // " at 'x'", " at end" or empty
    std::string message;
    TokenLocation loc;  // may carry a source manager for the caret trace

    // "[line 3] Syntax error at ';': Expect expression."
    std::string to_string() const;
};

// Accumulates diagnostics for a run. It never decides to abort; the caller
// inspects has_errors() between stages.
class Diagnostics {
   public:
    void report(Phase phase, int line, const std::string& message, const std::string& where = "");
    void report(Phase phase, const Token& token, const std::string& message);
    void report(Phase phase, const TokenLocation& loc, const std::string& message);

    bool has_errors() const { return !entries.empty(); }
    bool has_errors(Phase phase) const;
    size_t count() const { return entries.size(); }
    size_t count(Phase phase) const;

    const std::vector<Diagnostic>& all() const { return entries; }
    void clear() { entries.clear(); }

   private:
    std::vector<Diagnostic> entries;
};
