#include "diagnostics.hpp"

#include <algorithm>

const char* phase_name(Phase phase) {
    switch (phase) {
        case Phase::Lexical:
            return "Lexical";
        case Phase::Syntax:
            return "Syntax";
        case Phase::Semantic:
            return "Semantic";
        case Phase::Runtime:
            return "Runtime";
    }
    return "Unknown";
}

std::string Diagnostic::to_string() const {
    return "[line " + std::to_string(line) + "] " + phase_name(phase) + " error" + where + ": " + message;
}

void Diagnostics::report(Phase phase, int line, const std::string& message, const std::string& where) {
    Diagnostic d;
    d.phase = phase;
    d.line = line;
    d.where = where;
    d.message = message;
    d.loc.line = line;
    d.loc.col = 0;
    entries.push_back(std::move(d));
}

void Diagnostics::report(Phase phase, const Token& token, const std::string& message) {
    Diagnostic d;
    d.phase = phase;
    d.line = token.line();
    d.where = token.type == TokenType::EOF_TOKEN ? " at end" : " at '" + token.value + "'";
    d.message = message;
    d.loc = token.loc;
    entries.push_back(std::move(d));
}

void Diagnostics::report(Phase phase, const TokenLocation& loc, const std::string& message) {
    Diagnostic d;
    d.phase = phase;
    d.line = loc.line;
    d.message = message;
    d.loc = loc;
    entries.push_back(std::move(d));
}

bool Diagnostics::has_errors(Phase phase) const {
    return std::any_of(entries.begin(), entries.end(), [phase](const Diagnostic& d) { return d.phase == phase; });
}

size_t Diagnostics::count(Phase phase) const {
    return static_cast<size_t>(std::count_if(entries.begin(), entries.end(), [phase](const Diagnostic& d) { return d.phase == phase; }));
}
