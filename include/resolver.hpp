#pragma once
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "ast.hpp"
#include "diagnostics.hpp"

// Hop counts keyed by node identity: IdentifierNode, AssignmentExpressionNode,
// ThisExpressionNode and SuperExpressionNode. A reference missing from the
// table is a global and is looked up by name at runtime.
using ResolutionTable = std::unordered_map<const ExpressionNode*, int>;

class Resolver {
   public:
    explicit Resolver(Diagnostics& diagnostics);

    // Static pass over the program. Semantic errors go to the diagnostics
    // sink; the walk continues after each one. The AST is not modified.
    // Globals declared by a program that resolves cleanly are remembered for
    // later calls, so a session can redeclare them from their old value.
    ResolutionTable resolve(const ProgramNode* program);

   private:
    enum class FunctionType {
        None,
        Function,
        Method,
        Initializer
    };

    enum class ClassType {
        None,
        Class,
        Subclass
    };

    Diagnostics& diagnostics;
    ResolutionTable table;

    // name -> "initializer finished"
    std::vector<std::unordered_map<std::string, bool>> scopes;

    FunctionType current_function = FunctionType::None;
    ClassType current_class = ClassType::None;
    int loop_depth = 0;

    // global currently inside its own initializer (top-level `var a = a;`)
    const std::string* initializing_global = nullptr;

    std::unordered_set<std::string> declared_globals;  // earlier programs
    std::unordered_set<std::string> pending_globals;   // this program

    void declare_global(const std::string& name);
    bool is_known_global(const std::string& name) const;

    void resolve_statements(const std::vector<std::unique_ptr<StatementNode>>& body);
    void resolve_statement(const StatementNode* stmt);
    void resolve_expression(const ExpressionNode* expr);
    void resolve_function(const FunctionDeclarationNode* fn, FunctionType type);
    void resolve_class(const ClassDeclarationNode* cls);

    void begin_scope();
    void end_scope();
    void declare(const std::string& name);
    void define(const std::string& name);
    void resolve_local(const ExpressionNode* expr, const std::string& name);

    void error(const Token& tok, const std::string& message);
};
