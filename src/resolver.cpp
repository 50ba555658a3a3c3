#include "resolver.hpp"

Resolver::Resolver(Diagnostics& diagnostics) : diagnostics(diagnostics) {}

ResolutionTable Resolver::resolve(const ProgramNode* program) {
    table.clear();
    scopes.clear();
    current_function = FunctionType::None;
    current_class = ClassType::None;
    loop_depth = 0;
    initializing_global = nullptr;
    pending_globals.clear();

    size_t errors_before = diagnostics.count();
    if (program) resolve_statements(program->body);

    if (diagnostics.count() == errors_before) {
        declared_globals.insert(pending_globals.begin(), pending_globals.end());
    }
    pending_globals.clear();
    return table;
}

void Resolver::declare_global(const std::string& name) {
    if (scopes.empty()) pending_globals.insert(name);
}

bool Resolver::is_known_global(const std::string& name) const {
    return declared_globals.count(name) || pending_globals.count(name);
}

void Resolver::error(const Token& tok, const std::string& message) {
    diagnostics.report(Phase::Semantic, tok, message);
}

// ----------------- scopes -----------------

void Resolver::begin_scope() {
    scopes.emplace_back();
}

void Resolver::end_scope() {
    scopes.pop_back();
}

// Re-declaring a name in the same scope is allowed; the entry is simply
// marked as not ready again.
void Resolver::declare(const std::string& name) {
    if (scopes.empty()) return;
    scopes.back()[name] = false;
}

void Resolver::define(const std::string& name) {
    if (scopes.empty()) return;
    scopes.back()[name] = true;
}

void Resolver::resolve_local(const ExpressionNode* expr, const std::string& name) {
    for (int i = static_cast<int>(scopes.size()) - 1; i >= 0; --i) {
        if (scopes[i].count(name)) {
            table[expr] = static_cast<int>(scopes.size()) - 1 - i;
            return;
        }
    }
    // not found: global
}

// ----------------- statements -----------------

void Resolver::resolve_statements(const std::vector<std::unique_ptr<StatementNode>>& body) {
    for (const auto& stmt : body) resolve_statement(stmt.get());
}

void Resolver::resolve_statement(const StatementNode* stmt) {
    if (!stmt) return;

    if (auto es = dynamic_cast<const ExpressionStatementNode*>(stmt)) {
        resolve_expression(es->expression.get());
        return;
    }

    if (auto ps = dynamic_cast<const PrintStatementNode*>(stmt)) {
        resolve_expression(ps->expression.get());
        return;
    }

    if (auto vd = dynamic_cast<const VariableDeclarationNode*>(stmt)) {
        declare(vd->identifier);
        if (vd->value) {
            const std::string* saved = initializing_global;
            if (scopes.empty()) initializing_global = &vd->identifier;
            resolve_expression(vd->value.get());
            initializing_global = saved;
        }
        define(vd->identifier);
        declare_global(vd->identifier);
        return;
    }

    if (auto bs = dynamic_cast<const BlockStatementNode*>(stmt)) {
        begin_scope();
        resolve_statements(bs->body);
        end_scope();
        return;
    }

    if (auto is = dynamic_cast<const IfStatementNode*>(stmt)) {
        resolve_expression(is->condition.get());
        resolve_statement(is->then_branch.get());
        if (is->else_branch) resolve_statement(is->else_branch.get());
        return;
    }

    if (auto ws = dynamic_cast<const WhileStatementNode*>(stmt)) {
        resolve_expression(ws->condition.get());
        ++loop_depth;
        resolve_statement(ws->body.get());
        --loop_depth;
        return;
    }

    // the loop scope holds the initializer's variable; per-iteration copies
    // at runtime sit at the same depth
    if (auto fs = dynamic_cast<const ForStatementNode*>(stmt)) {
        begin_scope();
        if (fs->init) resolve_statement(fs->init.get());
        if (fs->condition) resolve_expression(fs->condition.get());
        if (fs->increment) resolve_expression(fs->increment.get());
        ++loop_depth;
        resolve_statement(fs->body.get());
        --loop_depth;
        end_scope();
        return;
    }

    if (dynamic_cast<const BreakStatementNode*>(stmt)) {
        if (loop_depth == 0) error(stmt->token, "Can't use 'break' outside of a loop.");
        return;
    }

    if (dynamic_cast<const ContinueStatementNode*>(stmt)) {
        if (loop_depth == 0) error(stmt->token, "Can't use 'continue' outside of a loop.");
        return;
    }

    if (auto fd = dynamic_cast<const FunctionDeclarationNode*>(stmt)) {
        // defined before the body so the function can refer to itself
        declare(fd->name);
        define(fd->name);
        declare_global(fd->name);
        resolve_function(fd, FunctionType::Function);
        return;
    }

    if (auto rs = dynamic_cast<const ReturnStatementNode*>(stmt)) {
        if (current_function == FunctionType::None) {
            error(rs->token, "Can't return from top-level code.");
        }
        if (rs->value) {
            if (current_function == FunctionType::Initializer) {
                error(rs->token, "Can't return a value from an initializer.");
            }
            resolve_expression(rs->value.get());
        }
        return;
    }

    if (auto cd = dynamic_cast<const ClassDeclarationNode*>(stmt)) {
        resolve_class(cd);
        return;
    }
}

void Resolver::resolve_function(const FunctionDeclarationNode* fn, FunctionType type) {
    FunctionType enclosing_function = current_function;
    int enclosing_loop_depth = loop_depth;
    current_function = type;
    loop_depth = 0;

    // parameters and body share one scope, as they do at runtime
    begin_scope();
    for (const auto& param : fn->params) {
        declare(param.value);
        define(param.value);
    }
    resolve_statements(fn->body);
    end_scope();

    current_function = enclosing_function;
    loop_depth = enclosing_loop_depth;
}

void Resolver::resolve_class(const ClassDeclarationNode* cls) {
    ClassType enclosing_class = current_class;
    current_class = ClassType::Class;

    declare(cls->name);
    define(cls->name);
    declare_global(cls->name);

    if (cls->superclass) {
        if (cls->superclass->name == cls->name) {
            error(cls->superclass->token, "A class can't inherit from itself.");
        }
        current_class = ClassType::Subclass;
        resolve_expression(cls->superclass.get());

        begin_scope();
        scopes.back()["super"] = true;
    }

    begin_scope();
    scopes.back()["this"] = true;

    for (const auto& method : cls->methods) {
        FunctionType type = method->name == "init" ? FunctionType::Initializer : FunctionType::Method;
        resolve_function(method.get(), type);
    }

    end_scope();
    if (cls->superclass) end_scope();

    current_class = enclosing_class;
}

// ----------------- expressions -----------------

void Resolver::resolve_expression(const ExpressionNode* expr) {
    if (!expr) return;

    if (auto id = dynamic_cast<const IdentifierNode*>(expr)) {
        if (!scopes.empty()) {
            auto it = scopes.back().find(id->name);
            if (it != scopes.back().end() && !it->second) {
                error(id->token, "Can't read local variable in its own initializer.");
            }
        } else if (initializing_global && *initializing_global == id->name && !is_known_global(id->name)) {
            error(id->token, "Can't read local variable in its own initializer.");
        }
        resolve_local(id, id->name);
        return;
    }

    if (auto asn = dynamic_cast<const AssignmentExpressionNode*>(expr)) {
        resolve_expression(asn->value.get());
        resolve_local(asn, asn->name);
        return;
    }

    if (auto g = dynamic_cast<const GroupingNode*>(expr)) {
        resolve_expression(g->expression.get());
        return;
    }

    if (auto u = dynamic_cast<const UnaryExpressionNode*>(expr)) {
        resolve_expression(u->operand.get());
        return;
    }

    if (auto b = dynamic_cast<const BinaryExpressionNode*>(expr)) {
        resolve_expression(b->left.get());
        resolve_expression(b->right.get());
        return;
    }

    if (auto l = dynamic_cast<const LogicalExpressionNode*>(expr)) {
        resolve_expression(l->left.get());
        resolve_expression(l->right.get());
        return;
    }

    if (auto call = dynamic_cast<const CallExpressionNode*>(expr)) {
        resolve_expression(call->callee.get());
        for (const auto& arg : call->arguments) resolve_expression(arg.get());
        return;
    }

    if (auto mem = dynamic_cast<const MemberExpressionNode*>(expr)) {
        resolve_expression(mem->object.get());
        return;
    }

    if (auto ma = dynamic_cast<const MemberAssignmentNode*>(expr)) {
        resolve_expression(ma->value.get());
        resolve_expression(ma->object.get());
        return;
    }

    if (auto th = dynamic_cast<const ThisExpressionNode*>(expr)) {
        if (current_class == ClassType::None) {
            error(th->token, "Can't use 'this' outside of a class.");
            return;
        }
        resolve_local(th, "this");
        return;
    }

    if (auto sup = dynamic_cast<const SuperExpressionNode*>(expr)) {
        if (current_class == ClassType::None) {
            error(sup->token, "Can't use 'super' outside of a class.");
            return;
        }
        if (current_class != ClassType::Subclass) {
            error(sup->token, "Can't use 'super' in a class with no superclass.");
            return;
        }
        resolve_local(sup, "super");
        return;
    }

    // literals: nothing to resolve
}
