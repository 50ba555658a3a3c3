// src/evaluator/StatementEval.cpp
#include "ClassRuntime.hpp"
#include "LoxError.hpp"
#include "evaluator.hpp"

// Runs statements in env until one of them returns, breaks or continues.
void Evaluator::execute_block(const std::vector<std::unique_ptr<StatementNode>>& body, EnvPtr env, Value* return_value, bool* did_return, LoopControl* lc) {
    for (const auto& s : body) {
        evaluate_statement(s.get(), env, return_value, did_return, lc);
        if (did_return && *did_return) return;
        if (lc && (lc->did_break || lc->did_continue)) return;
    }
}

// Each iteration runs in a fresh copy of the loop scope, so closures created
// in one iteration keep that iteration's binding. The copy for the next
// iteration is taken before the increment runs.
void Evaluator::execute_for(const ForStatementNode* fs, EnvPtr env, Value* return_value, bool* did_return) {
    Heap::RootGuard roots(heap_);
    EnvPtr loop_env = heap_.new_env(env);
    roots.add(loop_env);
    if (fs->init) evaluate_statement(fs->init.get(), loop_env, return_value, did_return);

    EnvPtr iter_env = heap_.copy_env(loop_env);
    while (true) {
        Heap::RootGuard iteration(heap_);
        iteration.add(iter_env);
        maybe_collect();

        if (fs->condition && !to_bool(evaluate_expression(fs->condition.get(), iter_env))) break;

        LoopControl lc;
        evaluate_statement(fs->body.get(), iter_env, return_value, did_return, &lc);
        if (did_return && *did_return) return;
        if (lc.did_break) break;

        EnvPtr next_env = heap_.copy_env(iter_env);
        iteration.add(next_env);
        if (fs->increment) evaluate_expression(fs->increment.get(), next_env);
        iter_env = next_env;
    }
}

void Evaluator::declare_class(const ClassDeclarationNode* cd, EnvPtr env) {
    ClassPtr superclass;
    if (cd->superclass) {
        Value sv = evaluate_expression(cd->superclass.get(), env);
        if (!std::holds_alternative<ClassPtr>(sv)) {
            throw LoxError("TypeError", "Superclass must be a class.", cd->superclass->token.loc);
        }
        superclass = std::get<ClassPtr>(sv);
    }

    env->define(cd->name, std::monostate{});

    // methods of a subclass close over a scope that holds `super`
    EnvPtr method_env = env;
    if (superclass) {
        method_env = heap_.new_env(env);
        method_env->define("super", superclass);
    }

    auto cls = std::make_shared<ClassValue>();
    cls->name = cd->name;
    cls->super = superclass;
    cls->token = cd->token;

    for (const auto& m : cd->methods) {
        bool is_init = m->name == "init";
        cls->methods[m->name] = std::make_shared<FunctionValue>(m.get(), method_env, is_init);
    }

    env->define(cd->name, cls);
}

void Evaluator::evaluate_statement(const StatementNode* stmt, EnvPtr env, Value* return_value, bool* did_return, LoopControl* lc) {
    if (!stmt) return;

    if (auto es = dynamic_cast<const ExpressionStatementNode*>(stmt)) {
        evaluate_expression(es->expression.get(), env);
        return;
    }

    if (auto ps = dynamic_cast<const PrintStatementNode*>(stmt)) {
        Value v = evaluate_expression(ps->expression.get(), env);
        out << value_to_string(v) << "\n";
        return;
    }

    if (auto vd = dynamic_cast<const VariableDeclarationNode*>(stmt)) {
        Value v = std::monostate{};
        if (vd->value) v = evaluate_expression(vd->value.get(), env);
        env->define(vd->identifier, v);
        return;
    }

    if (auto bs = dynamic_cast<const BlockStatementNode*>(stmt)) {
        EnvPtr block_env = heap_.new_env(env);
        Heap::RootGuard roots(heap_);
        roots.add(block_env);
        execute_block(bs->body, block_env, return_value, did_return, lc);
        return;
    }

    if (auto is = dynamic_cast<const IfStatementNode*>(stmt)) {
        if (to_bool(evaluate_expression(is->condition.get(), env))) {
            evaluate_statement(is->then_branch.get(), env, return_value, did_return, lc);
        } else if (is->else_branch) {
            evaluate_statement(is->else_branch.get(), env, return_value, did_return, lc);
        }
        return;
    }

    if (auto ws = dynamic_cast<const WhileStatementNode*>(stmt)) {
        while (true) {
            maybe_collect();
            if (!to_bool(evaluate_expression(ws->condition.get(), env))) break;
            LoopControl loop_lc;
            evaluate_statement(ws->body.get(), env, return_value, did_return, &loop_lc);
            if (did_return && *did_return) return;
            if (loop_lc.did_break) break;
        }
        return;
    }

    if (auto fs = dynamic_cast<const ForStatementNode*>(stmt)) {
        execute_for(fs, env, return_value, did_return);
        return;
    }

    if (dynamic_cast<const BreakStatementNode*>(stmt)) {
        if (lc) lc->did_break = true;
        return;
    }

    if (dynamic_cast<const ContinueStatementNode*>(stmt)) {
        if (lc) lc->did_continue = true;
        return;
    }

    if (auto fd = dynamic_cast<const FunctionDeclarationNode*>(stmt)) {
        auto fn = std::make_shared<FunctionValue>(fd, env, false);
        env->define(fd->name, fn);
        return;
    }

    if (auto rs = dynamic_cast<const ReturnStatementNode*>(stmt)) {
        Value v = std::monostate{};
        if (rs->value) v = evaluate_expression(rs->value.get(), env);
        if (return_value) *return_value = v;
        if (did_return) *did_return = true;
        return;
    }

    if (auto cd = dynamic_cast<const ClassDeclarationNode*>(stmt)) {
        declare_class(cd, env);
        return;
    }

    throw LoxError("SyntaxError", "Unsupported statement: " + stmt->to_string(), stmt->token.loc);
}
