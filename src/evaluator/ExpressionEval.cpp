// src/evaluator/ExpressionEval.cpp
#include <cmath>

#include "ClassRuntime.hpp"
#include "LoxError.hpp"
#include "evaluator.hpp"

// ----------------- Variable access -----------------

Value Evaluator::lookup_variable(const ExpressionNode* expr, const std::string& name, EnvPtr env, const Token& tok) {
    auto it = locals.find(expr);
    if (it != locals.end()) {
        return env->get_at(it->second, name);
    }

    Value* global = global_env->find(name);
    if (!global) {
        throw LoxError("ReferenceError", "Undefined variable '" + name + "'.", tok.loc);
    }
    return *global;
}

void Evaluator::assign_variable(const ExpressionNode* expr, const std::string& name, const Value& value, EnvPtr env, const Token& tok) {
    auto it = locals.find(expr);
    if (it != locals.end()) {
        env->assign_at(it->second, name, value);
        return;
    }

    Value* global = global_env->find(name);
    if (!global) {
        throw LoxError("ReferenceError", "Undefined variable '" + name + "'.", tok.loc);
    }
    *global = value;
}

// Fields shadow methods. Methods come back bound to the instance.
Value Evaluator::get_property(const Value& object, const std::string& name, const Token& tok) {
    if (!std::holds_alternative<InstancePtr>(object)) {
        throw LoxError("TypeError", "Only instances have properties.", tok.loc);
    }
    InstancePtr inst = std::get<InstancePtr>(object);

    auto fit = inst->fields.find(name);
    if (fit != inst->fields.end()) return fit->second;

    FunctionPtr method = inst->klass ? inst->klass->find_method(name) : nullptr;
    if (method) return bind_method(method, inst);

    throw LoxError("ReferenceError", "Undefined property '" + name + "'.", tok.loc);
}

// ----------------- Expression evaluation -----------------

Value Evaluator::evaluate_expression(const ExpressionNode* expr, EnvPtr env) {
    if (!expr) return std::monostate{};

    if (auto n = dynamic_cast<const NumericLiteralNode*>(expr)) {
        return n->value;
    }
    if (auto s = dynamic_cast<const StringLiteralNode*>(expr)) {
        return s->value;
    }
    if (auto b = dynamic_cast<const BooleanLiteralNode*>(expr)) {
        return b->value;
    }
    if (dynamic_cast<const NullNode*>(expr)) {
        return std::monostate{};
    }

    if (auto g = dynamic_cast<const GroupingNode*>(expr)) {
        return evaluate_expression(g->expression.get(), env);
    }

    if (auto id = dynamic_cast<const IdentifierNode*>(expr)) {
        return lookup_variable(id, id->name, env, id->token);
    }

    if (auto asn = dynamic_cast<const AssignmentExpressionNode*>(expr)) {
        Value value = evaluate_expression(asn->value.get(), env);
        assign_variable(asn, asn->name, value, env, asn->token);
        return value;
    }

    if (auto u = dynamic_cast<const UnaryExpressionNode*>(expr)) {
        Value operand = evaluate_expression(u->operand.get(), env);
        if (u->op == "-") {
            return -to_number(operand, u->token);
        }
        // "!"
        return !to_bool(operand);
    }

    // and / or yield one of their operands, not a coerced bool
    if (auto l = dynamic_cast<const LogicalExpressionNode*>(expr)) {
        Value left = evaluate_expression(l->left.get(), env);
        if (l->op == "or") {
            if (to_bool(left)) return left;
        } else {
            if (!to_bool(left)) return left;
        }
        return evaluate_expression(l->right.get(), env);
    }

    if (auto b = dynamic_cast<const BinaryExpressionNode*>(expr)) {
        Heap::RootGuard roots(heap_);
        Value left = evaluate_expression(b->left.get(), env);
        roots.add(left);
        Value right = evaluate_expression(b->right.get(), env);
        const std::string& op = b->op;

        if (op == "==") return is_equal(left, right);
        if (op == "!=") return !is_equal(left, right);

        if (op == "+") {
            if (std::holds_alternative<double>(left) && std::holds_alternative<double>(right)) {
                return std::get<double>(left) + std::get<double>(right);
            }
            if (std::holds_alternative<std::string>(left) && std::holds_alternative<std::string>(right)) {
                return std::get<std::string>(left) + std::get<std::string>(right);
            }
            throw LoxError("TypeError", "Operands must be two numbers or two strings.", b->token.loc);
        }

        if (!std::holds_alternative<double>(left) || !std::holds_alternative<double>(right)) {
            throw LoxError("TypeError", "Operands must be numbers.", b->token.loc);
        }
        double x = std::get<double>(left);
        double y = std::get<double>(right);

        if (op == "-") return x - y;
        if (op == "*") return x * y;
        if (op == "/") {
            if (y == 0.0) {
                throw LoxError("ZeroDivisionError", "Division by zero.", b->token.loc);
            }
            return x / y;
        }
        if (op == ">") return x > y;
        if (op == ">=") return x >= y;
        if (op == "<") return x < y;
        if (op == "<=") return x <= y;

        throw LoxError("SyntaxError", "Unknown binary operator '" + op + "'.", b->token.loc);
    }

    if (auto call = dynamic_cast<const CallExpressionNode*>(expr)) {
        // callee and evaluated arguments stay rooted while later ones run
        Heap::RootGuard roots(heap_);
        Value callee = evaluate_expression(call->callee.get(), env);
        roots.add(callee);

        std::vector<Value> args;
        args.reserve(call->arguments.size());
        for (const auto& arg : call->arguments) {
            args.push_back(evaluate_expression(arg.get(), env));
            roots.add(args.back());
        }

        return call_value(callee, args, call->token);
    }

    if (auto mem = dynamic_cast<const MemberExpressionNode*>(expr)) {
        Value object = evaluate_expression(mem->object.get(), env);
        return get_property(object, mem->property, mem->token);
    }

    if (auto ma = dynamic_cast<const MemberAssignmentNode*>(expr)) {
        Heap::RootGuard roots(heap_);
        Value object = evaluate_expression(ma->object.get(), env);
        if (!std::holds_alternative<InstancePtr>(object)) {
            throw LoxError("TypeError", "Only instances have fields.", ma->token.loc);
        }
        roots.add(object);
        Value value = evaluate_expression(ma->value.get(), env);
        std::get<InstancePtr>(object)->fields[ma->property] = value;
        return value;
    }

    if (auto th = dynamic_cast<const ThisExpressionNode*>(expr)) {
        return lookup_variable(th, "this", env, th->token);
    }

    // `super` sits one scope above `this` in a method's closure chain
    if (auto sup = dynamic_cast<const SuperExpressionNode*>(expr)) {
        auto it = locals.find(sup);
        if (it == locals.end()) {
            throw LoxError("ReferenceError", "Can't use 'super' outside of a class.", sup->token.loc);
        }
        int distance = it->second;
        Value superclass = env->get_at(distance, "super");
        Value receiver = env->get_at(distance - 1, "this");

        ClassPtr cls = std::get<ClassPtr>(superclass);
        FunctionPtr method = cls ? cls->find_method(sup->method) : nullptr;
        if (!method) {
            throw LoxError("ReferenceError", "Undefined property '" + sup->method + "'.", sup->token.loc);
        }
        return bind_method(method, std::get<InstancePtr>(receiver));
    }

    throw LoxError("SyntaxError", "Unsupported expression: " + expr->to_string(), expr->token.loc);
}
