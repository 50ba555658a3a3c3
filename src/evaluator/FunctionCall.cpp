// src/evaluator/FunctionCall.cpp
#include "ClassRuntime.hpp"
#include "LoxError.hpp"
#include "evaluator.hpp"

namespace {

// Counts active calls for the lifetime of one call frame.
class CallDepthGuard {
   public:
    CallDepthGuard(int& depth, int max_depth, const Token& callToken) : depth_(depth) {
        if (depth_ >= max_depth) {
            throw LoxError("StackOverflowError", "Stack overflow.", callToken.loc);
        }
        ++depth_;
    }
    ~CallDepthGuard() { --depth_; }

    CallDepthGuard(const CallDepthGuard&) = delete;
    CallDepthGuard& operator=(const CallDepthGuard&) = delete;

   private:
    int& depth_;
};

void check_arity(int expected, size_t got, const Token& callToken) {
    if (static_cast<size_t>(expected) != got) {
        throw LoxError("ArityError",
            "Expected " + std::to_string(expected) + " arguments but got " + std::to_string(got) + ".",
            callToken.loc);
    }
}

}  // namespace

FunctionPtr Evaluator::bind_method(const FunctionPtr& method, const InstancePtr& instance) {
    EnvPtr env = heap_.new_env(method->closure);
    env->define("this", instance);

    auto bound = std::make_shared<FunctionValue>(method->declaration, env, method->is_initializer);
    bound->receiver = instance;
    return bound;
}

Value Evaluator::call_value(const Value& callee, const std::vector<Value>& args, const Token& callToken) {
    if (std::holds_alternative<FunctionPtr>(callee)) {
        FunctionPtr fn = std::get<FunctionPtr>(callee);
        check_arity(fn->arity(), args.size(), callToken);
        return call_function(fn, args, callToken);
    }

    if (std::holds_alternative<ClassPtr>(callee)) {
        return instantiate(std::get<ClassPtr>(callee), args, callToken);
    }

    throw LoxError("TypeError", "Can only call functions and classes.", callToken.loc);
}

// A fresh scope chained to the closure, not to the caller.
Value Evaluator::call_function(FunctionPtr fn, const std::vector<Value>& args, const Token& callToken) {
    if (!fn) throw LoxError("TypeError", "Can only call functions and classes.", callToken.loc);

    CallDepthGuard guard(depth, options_.max_call_depth, callToken);

    if (fn->is_native) {
        return fn->native_impl(args, global_env, callToken);
    }

    EnvPtr local = heap_.new_env(fn->closure);
    const auto& params = fn->declaration->params;
    for (size_t i = 0; i < params.size() && i < args.size(); ++i) {
        local->define(params[i].value, args[i]);
    }

    // the callee and its arguments are reachable through `local` from here on
    Heap::RootGuard roots(heap_);
    roots.add(local);
    maybe_collect();

    Value ret_val = std::monostate{};
    bool did_return = false;
    execute_block(fn->declaration->body, local, &ret_val, &did_return, nullptr);

    // initializers always produce the instance, even through a bare `return;`
    if (fn->is_initializer) {
        return fn->closure->get_at(0, "this");
    }
    return ret_val;
}

Value Evaluator::instantiate(ClassPtr cls, const std::vector<Value>& args, const Token& callToken) {
    check_arity(cls->arity(), args.size(), callToken);

    InstancePtr instance = heap_.new_instance(cls);

    FunctionPtr init = cls->find_method("init");
    if (init) {
        call_function(bind_method(init, instance), args, callToken);
    }

    return instance;
}
