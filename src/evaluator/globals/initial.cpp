#include <uv.h>

#include <functional>

#include "evaluator.hpp"
#include "globals.hpp"
#include "token.hpp"

// clock(): seconds from the libuv monotonic high-resolution clock
static Value builtin_clock(const std::vector<Value>& /*args*/, EnvPtr /*env*/, const Token& /*tok*/) {
    return Value{static_cast<double>(uv_hrtime()) / 1e9};
}

void init_globals(EnvPtr env) {
    if (!env) return;

    auto add_fn = [&](const std::string& name, int arity, NativeImpl impl) {
        auto fn = std::make_shared<FunctionValue>(name, arity, impl, env, Token{});
        env->define(name, fn);
    };

    add_fn("clock", 0, builtin_clock);
}
