#pragma once

#include <functional>
#include <iostream>
#include <memory>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

#include "ast.hpp"
#include "resolver.hpp"
#include "token.hpp"

// Forward declaration
class Environment;

// Our language's value types
struct FunctionValue;
using FunctionPtr = std::shared_ptr<FunctionValue>;

// Environment
using EnvPtr = std::shared_ptr<Environment>;

struct ClassValue;
using ClassPtr = std::shared_ptr<ClassValue>;

struct InstanceValue;
using InstancePtr = std::shared_ptr<InstanceValue>;

// monostate is nil. Functions, classes and instances compare by identity.
using Value = std::variant<
    std::monostate,
    bool,
    double,
    std::string,
    FunctionPtr,
    ClassPtr,
    InstancePtr>;

using NativeImpl = std::function<Value(const std::vector<Value>&, EnvPtr, const Token&)>;

// User functions, bound methods and host-provided natives.
struct FunctionValue {
    std::string name;
    // Not owned: the program that declared it must outlive the function.
    const FunctionDeclarationNode* declaration = nullptr;
    EnvPtr closure;
    Token token;
    bool is_initializer = false;
    InstancePtr receiver;  // set on bound methods
    bool is_native = false;
    int native_arity = 0;
    NativeImpl native_impl;

    FunctionValue(
        const FunctionDeclarationNode* decl,
        const EnvPtr& env,
        bool initializer) : name(decl ? decl->name : ""),
                            declaration(decl),
                            closure(env),
                            token(decl ? decl->token : Token{}),
                            is_initializer(initializer),
                            is_native(false) {
    }

    FunctionValue(
        const std::string& nm,
        int arity,
        NativeImpl impl,
        const EnvPtr& env,
        const Token& tok) : name(nm),
                            closure(env),
                            token(tok),
                            is_native(true),
                            native_arity(arity),
                            native_impl(std::move(impl)) {
    }

    int arity() const {
        if (is_native) return native_arity;
        return declaration ? static_cast<int>(declaration->params.size()) : 0;
    }
};

class Environment : public std::enable_shared_from_this<Environment> {
   public:
    Environment(EnvPtr parent = nullptr) : parent(parent) {
    }

    // map from name -> value
    std::unordered_map<std::string, Value> values;
    EnvPtr parent;

    // pointer to the value (searches up the chain), nullptr if not found
    Value* find(const std::string& name);

    // define in the current environment (creates or replaces)
    void define(const std::string& name, const Value& value);

    // the environment exactly `distance` links up the chain
    Environment* ancestor(int distance);

    // Resolved access. Throws std::logic_error if the resolver and the
    // runtime chain disagree.
    Value& get_at(int distance, const std::string& name);
    void assign_at(int distance, const std::string& name, const Value& value);
};

// Tracks every environment and instance the evaluator creates. A function
// stored in the scope it closes over is a reference cycle, so reference
// counting alone never frees it. collect() marks everything reachable from
// the globals and the registered roots and breaks the cycles of the rest.
//
// The C++ stack is not scanned: a Value or scope held across a call that may
// collect has to be registered through a RootGuard.
class Heap {
   public:
    EnvPtr new_env(EnvPtr parent);
    // sibling scope with the same parent and a copy of the bindings
    EnvPtr copy_env(const EnvPtr& env);
    InstancePtr new_instance(ClassPtr klass);

    // Temporary roots, released when the guard goes out of scope.
    class RootGuard {
       public:
        explicit RootGuard(Heap& heap);
        ~RootGuard();
        RootGuard(const RootGuard&) = delete;
        RootGuard& operator=(const RootGuard&) = delete;

        void add(const EnvPtr& env);
        void add(const Value& value);

       private:
        Heap& heap_;
        size_t env_mark_;
        size_t value_mark_;
    };

    bool should_collect() const { return allocations_since_collect >= collect_threshold; }

    // Returns how many unreachable objects had their references dropped.
    size_t collect(const EnvPtr& globals);

    // Drops the references of every tracked object; used on shutdown.
    void release_all();

    size_t live_environments() const;
    size_t live_instances() const;
    size_t root_count() const { return env_roots.size() + value_roots.size(); }

   private:
    static constexpr size_t kMinCollectThreshold = 4096;

    std::vector<std::weak_ptr<Environment>> envs;
    std::vector<std::weak_ptr<InstanceValue>> instances;
    std::vector<EnvPtr> env_roots;
    std::vector<Value> value_roots;
    size_t allocations_since_collect = 0;
    size_t collect_threshold = kMinCollectThreshold;

    void track_allocation();
};

struct LoopControl {
    bool did_break = false;
    bool did_continue = false;
};

// Largest accepted max_call_depth. The evaluation thread's stack is sized
// from the depth, so the cap also bounds that allocation.
constexpr int kMaxCallDepthLimit = 10000;

struct EvaluatorOptions {
    int max_call_depth = 256;
};

class Evaluator {
   public:
    explicit Evaluator(std::ostream& out = std::cout, EvaluatorOptions options = {});
    ~Evaluator();

    // Executes a resolved program against the global environment. The
    // resolutions are merged into the evaluator's table, so earlier programs
    // (and the closures they created) stay valid. Throws LoxError on the
    // first runtime error.
    void evaluate(const ProgramNode* program, const ResolutionTable& resolutions);

    std::string value_to_string(const Value& v) const;

    EnvPtr globals() const { return global_env; }
    int call_depth() const { return depth; }
    const EvaluatorOptions& options() const { return options_; }

    // Runs a collection now, regardless of the allocation threshold.
    size_t collect_garbage();
    const Heap& heap() const { return heap_; }

   private:
    std::ostream& out;
    EvaluatorOptions options_;
    Heap heap_;
    EnvPtr global_env;
    ResolutionTable locals;
    int depth = 0;

    Value evaluate_expression(const ExpressionNode* expr, EnvPtr env);
    void evaluate_statement(const StatementNode* stmt, EnvPtr env, Value* return_value, bool* did_return, LoopControl* lc = nullptr);
    void execute_block(const std::vector<std::unique_ptr<StatementNode>>& body, EnvPtr env, Value* return_value, bool* did_return, LoopControl* lc);
    void execute_for(const ForStatementNode* fs, EnvPtr env, Value* return_value, bool* did_return);
    void declare_class(const ClassDeclarationNode* cd, EnvPtr env);

    Value call_value(const Value& callee, const std::vector<Value>& args, const Token& callToken);
    Value call_function(FunctionPtr fn, const std::vector<Value>& args, const Token& callToken);
    Value instantiate(ClassPtr cls, const std::vector<Value>& args, const Token& callToken);
    // New function whose closure defines `this` as the given instance.
    FunctionPtr bind_method(const FunctionPtr& method, const InstancePtr& instance);

    // Safe point: every live temporary is reachable from a root here.
    void maybe_collect();

    Value lookup_variable(const ExpressionNode* expr, const std::string& name, EnvPtr env, const Token& tok);
    void assign_variable(const ExpressionNode* expr, const std::string& name, const Value& value, EnvPtr env, const Token& tok);
    Value get_property(const Value& object, const std::string& name, const Token& tok);

    bool to_bool(const Value& v) const;
    bool is_equal(const Value& a, const Value& b) const;
    double to_number(const Value& v, const Token& tok) const;
};

// Canonical number form: integral values without a fractional part,
// everything else in the shortest form that reads back to the same double.
std::string format_number(double d);
