// src/evaluator/Heap.cpp
#include <algorithm>
#include <unordered_set>

#include "ClassRuntime.hpp"
#include "evaluator.hpp"

// ----------------- allocation -----------------

void Heap::track_allocation() {
    ++allocations_since_collect;
}

EnvPtr Heap::new_env(EnvPtr parent) {
    auto env = std::make_shared<Environment>(std::move(parent));
    envs.push_back(env);
    track_allocation();
    return env;
}

EnvPtr Heap::copy_env(const EnvPtr& env) {
    EnvPtr copy = new_env(env->parent);
    copy->values = env->values;
    return copy;
}

InstancePtr Heap::new_instance(ClassPtr klass) {
    auto inst = std::make_shared<InstanceValue>(std::move(klass));
    instances.push_back(inst);
    track_allocation();
    return inst;
}

// ----------------- roots -----------------

Heap::RootGuard::RootGuard(Heap& heap)
    : heap_(heap), env_mark_(heap.env_roots.size()), value_mark_(heap.value_roots.size()) {}

Heap::RootGuard::~RootGuard() {
    heap_.env_roots.erase(heap_.env_roots.begin() + env_mark_, heap_.env_roots.end());
    heap_.value_roots.erase(heap_.value_roots.begin() + value_mark_, heap_.value_roots.end());
}

void Heap::RootGuard::add(const EnvPtr& env) {
    heap_.env_roots.push_back(env);
}

void Heap::RootGuard::add(const Value& value) {
    heap_.value_roots.push_back(value);
}

// ----------------- mark & sweep -----------------

size_t Heap::collect(const EnvPtr& globals) {
    std::unordered_set<const void*> marked;
    std::vector<const Environment*> env_work;
    std::vector<const FunctionValue*> fn_work;
    std::vector<const ClassValue*> class_work;
    std::vector<const InstanceValue*> instance_work;

    auto mark_env = [&](const Environment* env) {
        if (env && marked.insert(env).second) env_work.push_back(env);
    };
    auto mark_value = [&](const Value& v) {
        if (std::holds_alternative<FunctionPtr>(v)) {
            const FunctionValue* fn = std::get<FunctionPtr>(v).get();
            if (fn && marked.insert(fn).second) fn_work.push_back(fn);
        } else if (std::holds_alternative<ClassPtr>(v)) {
            const ClassValue* cls = std::get<ClassPtr>(v).get();
            if (cls && marked.insert(cls).second) class_work.push_back(cls);
        } else if (std::holds_alternative<InstancePtr>(v)) {
            const InstanceValue* inst = std::get<InstancePtr>(v).get();
            if (inst && marked.insert(inst).second) instance_work.push_back(inst);
        }
    };

    mark_env(globals.get());
    for (const auto& env : env_roots) mark_env(env.get());
    for (const auto& v : value_roots) mark_value(v);

    // worklists instead of recursion: object graphs can be arbitrarily deep
    while (!env_work.empty() || !fn_work.empty() || !class_work.empty() || !instance_work.empty()) {
        if (!env_work.empty()) {
            const Environment* env = env_work.back();
            env_work.pop_back();
            for (const auto& entry : env->values) mark_value(entry.second);
            mark_env(env->parent.get());
            continue;
        }
        if (!fn_work.empty()) {
            const FunctionValue* fn = fn_work.back();
            fn_work.pop_back();
            mark_env(fn->closure.get());
            if (fn->receiver) mark_value(fn->receiver);
            continue;
        }
        if (!class_work.empty()) {
            const ClassValue* cls = class_work.back();
            class_work.pop_back();
            if (cls->super) mark_value(cls->super);
            for (const auto& entry : cls->methods) mark_value(entry.second);
            continue;
        }
        const InstanceValue* inst = instance_work.back();
        instance_work.pop_back();
        if (inst->klass) mark_value(inst->klass);
        for (const auto& entry : inst->fields) mark_value(entry.second);
    }

    size_t released = 0;
    for (size_t i = 0; i < envs.size(); ++i) {
        EnvPtr env = envs[i].lock();
        if (!env || marked.count(env.get())) continue;
        env->values.clear();
        env->parent.reset();
        ++released;
    }
    for (size_t i = 0; i < instances.size(); ++i) {
        InstancePtr inst = instances[i].lock();
        if (!inst || marked.count(inst.get())) continue;
        inst->fields.clear();
        inst->klass.reset();
        ++released;
    }

    auto expired = [](const auto& weak) { return weak.expired(); };
    envs.erase(std::remove_if(envs.begin(), envs.end(), expired), envs.end());
    instances.erase(std::remove_if(instances.begin(), instances.end(), expired), instances.end());

    allocations_since_collect = 0;
    collect_threshold = std::max(kMinCollectThreshold, 2 * (envs.size() + instances.size()));
    return released;
}

void Heap::release_all() {
    env_roots.clear();
    value_roots.clear();
    for (auto& weak : envs) {
        if (EnvPtr env = weak.lock()) {
            env->values.clear();
            env->parent.reset();
        }
    }
    for (auto& weak : instances) {
        if (InstancePtr inst = weak.lock()) {
            inst->fields.clear();
            inst->klass.reset();
        }
    }
    envs.clear();
    instances.clear();
    allocations_since_collect = 0;
}

size_t Heap::live_environments() const {
    return static_cast<size_t>(std::count_if(envs.begin(), envs.end(), [](const auto& w) { return !w.expired(); }));
}

size_t Heap::live_instances() const {
    return static_cast<size_t>(std::count_if(instances.begin(), instances.end(), [](const auto& w) { return !w.expired(); }));
}
