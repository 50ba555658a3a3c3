#pragma once
#include <string>
#include <unordered_map>

#include "evaluator.hpp"

// A minimal runtime representation for classes
struct ClassValue {
    std::string name;
    ClassPtr super;  // parent class (if any)
    std::unordered_map<std::string, FunctionPtr> methods;
    // token for diagnostics
    Token token;

    // own table first, then up the superclass chain
    FunctionPtr find_method(const std::string& method_name) const {
        auto it = methods.find(method_name);
        if (it != methods.end()) return it->second;
        if (super) return super->find_method(method_name);
        return nullptr;
    }

    // a class is called with its initializer's arguments
    int arity() const {
        FunctionPtr init = find_method("init");
        return init ? init->arity() : 0;
    }
};

// Fields are shared by every reference to the instance.
struct InstanceValue {
    ClassPtr klass;
    std::unordered_map<std::string, Value> fields;

    explicit InstanceValue(ClassPtr cls) : klass(std::move(cls)) {}
};
