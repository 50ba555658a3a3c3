//src/evaluator/Environment.cpp
#include <stdexcept>

#include "evaluator.hpp"

// ----------------- Environment methods -----------------

Value* Environment::find(const std::string& name) {
   auto it = values.find(name);
   if (it != values.end()) return &it->second;
   if (parent) return parent->find(name);
   return nullptr;
}

void Environment::define(const std::string& name, const Value& value) {
   values[name] = value;
}

Environment* Environment::ancestor(int distance) {
   Environment* env = this;
   for (int i = 0; i < distance; ++i) {
      if (!env->parent) {
         throw std::logic_error("Scope chain shorter than resolved distance " + std::to_string(distance));
      }
      env = env->parent.get();
   }
   return env;
}

Value& Environment::get_at(int distance, const std::string& name) {
   Environment* env = ancestor(distance);
   auto it = env->values.find(name);
   if (it == env->values.end()) {
      throw std::logic_error("Resolved variable '" + name + "' missing at distance " + std::to_string(distance));
   }
   return it->second;
}

void Environment::assign_at(int distance, const std::string& name, const Value& value) {
   get_at(distance, name) = value;
}
