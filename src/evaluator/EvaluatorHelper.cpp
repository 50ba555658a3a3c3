#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <string>

#include "ClassRuntime.hpp"
#include "LoxError.hpp"
#include "evaluator.hpp"

// ----------------- Evaluator helpers -----------------

std::string format_number(double d) {
    if (std::isnan(d)) return "nan";
    if (std::isinf(d)) return d > 0 ? "inf" : "-inf";

    char buf[64];
    if (d == std::trunc(d) && std::fabs(d) < 1e16) {
        // "%.0f" keeps the sign of negative zero
        std::snprintf(buf, sizeof(buf), "%.0f", d);
        return buf;
    }

    // shortest precision that reads back to the same double
    for (int precision = 15; precision <= 17; ++precision) {
        std::snprintf(buf, sizeof(buf), "%.*g", precision, d);
        if (std::strtod(buf, nullptr) == d) break;
    }
    return buf;
}

double Evaluator::to_number(const Value& v, const Token& token) const {
    if (std::holds_alternative<double>(v)) {
        return std::get<double>(v);
    }
    throw LoxError("TypeError", "Operand must be a number.", token.loc);
}

std::string Evaluator::value_to_string(const Value& v) const {
    if (std::holds_alternative<std::monostate>(v)) return "nil";
    if (std::holds_alternative<bool>(v)) return std::get<bool>(v) ? "true" : "false";
    if (std::holds_alternative<double>(v)) return format_number(std::get<double>(v));
    if (std::holds_alternative<std::string>(v)) return std::get<std::string>(v);
    if (std::holds_alternative<FunctionPtr>(v)) {
        FunctionPtr fn = std::get<FunctionPtr>(v);
        if (!fn || fn->is_native) return "<native fn>";
        return "<fn " + fn->name + ">";
    }
    if (std::holds_alternative<ClassPtr>(v)) {
        ClassPtr cls = std::get<ClassPtr>(v);
        return cls ? cls->name : "<class>";
    }
    if (std::holds_alternative<InstancePtr>(v)) {
        InstancePtr inst = std::get<InstancePtr>(v);
        return (inst && inst->klass ? inst->klass->name : "<anonymous>") + " instance";
    }
    return "<unknown>";
}

// nil and false are falsy; everything else, 0 and "" included, is truthy
bool Evaluator::to_bool(const Value& v) const {
    if (std::holds_alternative<std::monostate>(v)) return false;
    if (std::holds_alternative<bool>(v)) return std::get<bool>(v);
    return true;
}

// No coercion between types. Callables and instances compare by identity.
bool Evaluator::is_equal(const Value& a, const Value& b) const {
    if (a.index() != b.index()) return false;

    if (std::holds_alternative<std::monostate>(a)) return true;
    if (std::holds_alternative<bool>(a)) return std::get<bool>(a) == std::get<bool>(b);
    if (std::holds_alternative<double>(a)) return std::get<double>(a) == std::get<double>(b);
    if (std::holds_alternative<std::string>(a)) return std::get<std::string>(a) == std::get<std::string>(b);
    if (std::holds_alternative<FunctionPtr>(a)) return std::get<FunctionPtr>(a) == std::get<FunctionPtr>(b);
    if (std::holds_alternative<ClassPtr>(a)) return std::get<ClassPtr>(a) == std::get<ClassPtr>(b);
    if (std::holds_alternative<InstancePtr>(a)) return std::get<InstancePtr>(a) == std::get<InstancePtr>(b);
    return false;
}
