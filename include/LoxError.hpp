#pragma once
#include <stdexcept>
#include <string>

#include "token.hpp"

// Runtime error raised by the evaluator. The first one aborts the current run.
class LoxError : public std::runtime_error {
   public:
    LoxError(const std::string& type,
        const std::string& message,
        const TokenLocation& loc) : std::runtime_error(format_message(type, message, loc)),
                                    type_(type),
                                    message_(message),
                                    loc_(loc) {}

    const std::string& type() const { return type_; }
    const std::string& message() const { return message_; }
    const TokenLocation& location() const { return loc_; }
    int line() const { return loc_.line; }

   private:
    std::string type_;
    std::string message_;
    TokenLocation loc_;

    static std::string format_message(const std::string& type,
        const std::string& message,
        const TokenLocation& loc) {
        return type + " at " + loc.to_string() + "\n" +
            message + "\n" +
            " --> Traced at:\n" +
            loc.get_line_trace();
    }
};
