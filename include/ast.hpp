#pragma once
#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include "token.hpp"

// Base class for all AST nodes.
//
// to_string() renders a node back into source text. The output parses back
// into a tree with the same shape, so it doubles as the canonical printer.
struct Node {
    virtual ~Node() = default;
    Token token;  // filename, line, column for this node (set by the parser)

    virtual std::string to_string() const {
        return "<node>";
    }
};

// Expressions
struct ExpressionNode : public Node {
};

struct NumericLiteralNode : public ExpressionNode {
    double value = 0.0;
    std::string to_string() const override {
        // keep the lexeme so printing does not change precision
        if (!token.value.empty()) return token.value;
        std::ostringstream ss;
        ss << value;
        return ss.str();
    }
};

struct StringLiteralNode : public ExpressionNode {
    std::string value;
    std::string to_string() const override {
        if (token.type == TokenType::STRING) return token.value;
        return "\"" + value + "\"";
    }
};

struct BooleanLiteralNode : public ExpressionNode {
    bool value = false;
    std::string to_string() const override {
        return value ? "true" : "false";
    }
};

struct NullNode : public ExpressionNode {
    std::string to_string() const override {
        return "nil";
    }
};

// Parenthesized expression. Kept in the tree so printing preserves grouping.
struct GroupingNode : public ExpressionNode {
    std::unique_ptr<ExpressionNode> expression;
    std::string to_string() const override {
        return "(" + (expression ? expression->to_string() : "<null>") + ")";
    }
};

struct IdentifierNode : public ExpressionNode {
    std::string name;
    std::string to_string() const override {
        return name;
    }
};

struct UnaryExpressionNode : public ExpressionNode {
    std::string op;  // "!" or "-"
    std::unique_ptr<ExpressionNode> operand;
    std::string to_string() const override {
        std::string opnd = operand ? operand->to_string() : "<null>";
        return op + opnd;
    }
};

struct BinaryExpressionNode : public ExpressionNode {
    std::string op;  // e.g. "+", "*", "==", "<="
    std::unique_ptr<ExpressionNode> left;
    std::unique_ptr<ExpressionNode> right;
    std::string to_string() const override {
        std::string l = left ? left->to_string() : "<null>";
        std::string r = right ? right->to_string() : "<null>";
        return l + " " + op + " " + r;
    }
};

// Short-circuiting "and" / "or"
struct LogicalExpressionNode : public ExpressionNode {
    std::string op;
    std::unique_ptr<ExpressionNode> left;
    std::unique_ptr<ExpressionNode> right;
    std::string to_string() const override {
        std::string l = left ? left->to_string() : "<null>";
        std::string r = right ? right->to_string() : "<null>";
        return l + " " + op + " " + r;
    }
};

// name = value
struct AssignmentExpressionNode : public ExpressionNode {
    std::string name;
    std::unique_ptr<ExpressionNode> value;
    std::string to_string() const override {
        return name + " = " + (value ? value->to_string() : "<null>");
    }
};

struct CallExpressionNode : public ExpressionNode {
    std::unique_ptr<ExpressionNode> callee;
    std::vector<std::unique_ptr<ExpressionNode>> arguments;

    std::string to_string() const override {
        std::string c = callee ? callee->to_string() : "<null>";
        std::string args;
        for (size_t i = 0; i < arguments.size(); ++i) {
            if (i) args += ", ";
            args += arguments[i] ? arguments[i]->to_string() : "<null>";
        }
        return c + "(" + args + ")";
    }
};

// Member expression: obj.prop
struct MemberExpressionNode : public ExpressionNode {
    std::unique_ptr<ExpressionNode> object;
    std::string property;

    std::string to_string() const override {
        std::string o = object ? object->to_string() : "<null>";
        return o + "." + property;
    }
};

// obj.prop = value
struct MemberAssignmentNode : public ExpressionNode {
    std::unique_ptr<ExpressionNode> object;
    std::string property;
    std::unique_ptr<ExpressionNode> value;

    std::string to_string() const override {
        std::string o = object ? object->to_string() : "<null>";
        return o + "." + property + " = " + (value ? value->to_string() : "<null>");
    }
};

struct ThisExpressionNode : public ExpressionNode {
    std::string to_string() const override {
        return "this";
    }
};

// super.method
struct SuperExpressionNode : public ExpressionNode {
    std::string method;
    std::string to_string() const override {
        return "super." + method;
    }
};

// Statements
struct StatementNode : public Node {
};

struct ExpressionStatementNode : public StatementNode {
    std::unique_ptr<ExpressionNode> expression;
    std::string to_string() const override {
        return (expression ? expression->to_string() : "<null>") + ";";
    }
};

struct PrintStatementNode : public StatementNode {
    std::unique_ptr<ExpressionNode> expression;
    std::string to_string() const override {
        return "print " + (expression ? expression->to_string() : "<null>") + ";";
    }
};

struct VariableDeclarationNode : public StatementNode {
    std::string identifier;
    std::unique_ptr<ExpressionNode> value;  // optional initializer

    std::string to_string() const override {
        std::string s = "var " + identifier;
        if (value) s += " = " + value->to_string();
        return s + ";";
    }
};

inline std::string statements_to_string(const std::vector<std::unique_ptr<StatementNode>>& body) {
    if (body.empty()) return "{ }";
    std::string s = "{";
    for (const auto& stmt : body) s += " " + (stmt ? stmt->to_string() : "<null>");
    return s + " }";
}

// Block introduces its own scope
struct BlockStatementNode : public StatementNode {
    std::vector<std::unique_ptr<StatementNode>> body;
    std::string to_string() const override {
        return statements_to_string(body);
    }
};

struct IfStatementNode : public StatementNode {
    std::unique_ptr<ExpressionNode> condition;
    std::unique_ptr<StatementNode> then_branch;
    std::unique_ptr<StatementNode> else_branch;  // optional

    std::string to_string() const override {
        std::string s = "if (" + (condition ? condition->to_string() : "<null>") + ") " +
            (then_branch ? then_branch->to_string() : "<null>");
        if (else_branch) s += " else " + else_branch->to_string();
        return s;
    }
};

struct WhileStatementNode : public StatementNode {
    std::unique_ptr<ExpressionNode> condition;
    std::unique_ptr<StatementNode> body;

    std::string to_string() const override {
        return "while (" + (condition ? condition->to_string() : "<null>") + ") " +
            (body ? body->to_string() : "<null>");
    }
};

// For loop. Kept as its own node: every iteration gets a fresh copy of the
// loop scope, and `continue` still runs the increment.
struct ForStatementNode : public StatementNode {
    std::unique_ptr<StatementNode> init;         // optional: VariableDeclarationNode or ExpressionStatementNode
    std::unique_ptr<ExpressionNode> condition;   // optional
    std::unique_ptr<ExpressionNode> increment;   // optional
    std::unique_ptr<StatementNode> body;

    std::string to_string() const override {
        std::string s = "for (";
        s += init ? init->to_string() : ";";
        if (condition) s += " " + condition->to_string();
        s += ";";
        if (increment) s += " " + increment->to_string();
        s += ") ";
        s += body ? body->to_string() : "<null>";
        return s;
    }
};

struct BreakStatementNode : public StatementNode {
    std::string to_string() const override {
        return "break;";
    }
};

struct ContinueStatementNode : public StatementNode {
    std::string to_string() const override {
        return "continue;";
    }
};

struct FunctionDeclarationNode : public StatementNode {
    std::string name;
    std::vector<Token> params;
    std::vector<std::unique_ptr<StatementNode>> body;  // function body statements

    // name(a, b) { ... } without the leading keyword, as methods are written
    std::string signature_to_string() const {
        std::string s = name + "(";
        for (size_t i = 0; i < params.size(); ++i) {
            if (i) s += ", ";
            s += params[i].value;
        }
        return s + ") " + statements_to_string(body);
    }

    std::string to_string() const override {
        return "fun " + signature_to_string();
    }
};

struct ReturnStatementNode : public StatementNode {
    std::unique_ptr<ExpressionNode> value;  // optional

    std::string to_string() const override {
        if (!value) return "return;";
        return "return " + value->to_string() + ";";
    }
};

struct ClassDeclarationNode : public StatementNode {
    std::string name;
    std::unique_ptr<IdentifierNode> superclass;  // optional
    std::vector<std::unique_ptr<FunctionDeclarationNode>> methods;

    std::string to_string() const override {
        std::ostringstream ss;
        ss << "class " << name;
        if (superclass) ss << " < " << superclass->to_string();
        ss << " {";
        for (const auto& m : methods) ss << " " << m->signature_to_string();
        ss << " }";
        return ss.str();
    }
};

struct ProgramNode : public Node {
    std::vector<std::unique_ptr<StatementNode>> body;

    std::string to_string() const override {
        std::string s;
        for (const auto& stmt : body) {
            s += stmt ? stmt->to_string() : "<null>";
            s += "\n";
        }
        return s;
    }
};
