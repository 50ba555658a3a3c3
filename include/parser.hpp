#pragma once
#include <memory>
#include <stdexcept>
#include <vector>

#include "ast.hpp"
#include "diagnostics.hpp"
#include "token.hpp"

class Parser {
   public:
    Parser(const std::vector<Token>& tokens, Diagnostics& diagnostics);

    // Parses the whole token stream. Syntax errors are recorded in the
    // diagnostics sink; the parser resynchronises at the next statement
    // boundary and keeps going, so the returned program may be partial.
    std::unique_ptr<ProgramNode> parse();

   private:
    // Unwinds to the enclosing declaration, which resynchronises.
    struct ParseError : public std::runtime_error {
        using std::runtime_error::runtime_error;
    };

    // Nesting past the limit ends the parse: the recursion depth has to stay
    // within the native stack, and recovery would only cascade.
    struct NestingError : public std::runtime_error {
        using std::runtime_error::runtime_error;
    };

    static constexpr int kMaxNesting = 256;

    class NestingGuard {
       public:
        NestingGuard(Parser& parser, int& depth, const char* message);
        ~NestingGuard() { --depth_; }
        NestingGuard(const NestingGuard&) = delete;
        NestingGuard& operator=(const NestingGuard&) = delete;

       private:
        int& depth_;
    };

    std::vector<Token> tokens;
    Diagnostics& diagnostics;
    size_t position = 0;
    int expression_depth = 0;
    int statement_depth = 0;

    Token peek() const;
    const Token& previous() const;
    Token consume();
    bool check(TokenType t) const;
    bool match(TokenType t);
    bool is_at_end() const;
    Token expect(TokenType t, const std::string& errMsg);

    // Records a syntax error at tok and returns the exception to throw.
    ParseError error(const Token& tok, const std::string& message);
    void synchronize();

    // declarations
    std::unique_ptr<StatementNode> parse_declaration();
    std::unique_ptr<StatementNode> parse_variable_declaration();
    std::unique_ptr<StatementNode> parse_class_declaration();
    // kind is "function" or "method"; the 'fun' keyword is already consumed
    std::unique_ptr<FunctionDeclarationNode> parse_function_declaration(const std::string& kind);

    // statements
    std::unique_ptr<StatementNode> parse_statement();
    std::unique_ptr<StatementNode> parse_print_statement();
    std::unique_ptr<StatementNode> parse_expression_statement();
    std::unique_ptr<StatementNode> parse_return_statement();

    // control-flow parsing
    std::unique_ptr<StatementNode> parse_if_statement();
    std::unique_ptr<StatementNode> parse_while_statement();
    std::unique_ptr<StatementNode> parse_for_statement();
    std::unique_ptr<StatementNode> parse_break_statement();
    std::unique_ptr<StatementNode> parse_continue_statement();

    // blocks: parse_block expects the '{' to be consumed already
    std::unique_ptr<StatementNode> parse_block_statement();
    std::vector<std::unique_ptr<StatementNode>> parse_block();

    // expression parsing (precedence chain, lowest first)
    std::unique_ptr<ExpressionNode> parse_expression();
    std::unique_ptr<ExpressionNode> parse_assignment();
    std::unique_ptr<ExpressionNode> parse_logical_or();
    std::unique_ptr<ExpressionNode> parse_logical_and();
    std::unique_ptr<ExpressionNode> parse_equality();
    std::unique_ptr<ExpressionNode> parse_comparison();
    std::unique_ptr<ExpressionNode> parse_additive();
    std::unique_ptr<ExpressionNode> parse_multiplicative();
    std::unique_ptr<ExpressionNode> parse_unary();
    std::unique_ptr<ExpressionNode> parse_postfix();
    std::unique_ptr<ExpressionNode> parse_call(std::unique_ptr<ExpressionNode> callee);
    std::unique_ptr<ExpressionNode> parse_primary();
};
