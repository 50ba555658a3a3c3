// src/parser/parser.cpp
#include "parser.hpp"

Parser::Parser(const std::vector<Token>& tokens, Diagnostics& diagnostics)
    : tokens(tokens), diagnostics(diagnostics) {
    // the lexer always terminates the stream, but a hand-built vector may not
    if (this->tokens.empty() || this->tokens.back().type != TokenType::EOF_TOKEN) {
        TokenLocation loc = this->tokens.empty() ? TokenLocation("<eof>", 1, 1, 0) : this->tokens.back().loc;
        this->tokens.emplace_back(TokenType::EOF_TOKEN, "", loc);
    }
}

// Return current token (the EOF token once the stream is exhausted)
Token Parser::peek() const {
    return tokens[position];
}

const Token& Parser::previous() const {
    return tokens[position > 0 ? position - 1 : 0];
}

// Consume and return the current token; never moves past EOF
Token Parser::consume() {
    if (!is_at_end()) return tokens[position++];
    return tokens[position];
}

bool Parser::check(TokenType t) const {
    return peek().type == t;
}

bool Parser::match(TokenType t) {
    if (check(t)) {
        consume();
        return true;
    }
    return false;
}

bool Parser::is_at_end() const {
    return tokens[position].type == TokenType::EOF_TOKEN;
}

Token Parser::expect(TokenType t, const std::string& errMsg) {
    if (check(t)) return consume();
    throw error(peek(), errMsg);
}

Parser::ParseError Parser::error(const Token& tok, const std::string& message) {
    diagnostics.report(Phase::Syntax, tok, message);
    return ParseError(message);
}

// Panic-mode recovery: drop tokens until just after a ';' or just before a
// keyword that starts a declaration or statement.
void Parser::synchronize() {
    consume();

    while (!is_at_end()) {
        if (previous().type == TokenType::SEMICOLON) return;

        switch (peek().type) {
            case TokenType::CLASS:
            case TokenType::FUN:
            case TokenType::VAR:
            case TokenType::FOR:
            case TokenType::IF:
            case TokenType::WHILE:
            case TokenType::PRINT:
            case TokenType::RETURN:
            case TokenType::BREAK:
            case TokenType::CONTINUE:
                return;
            default:
                break;
        }

        consume();
    }
}

Parser::NestingGuard::NestingGuard(Parser& parser, int& depth, const char* message) : depth_(depth) {
    if (depth_ >= kMaxNesting) {
        parser.diagnostics.report(Phase::Syntax, parser.peek(), message);
        throw NestingError(message);
    }
    ++depth_;
}

std::unique_ptr<ProgramNode> Parser::parse() {
    auto program = std::make_unique<ProgramNode>();
    if (!tokens.empty()) program->token = tokens.front();
    try {
        while (!is_at_end()) {
            auto stmt = parse_declaration();
            if (stmt) program->body.push_back(std::move(stmt));
        }
    } catch (const NestingError&) {
        // already reported; the rest of the input is not parsed
    }
    return program;
}

// ---------- declarations ----------
std::unique_ptr<StatementNode> Parser::parse_declaration() {
    try {
        if (match(TokenType::CLASS)) return parse_class_declaration();
        if (match(TokenType::FUN)) return parse_function_declaration("function");
        if (match(TokenType::VAR)) return parse_variable_declaration();
        return parse_statement();
    } catch (const ParseError&) {
        synchronize();
        return nullptr;
    }
}
