#include "lexer.hpp"

#include <cctype>
#include <cstdlib>
#include <unordered_map>

// Constructor
Lexer::Lexer(const std::string& source, const std::string& filename, Diagnostics& diagnostics, const SourceManager* mgr)
    : src(source), filename(filename), diagnostics(diagnostics), i(0), line(1), col(1), src_mgr(mgr) {
}

bool Lexer::eof() const {
    return i >= src.size();
}
char Lexer::peek(size_t offset) const {
    size_t idx = i + offset;
    if (idx >= src.size()) return '\0';
    return src[idx];
}
char Lexer::peek_next() const {
    return peek(1);
}

char Lexer::advance() {
    if (eof()) return '\0';
    char c = src[i++];
    if (c == '\n') {
        line++;
        col = 1;
    } else {
        col++;
    }
    return c;
}

bool Lexer::match(char expected) {
    if (eof() || src[i] != expected) return false;
    advance();
    return true;
}

void Lexer::add_token(std::vector<Token>& out, TokenType type, const std::string& value, int tok_line, int tok_col, int tok_length) {
    int len = tok_length >= 0 ? tok_length : static_cast<int>(value.size());
    TokenLocation loc(filename.empty() ? "<repl>" : filename, tok_line, tok_col, len, src_mgr);
    Token t{type, value, loc};
    out.push_back(std::move(t));
}

void Lexer::add_literal(std::vector<Token>& out, TokenType type, const std::string& value, const TokenLiteral& literal, int tok_line, int tok_col) {
    TokenLocation loc(filename.empty() ? "<repl>" : filename, tok_line, tok_col, static_cast<int>(value.size()), src_mgr);
    out.emplace_back(type, value, literal, loc);
}

void Lexer::error(int tok_line, int tok_col, const std::string& message) {
    TokenLocation loc(filename.empty() ? "<repl>" : filename, tok_line, tok_col, 1, src_mgr);
    diagnostics.report(Phase::Lexical, loc, message);
}

void Lexer::skip_line_comment() {
    while (!eof() && peek() != '\n') advance();
}

void Lexer::skip_block_comment(int tok_line, int tok_col) {
    // opening "/*" already consumed
    while (!eof()) {
        if (peek() == '*' && peek_next() == '/') {
            advance();
            advance();
            return;
        }
        advance();
    }
    error(tok_line, tok_col, "Unterminated block comment.");
}

void Lexer::scan_quoted_string(std::vector<Token>& out, int tok_line, int tok_col, size_t start_index) {
    // skip opening quote
    advance();
    std::string val;
    bool closed = false;

    while (!eof()) {
        char c = peek();
        if (c == '"') {
            advance();
            closed = true;
            break;
        }

        if (c == '\\') {
            advance();  // consume backslash
            char nxt = peek();

            if (nxt == 'n') {
                val.push_back('\n');
                advance();
            } else if (nxt == 't') {
                val.push_back('\t');
                advance();
            } else if (nxt == 'r') {
                val.push_back('\r');
                advance();
            } else if (nxt == '"') {
                val.push_back('"');
                advance();
            } else if (nxt == '\\') {
                val.push_back('\\');
                advance();
            } else {
                // unknown escape: keep both characters
                val.push_back('\\');
                if (!eof()) val.push_back(advance());
            }
            continue;
        }

        val.push_back(advance());
    }

    if (!closed) {
        error(tok_line, tok_col, "Unterminated string.");
        return;
    }

    std::string lexeme = src.substr(start_index, i - start_index);
    add_literal(out, TokenType::STRING, lexeme, val, tok_line, tok_col);
}

void Lexer::scan_number(std::vector<Token>& out, int tok_line, int tok_col, size_t start_index) {
    while (std::isdigit(static_cast<unsigned char>(peek()))) advance();

    // fractional part needs at least one digit after the dot
    if (peek() == '.' && std::isdigit(static_cast<unsigned char>(peek_next()))) {
        advance();
        while (std::isdigit(static_cast<unsigned char>(peek()))) advance();
    }

    std::string lexeme = src.substr(start_index, i - start_index);
    // out of range gives inf, like any other double arithmetic
    double value = std::strtod(lexeme.c_str(), nullptr);
    add_literal(out, TokenType::NUMBER, lexeme, value, tok_line, tok_col);
}

void Lexer::scan_identifier_or_keyword(std::vector<Token>& out, int tok_line, int tok_col, size_t start_index) {
    while (std::isalnum(static_cast<unsigned char>(peek())) || peek() == '_') advance();
    std::string id = src.substr(start_index, i - start_index);

    static const std::unordered_map<std::string, TokenType> keywords = {
        {"and", TokenType::AND},
        {"break", TokenType::BREAK},
        {"class", TokenType::CLASS},
        {"continue", TokenType::CONTINUE},
        {"else", TokenType::ELSE},
        {"false", TokenType::BOOLEAN},
        {"for", TokenType::FOR},
        {"fun", TokenType::FUN},
        {"if", TokenType::IF},
        {"nil", TokenType::NIL},
        {"or", TokenType::OR},
        {"print", TokenType::PRINT},
        {"return", TokenType::RETURN},
        {"super", TokenType::SUPER},
        {"this", TokenType::THIS},
        {"true", TokenType::BOOLEAN},
        {"var", TokenType::VAR},
        {"while", TokenType::WHILE}};

    auto it = keywords.find(id);
    if (it == keywords.end()) {
        add_token(out, TokenType::IDENTIFIER, id, tok_line, tok_col);
        return;
    }
    if (it->second == TokenType::BOOLEAN) {
        add_literal(out, TokenType::BOOLEAN, id, id == "true", tok_line, tok_col);
        return;
    }
    add_token(out, it->second, id, tok_line, tok_col);
}

void Lexer::scan_token(std::vector<Token>& out) {
    char c = peek();
    int tok_line = line;
    int tok_col = col;
    size_t start_index = i;

    // whitespace
    if (c == ' ' || c == '\t' || c == '\r' || c == '\n') {
        advance();
        return;
    }

    // comments
    if (c == '/' && peek_next() == '/') {
        skip_line_comment();
        return;
    }
    if (c == '/' && peek_next() == '*') {
        advance();
        advance();
        skip_block_comment(tok_line, tok_col);
        return;
    }

    if (std::isdigit(static_cast<unsigned char>(c))) {
        scan_number(out, tok_line, tok_col, start_index);
        return;
    }
    if (std::isalpha(static_cast<unsigned char>(c)) || c == '_') {
        scan_identifier_or_keyword(out, tok_line, tok_col, start_index);
        return;
    }
    if (c == '"') {
        scan_quoted_string(out, tok_line, tok_col, start_index);
        return;
    }

    advance();

    // one or two character operators
    switch (c) {
        case '!':
            if (match('='))
                add_token(out, TokenType::NOTEQUAL, "!=", tok_line, tok_col, 2);
            else
                add_token(out, TokenType::NOT, "!", tok_line, tok_col, 1);
            return;
        case '=':
            if (match('='))
                add_token(out, TokenType::EQUALITY, "==", tok_line, tok_col, 2);
            else
                add_token(out, TokenType::ASSIGN, "=", tok_line, tok_col, 1);
            return;
        case '<':
            if (match('='))
                add_token(out, TokenType::LESSOREQUALTHAN, "<=", tok_line, tok_col, 2);
            else
                add_token(out, TokenType::LESSTHAN, "<", tok_line, tok_col, 1);
            return;
        case '>':
            if (match('='))
                add_token(out, TokenType::GREATEROREQUALTHAN, ">=", tok_line, tok_col, 2);
            else
                add_token(out, TokenType::GREATERTHAN, ">", tok_line, tok_col, 1);
            return;
        default:
            break;
    }

    // single-char tokens
    static const std::unordered_map<char, TokenType> single = {
        {'(', TokenType::OPENPARENTHESIS},
        {')', TokenType::CLOSEPARENTHESIS},
        {'{', TokenType::OPENBRACE},
        {'}', TokenType::CLOSEBRACE},
        {',', TokenType::COMMA},
        {'.', TokenType::DOT},
        {';', TokenType::SEMICOLON},
        {'+', TokenType::PLUS},
        {'-', TokenType::MINUS},
        {'*', TokenType::STAR},
        {'/', TokenType::SLASH}};

    auto it = single.find(c);
    if (it != single.end()) {
        add_token(out, it->second, std::string(1, c), tok_line, tok_col, 1);
        return;
    }

    error(tok_line, tok_col, std::string("Unexpected character '") + c + "'.");
}

std::vector<Token> Lexer::tokenize() {
    std::vector<Token> out;

    // skip UTF-8 BOM if present
    if (src.size() >= 3 && (unsigned char)src[0] == 0xEF && (unsigned char)src[1] == 0xBB && (unsigned char)src[2] == 0xBF) {
        i = 3;
        col = 4;
    }

    while (!eof()) scan_token(out);

    // final EOF token
    add_token(out, TokenType::EOF_TOKEN, "", line, col, 0);

    return out;
}

const char* token_type_name(TokenType type) {
    switch (type) {
        case TokenType::OPENPARENTHESIS: return "OPENPARENTHESIS";
        case TokenType::CLOSEPARENTHESIS: return "CLOSEPARENTHESIS";
        case TokenType::OPENBRACE: return "OPENBRACE";
        case TokenType::CLOSEBRACE: return "CLOSEBRACE";
        case TokenType::COMMA: return "COMMA";
        case TokenType::DOT: return "DOT";
        case TokenType::SEMICOLON: return "SEMICOLON";
        case TokenType::PLUS: return "PLUS";
        case TokenType::MINUS: return "MINUS";
        case TokenType::STAR: return "STAR";
        case TokenType::SLASH: return "SLASH";
        case TokenType::NOT: return "NOT";
        case TokenType::NOTEQUAL: return "NOTEQUAL";
        case TokenType::ASSIGN: return "ASSIGN";
        case TokenType::EQUALITY: return "EQUALITY";
        case TokenType::GREATERTHAN: return "GREATERTHAN";
        case TokenType::GREATEROREQUALTHAN: return "GREATEROREQUALTHAN";
        case TokenType::LESSTHAN: return "LESSTHAN";
        case TokenType::LESSOREQUALTHAN: return "LESSOREQUALTHAN";
        case TokenType::IDENTIFIER: return "IDENTIFIER";
        case TokenType::STRING: return "STRING";
        case TokenType::NUMBER: return "NUMBER";
        case TokenType::BOOLEAN: return "BOOLEAN";
        case TokenType::NIL: return "NIL";
        case TokenType::CLASS: return "CLASS";
        case TokenType::FUN: return "FUN";
        case TokenType::VAR: return "VAR";
        case TokenType::PRINT: return "PRINT";
        case TokenType::RETURN: return "RETURN";
        case TokenType::IF: return "IF";
        case TokenType::ELSE: return "ELSE";
        case TokenType::WHILE: return "WHILE";
        case TokenType::FOR: return "FOR";
        case TokenType::BREAK: return "BREAK";
        case TokenType::CONTINUE: return "CONTINUE";
        case TokenType::AND: return "AND";
        case TokenType::OR: return "OR";
        case TokenType::THIS: return "THIS";
        case TokenType::SUPER: return "SUPER";
        case TokenType::EOF_TOKEN: return "EOF";
        case TokenType::UNKNOWN: return "UNKNOWN";
    }
    return "UNKNOWN";
}
