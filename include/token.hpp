#pragma once

#include <string>
#include <variant>

#include "SourceManager.hpp"

// Token types (keep in sync with the lexer keyword table and parser)
enum class TokenType {
    // -----------------------
    // Single-character punctuation
    // -----------------------
    OPENPARENTHESIS,
    CLOSEPARENTHESIS,
    OPENBRACE,
    CLOSEBRACE,
    COMMA,
    DOT,
    SEMICOLON,

    // -----------------------
    // Arithmetic
    // -----------------------
    PLUS,
    MINUS,
    STAR,
    SLASH,

    // -----------------------
    // One or two character operators
    // -----------------------
    NOT,
    NOTEQUAL,
    ASSIGN,
    EQUALITY,
    GREATERTHAN,
    GREATEROREQUALTHAN,
    LESSTHAN,
    LESSOREQUALTHAN,

    // -----------------------
    // Literals & identifiers
    // -----------------------
    IDENTIFIER,
    STRING,
    NUMBER,
    BOOLEAN,  // 'true' / 'false'
    NIL,

    // -----------------------
    // Declarations
    // -----------------------
    CLASS,
    FUN,
    VAR,

    // -----------------------
    // Statements / control flow
    // -----------------------
    PRINT,
    RETURN,
    IF,
    ELSE,
    WHILE,
    FOR,
    BREAK,
    CONTINUE,

    // -----------------------
    // Logical
    // -----------------------
    AND,
    OR,

    // -----------------------
    // Class / OOP related
    // -----------------------
    THIS,
    SUPER,

    // -----------------------
    // file end
    // -----------------------
    EOF_TOKEN,
    UNKNOWN
};

// Small struct for token location / span in source
struct TokenLocation {
   public:
    std::string filename;  // source filename (or "<script>")
    int line = 1;          // 1-based
    int col = 1;           // 1-based column of token start
    int length = 0;        // token length in characters

    const SourceManager* src_mgr = nullptr;

    TokenLocation() = default;
    TokenLocation(const std::string& fn, int ln, int c, int len = 0, const SourceManager* mgr = nullptr)
        : filename(fn), line(ln), col(c), length(len), src_mgr(mgr) {}

    std::string to_string() const {
        return filename + ":" + std::to_string(line) + ":" + std::to_string(col);
    }
    std::string get_line_trace() const;
};

// Literal payload carried by NUMBER / STRING / BOOLEAN / NIL tokens
using TokenLiteral = std::variant<std::monostate, bool, double, std::string>;

// Represents a single token with location
struct Token {
    TokenType type = TokenType::UNKNOWN;
    std::string value;     // verbatim lexeme
    TokenLiteral literal;  // decoded literal value, monostate for non-literals
    TokenLocation loc;     // file:line:col and length/span

    Token() = default;
    Token(TokenType t, const std::string& v, const TokenLocation& l)
        : type(t), value(v), loc(l) {}
    Token(TokenType t, const std::string& v, const TokenLiteral& lit, const TokenLocation& l)
        : type(t), value(v), literal(lit), loc(l) {}

    const std::string& filename() const { return loc.filename; }
    int line() const { return loc.line; }
    int col() const { return loc.col; }
    int length() const { return loc.length; }

    // "<test>:1:5 IDENTIFIER [name]"
    std::string debug_string() const;
};

inline std::string TokenLocation::get_line_trace() const {
    if (!src_mgr) {
        return "(source context unavailable)";
    }
    return src_mgr->format_error_context(line, col, length);
}

const char* token_type_name(TokenType type);

inline std::string Token::debug_string() const {
    return loc.to_string() + " " + token_type_name(type) + " [" + value + "]";
}
