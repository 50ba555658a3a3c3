#pragma once

#include <string>
#include <vector>

#include "diagnostics.hpp"
#include "token.hpp"

class Lexer {
   public:
    Lexer(const std::string& source, const std::string& filename, Diagnostics& diagnostics, const SourceManager* mgr = nullptr);

    // Always ends with exactly one EOF_TOKEN. Lexical errors are recorded in
    // the diagnostics sink and scanning resumes at the next character.
    std::vector<Token> tokenize();

   private:
    const std::string src;
    const std::string filename;
    Diagnostics& diagnostics;
    size_t i = 0;
    int line = 1;
    int col = 1;

    const SourceManager* src_mgr = nullptr;

    // helpers
    bool eof() const;
    char peek(size_t offset = 0) const;
    char peek_next() const;
    char advance();
    bool match(char expected);

    // Add token: optional explicit length (if -1, length is value.size()).
    void add_token(std::vector<Token>& out, TokenType type, const std::string& value, int tok_line, int tok_col, int tok_length = -1);
    void add_literal(std::vector<Token>& out, TokenType type, const std::string& value, const TokenLiteral& literal, int tok_line, int tok_col);
    void error(int tok_line, int tok_col, const std::string& message);

    void scan_token(std::vector<Token>& out);
    void scan_number(std::vector<Token>& out, int tok_line, int tok_col, size_t start_index);
    void scan_identifier_or_keyword(std::vector<Token>& out, int tok_line, int tok_col, size_t start_index);

    // scan double-quoted string (handles escapes, may span lines)
    void scan_quoted_string(std::vector<Token>& out, int tok_line, int tok_col, size_t start_index);

    void skip_line_comment();
    void skip_block_comment(int tok_line, int tok_col);
};
