#include "parser.hpp"

std::unique_ptr<StatementNode> Parser::parse_block_statement() {
    Token openTok = consume();  // consume '{'
    auto block = std::make_unique<BlockStatementNode>();
    block->token = openTok;
    block->body = parse_block();
    return block;
}

// Parses declarations up to and including the closing '}'. A declaration that
// fails to parse is dropped after recovery; the rest of the block still parses.
std::vector<std::unique_ptr<StatementNode>> Parser::parse_block() {
    std::vector<std::unique_ptr<StatementNode>> body;

    while (!check(TokenType::CLOSEBRACE) && !is_at_end()) {
        auto stmt = parse_declaration();
        if (stmt) body.push_back(std::move(stmt));
    }

    expect(TokenType::CLOSEBRACE, "Expect '}' after block.");
    return body;
}
