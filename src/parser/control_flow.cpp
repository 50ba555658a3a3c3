#include "parser.hpp"

// if (cond) stmt [else stmt]; a dangling else binds to the nearest if
std::unique_ptr<StatementNode> Parser::parse_if_statement() {
    Token ifTok = consume();  // consume 'if'
    expect(TokenType::OPENPARENTHESIS, "Expect '(' after 'if'.");
    auto cond = parse_expression();
    expect(TokenType::CLOSEPARENTHESIS, "Expect ')' after if condition.");

    auto node = std::make_unique<IfStatementNode>();
    node->token = ifTok;
    node->condition = std::move(cond);
    node->then_branch = parse_statement();

    if (match(TokenType::ELSE)) {
        node->else_branch = parse_statement();
    }

    return node;
}

std::unique_ptr<StatementNode> Parser::parse_while_statement() {
    Token whileTok = consume();  // consume 'while'
    expect(TokenType::OPENPARENTHESIS, "Expect '(' after 'while'.");
    auto cond = parse_expression();
    expect(TokenType::CLOSEPARENTHESIS, "Expect ')' after condition.");

    auto node = std::make_unique<WhileStatementNode>();
    node->token = whileTok;
    node->condition = std::move(cond);
    node->body = parse_statement();
    return node;
}

// for ( init? ; cond? ; increment? ) stmt
std::unique_ptr<StatementNode> Parser::parse_for_statement() {
    Token forTok = consume();  // consume 'for'
    expect(TokenType::OPENPARENTHESIS, "Expect '(' after 'for'.");

    auto node = std::make_unique<ForStatementNode>();
    node->token = forTok;

    if (match(TokenType::SEMICOLON)) {
        // no initializer
    } else if (match(TokenType::VAR)) {
        node->init = parse_variable_declaration();
    } else {
        node->init = parse_expression_statement();
    }

    if (!check(TokenType::SEMICOLON)) {
        node->condition = parse_expression();
    }
    expect(TokenType::SEMICOLON, "Expect ';' after loop condition.");

    if (!check(TokenType::CLOSEPARENTHESIS)) {
        node->increment = parse_expression();
    }
    expect(TokenType::CLOSEPARENTHESIS, "Expect ')' after for clauses.");

    node->body = parse_statement();
    return node;
}

std::unique_ptr<StatementNode> Parser::parse_break_statement() {
    Token tok = consume();  // consume 'break'
    expect(TokenType::SEMICOLON, "Expect ';' after 'break'.");
    auto node = std::make_unique<BreakStatementNode>();
    node->token = tok;
    return node;
}

std::unique_ptr<StatementNode> Parser::parse_continue_statement() {
    Token tok = consume();  // consume 'continue'
    expect(TokenType::SEMICOLON, "Expect ';' after 'continue'.");
    auto node = std::make_unique<ContinueStatementNode>();
    node->token = tok;
    return node;
}
