#include "parser.hpp"

// ---------- statements ----------
std::unique_ptr<StatementNode> Parser::parse_statement() {
    NestingGuard guard(*this, statement_depth, "Statement nests too deeply.");
    if (check(TokenType::PRINT)) return parse_print_statement();
    if (check(TokenType::RETURN)) return parse_return_statement();
    if (check(TokenType::IF)) return parse_if_statement();
    if (check(TokenType::WHILE)) return parse_while_statement();
    if (check(TokenType::FOR)) return parse_for_statement();
    if (check(TokenType::BREAK)) return parse_break_statement();
    if (check(TokenType::CONTINUE)) return parse_continue_statement();
    if (check(TokenType::OPENBRACE)) return parse_block_statement();

    return parse_expression_statement();
}

std::unique_ptr<StatementNode> Parser::parse_print_statement() {
    Token printTok = consume();  // consume 'print'
    auto node = std::make_unique<PrintStatementNode>();
    node->token = printTok;
    node->expression = parse_expression();
    expect(TokenType::SEMICOLON, "Expect ';' after value.");
    return node;
}

std::unique_ptr<StatementNode> Parser::parse_expression_statement() {
    Token start = peek();
    auto node = std::make_unique<ExpressionStatementNode>();
    node->token = start;
    node->expression = parse_expression();
    expect(TokenType::SEMICOLON, "Expect ';' after expression.");
    return node;
}

std::unique_ptr<StatementNode> Parser::parse_return_statement() {
    Token retTok = consume();  // consume 'return'
    auto node = std::make_unique<ReturnStatementNode>();
    node->token = retTok;

    if (!check(TokenType::SEMICOLON)) {
        node->value = parse_expression();
    }

    expect(TokenType::SEMICOLON, "Expect ';' after return value.");
    return node;
}

// 'var' already consumed
std::unique_ptr<StatementNode> Parser::parse_variable_declaration() {
    Token nameTok = expect(TokenType::IDENTIFIER, "Expect variable name.");

    auto node = std::make_unique<VariableDeclarationNode>();
    node->identifier = nameTok.value;
    node->token = nameTok;

    if (match(TokenType::ASSIGN)) {
        node->value = parse_expression();
    }

    expect(TokenType::SEMICOLON, "Expect ';' after variable declaration.");
    return node;
}

// Parses: name(params) { body }
std::unique_ptr<FunctionDeclarationNode> Parser::parse_function_declaration(const std::string& kind) {
    NestingGuard guard(*this, statement_depth, "Statement nests too deeply.");
    Token nameTok = expect(TokenType::IDENTIFIER, "Expect " + kind + " name.");
    expect(TokenType::OPENPARENTHESIS, "Expect '(' after " + kind + " name.");

    auto fn = std::make_unique<FunctionDeclarationNode>();
    fn->name = nameTok.value;
    fn->token = nameTok;

    if (!check(TokenType::CLOSEPARENTHESIS)) {
        do {
            if (fn->params.size() >= 255) {
                diagnostics.report(Phase::Syntax, peek(), "Can't have more than 255 parameters.");
            }
            fn->params.push_back(expect(TokenType::IDENTIFIER, "Expect parameter name."));
        } while (match(TokenType::COMMA));
    }
    expect(TokenType::CLOSEPARENTHESIS, "Expect ')' after parameters.");

    expect(TokenType::OPENBRACE, "Expect '{' before " + kind + " body.");
    fn->body = parse_block();
    return fn;
}

// 'class' already consumed. Methods are written without the 'fun' keyword.
std::unique_ptr<StatementNode> Parser::parse_class_declaration() {
    Token nameTok = expect(TokenType::IDENTIFIER, "Expect class name.");

    auto cls = std::make_unique<ClassDeclarationNode>();
    cls->name = nameTok.value;
    cls->token = nameTok;

    if (match(TokenType::LESSTHAN)) {
        Token superTok = expect(TokenType::IDENTIFIER, "Expect superclass name.");
        auto sc = std::make_unique<IdentifierNode>();
        sc->name = superTok.value;
        sc->token = superTok;
        cls->superclass = std::move(sc);
    }

    expect(TokenType::OPENBRACE, "Expect '{' before class body.");

    while (!check(TokenType::CLOSEBRACE) && !is_at_end()) {
        cls->methods.push_back(parse_function_declaration("method"));
    }

    expect(TokenType::CLOSEBRACE, "Expect '}' after class body.");
    return cls;
}
