#include "parser.hpp"

// ---------- expressions (precedence) ----------
std::unique_ptr < ExpressionNode > Parser::parse_expression() {
   return parse_assignment();
}

// Right associative. The left side is parsed as an ordinary expression first
// and then checked for being a valid target.
std::unique_ptr < ExpressionNode > Parser::parse_assignment() {
   NestingGuard guard(*this, expression_depth, "Expression nests too deeply.");
   auto expr = parse_logical_or();

   if (!check(TokenType::ASSIGN)) {
      return expr;
   }

   Token equals = consume();
   auto value = parse_assignment();

   if (auto id = dynamic_cast<IdentifierNode*>(expr.get())) {
      auto node = std::make_unique < AssignmentExpressionNode > ();
      node->name = id->name;
      node->token = id->token;
      node->value = std::move(value);
      return node;
   }

   if (auto mem = dynamic_cast<MemberExpressionNode*>(expr.get())) {
      auto node = std::make_unique < MemberAssignmentNode > ();
      node->object = std::move(mem->object);
      node->property = mem->property;
      node->token = mem->token;
      node->value = std::move(value);
      return node;
   }

   // reported but not thrown: the parser is not confused about where it is
   diagnostics.report(Phase::Syntax, equals, "Invalid assignment target.");
   return expr;
}

std::unique_ptr < ExpressionNode > Parser::parse_logical_or() {
   auto left = parse_logical_and();
   while (check(TokenType::OR)) {
      Token op = consume();
      auto right = parse_logical_and();
      auto node = std::make_unique < LogicalExpressionNode > ();
      node->op = op.value;
      node->left = std::move(left);
      node->right = std::move(right);
      node->token = op;
      left = std::move(node);
   }
   return left;
}

std::unique_ptr < ExpressionNode > Parser::parse_logical_and() {
   auto left = parse_equality();
   while (check(TokenType::AND)) {
      Token op = consume();
      auto right = parse_equality();
      auto node = std::make_unique < LogicalExpressionNode > ();
      node->op = op.value;
      node->left = std::move(left);
      node->right = std::move(right);
      node->token = op;
      left = std::move(node);
   }
   return left;
}

std::unique_ptr < ExpressionNode > Parser::parse_equality() {
   auto left = parse_comparison();
   while (check(TokenType::EQUALITY) || check(TokenType::NOTEQUAL)) {
      Token op = consume();
      auto right = parse_comparison();
      auto node = std::make_unique < BinaryExpressionNode > ();
      node->op = op.value;
      node->left = std::move(left);
      node->right = std::move(right);
      node->token = op;
      left = std::move(node);
   }
   return left;
}

std::unique_ptr < ExpressionNode > Parser::parse_comparison() {
   auto left = parse_additive();
   while (check(TokenType::GREATERTHAN) ||
      check(TokenType::GREATEROREQUALTHAN) ||
      check(TokenType::LESSTHAN) ||
      check(TokenType::LESSOREQUALTHAN)) {
      Token op = consume();
      auto right = parse_additive();
      auto node = std::make_unique < BinaryExpressionNode > ();
      node->op = op.value;
      node->left = std::move(left);
      node->right = std::move(right);
      node->token = op;
      left = std::move(node);
   }
   return left;
}

std::unique_ptr < ExpressionNode > Parser::parse_additive() {
   auto left = parse_multiplicative();
   while (check(TokenType::PLUS) || check(TokenType::MINUS)) {
      Token op = consume();
      auto right = parse_multiplicative();
      auto node = std::make_unique < BinaryExpressionNode > ();
      node->op = op.value;
      node->left = std::move(left);
      node->right = std::move(right);
      node->token = op;
      left = std::move(node);
   }
   return left;
}

std::unique_ptr < ExpressionNode > Parser::parse_multiplicative() {
   auto left = parse_unary();
   while (check(TokenType::STAR) || check(TokenType::SLASH)) {
      Token op = consume();
      auto right = parse_unary();
      auto node = std::make_unique < BinaryExpressionNode > ();
      node->op = op.value;
      node->left = std::move(left);
      node->right = std::move(right);
      node->token = op;
      left = std::move(node);
   }
   return left;
}

std::unique_ptr < ExpressionNode > Parser::parse_unary() {
   if (check(TokenType::NOT) || check(TokenType::MINUS)) {
      NestingGuard guard(*this, expression_depth, "Expression nests too deeply.");
      Token op = consume();
      auto operand = parse_unary();
      auto node = std::make_unique < UnaryExpressionNode > ();
      node->op = op.value;
      node->operand = std::move(operand);
      node->token = op;
      return node;
   }
   return parse_postfix();
}

// calls and property access chain left to right: a.b(c).d()
std::unique_ptr < ExpressionNode > Parser::parse_postfix() {
   auto node = parse_primary();

   while (true) {
      if (check(TokenType::OPENPARENTHESIS)) {
         node = parse_call(std::move(node));
         continue;
      }
      if (check(TokenType::DOT)) {
         consume(); // consume '.'
         Token propTok = expect(TokenType::IDENTIFIER, "Expect property name after '.'.");
         auto mem = std::make_unique < MemberExpressionNode > ();
         mem->object = std::move(node);
         mem->property = propTok.value;
         mem->token = propTok;
         node = std::move(mem);
         continue;
      }
      break;
   }

   return node;
}

std::unique_ptr < ExpressionNode > Parser::parse_call(std::unique_ptr < ExpressionNode > callee) {
   expect(TokenType::OPENPARENTHESIS, "Expect '(' in call.");
   auto call = std::make_unique < CallExpressionNode > ();
   call->callee = std::move(callee);
   if (!check(TokenType::CLOSEPARENTHESIS)) {
      do {
         if (call->arguments.size() >= 255) {
            diagnostics.report(Phase::Syntax, peek(), "Can't have more than 255 arguments.");
         }
         call->arguments.push_back(parse_expression());
      } while (match(TokenType::COMMA));
   }

   // runtime errors in the call point at the closing paren
   call->token = expect(TokenType::CLOSEPARENTHESIS, "Expect ')' after arguments.");
   return call;
}

std::unique_ptr < ExpressionNode > Parser::parse_primary() {
   Token t = peek();

   if (t.type == TokenType::NUMBER) {
      consume();
      auto n = std::make_unique < NumericLiteralNode > ();
      n->value = std::get<double>(t.literal);
      n->token = t;
      return n;
   }

   if (t.type == TokenType::STRING) {
      consume();
      auto n = std::make_unique < StringLiteralNode > ();
      n->value = std::get<std::string>(t.literal);
      n->token = t;
      return n;
   }

   if (t.type == TokenType::BOOLEAN) {
      consume();
      auto n = std::make_unique < BooleanLiteralNode > ();
      n->value = std::get<bool>(t.literal);
      n->token = t;
      return n;
   }

   if (t.type == TokenType::NIL) {
      consume();
      auto n = std::make_unique < NullNode > ();
      n->token = t;
      return n;
   }

   if (t.type == TokenType::THIS) {
      consume();
      auto n = std::make_unique < ThisExpressionNode > ();
      n->token = t;
      return n;
   }

   if (t.type == TokenType::SUPER) {
      consume();
      expect(TokenType::DOT, "Expect '.' after 'super'.");
      Token method = expect(TokenType::IDENTIFIER, "Expect superclass method name.");
      auto n = std::make_unique < SuperExpressionNode > ();
      n->method = method.value;
      n->token = t;
      return n;
   }

   if (t.type == TokenType::IDENTIFIER) {
      consume();
      auto id = std::make_unique < IdentifierNode > ();
      id->name = t.value;
      id->token = t;
      return id;
   }

   if (t.type == TokenType::OPENPARENTHESIS) {
      consume();
      auto g = std::make_unique < GroupingNode > ();
      g->token = t;
      g->expression = parse_expression();
      expect(TokenType::CLOSEPARENTHESIS, "Expect ')' after expression.");
      return g;
   }

   throw error(t, "Expect expression.");
}
