// xmas/syntax/parser.hpp - Recursive descent parser for xmas
//
#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "xmas/ast/ast.hpp"
#include "xmas/ast/ast_context.hpp"
#include "xmas/basic/diagnostic.hpp"
#include "xmas/syntax/token.hpp"

namespace xmas::syntax
{

/**
 * Recursive descent parser producing an arena-allocated Program.
 *
 * The first syntax error is reported to the DiagnosticBag and aborts the
 * parse; parse_program() then returns nullptr. There is no recovery.
 */
class Parser
{
public:
  Parser(AstContext & ast, DiagnosticBag & diags, std::vector<Token> tokens)
  : ast_(ast), diags_(diags), tokens_(std::move(tokens))
  {
  }

  [[nodiscard]] Program * parse_program();

private:
  // Token helpers
  [[nodiscard]] const Token & cur(size_t lookahead = 0) const;
  [[nodiscard]] bool at(TokenKind k) const;
  [[nodiscard]] bool at_eof() const;

  const Token & advance();
  bool match(TokenKind k);
  bool expect(TokenKind k, std::string_view message);

  void error_at(const Token & t, std::string_view msg);

  void skip_newlines_and_comments();

  // Lookahead
  [[nodiscard]] bool looks_like_function_def() const;

  // Statements
  [[nodiscard]] Stmt * parse_stmt();
  [[nodiscard]] FunctionDefStmt * parse_function_def();
  [[nodiscard]] BlockExpr * parse_block();

  // Expressions
  [[nodiscard]] Expr * parse_expr();
  [[nodiscard]] Expr * parse_or();
  [[nodiscard]] Expr * parse_and();
  [[nodiscard]] Expr * parse_comparison();
  [[nodiscard]] Expr * parse_add();
  [[nodiscard]] Expr * parse_mul();
  [[nodiscard]] Expr * parse_unary();
  [[nodiscard]] Expr * parse_postfix();
  [[nodiscard]] Expr * parse_primary();

  [[nodiscard]] Expr * parse_bracket_literal();
  [[nodiscard]] IndexExpr * parse_index_group(Expr * base);
  [[nodiscard]] IndexComponent * parse_index_component();
  [[nodiscard]] Expr * parse_builtin();
  [[nodiscard]] Expr * parse_for(const Token & kw);

  /// Parse `expr (, expr)*` up to (not including) `close`. Empty lists are allowed.
  bool parse_expr_list(std::vector<Expr *> & out, TokenKind close);

  AstContext & ast_;
  DiagnosticBag & diags_;
  std::vector<Token> tokens_;
  size_t idx_ = 0;
  bool speculating_ = false;
};

}  // namespace xmas::syntax
