// xmas/syntax/parser.cpp - Recursive-descent parser
//
#include "xmas/syntax/parser.hpp"

#include <optional>
#include <string>

namespace xmas::syntax
{
namespace
{

SourceRange join_ranges(SourceRange a, SourceRange b)
{
  if (a.is_invalid()) return b;
  if (b.is_invalid()) return a;
  return {a.get_begin(), b.get_end()};
}

std::string unescape_string(std::string_view raw)
{
  std::string out;
  out.reserve(raw.size());
  for (size_t i = 0; i < raw.size(); ++i) {
    const char c = raw[i];
    if (c != '\\' || i + 1 >= raw.size()) {
      out.push_back(c);
      continue;
    }
    const char esc = raw[i + 1];
    switch (esc) {
      case 'n':
        out.push_back('\n');
        ++i;
        break;
      case 't':
        out.push_back('\t');
        ++i;
        break;
      case '\\':
        out.push_back('\\');
        ++i;
        break;
      case '"':
        out.push_back('"');
        ++i;
        break;
      default:
        // Unknown escapes are kept verbatim.
        out.push_back(c);
        break;
    }
  }
  return out;
}

std::string describe(const Token & t)
{
  switch (t.kind) {
    case TokenKind::Identifier:
    case TokenKind::Number:
      return "'" + std::string(t.text) + "'";
    case TokenKind::String:
      return "\"" + std::string(t.text) + "\"";
    default:
      return "'" + std::string(to_string(t.kind)) + "'";
  }
}

std::optional<BinaryOp> compound_assign_op(TokenKind k)
{
  switch (k) {
    case TokenKind::PlusEq:
      return BinaryOp::Add;
    case TokenKind::MinusEq:
      return BinaryOp::Sub;
    case TokenKind::StarEq:
      return BinaryOp::Mul;
    case TokenKind::SlashEq:
      return BinaryOp::Div;
    case TokenKind::PercentEq:
      return BinaryOp::Mod;
    default:
      return std::nullopt;
  }
}

/// Marks a region of the parse as speculative: errors inside it are not reported.
class SpeculationScope
{
public:
  explicit SpeculationScope(bool & flag) : flag_(flag), saved_(flag) { flag_ = true; }
  ~SpeculationScope() { flag_ = saved_; }

  SpeculationScope(const SpeculationScope &) = delete;
  SpeculationScope & operator=(const SpeculationScope &) = delete;

private:
  bool & flag_;
  bool saved_;
};

}  // namespace

// ============================================================================
// Token helpers
// ============================================================================

const Token & Parser::cur(size_t lookahead) const
{
  const size_t i = idx_ + lookahead;
  if (i >= tokens_.size()) {
    return tokens_.back();
  }
  return tokens_[i];
}

bool Parser::at(TokenKind k) const { return cur().kind == k; }

bool Parser::at_eof() const { return at(TokenKind::Eof); }

const Token & Parser::advance()
{
  const Token & t = cur();
  if (!at_eof()) {
    ++idx_;
  }
  return t;
}

bool Parser::match(TokenKind k)
{
  if (at(k)) {
    advance();
    return true;
  }
  return false;
}

bool Parser::expect(TokenKind k, std::string_view message)
{
  if (match(k)) {
    return true;
  }
  error_at(cur(), message);
  return false;
}

void Parser::error_at(const Token & t, std::string_view msg)
{
  if (speculating_) {
    return;
  }
  if (t.kind == TokenKind::Unknown) {
    diags_.report_error(t.range, "unexpected character '&'", "not a valid token")
      .with_code(diag_code::k_unexpected_character)
      .with_help("use '&&' for logical and");
    return;
  }
  diags_.report_error(t.range, std::string(msg)).with_code(diag_code::k_syntax_error);
}

void Parser::skip_newlines_and_comments()
{
  while (at(TokenKind::Newline) || at(TokenKind::Comment)) {
    advance();
  }
}

// ============================================================================
// Program / statements
// ============================================================================

Program * Parser::parse_program()
{
  if (tokens_.empty() || tokens_.back().kind != TokenKind::Eof) {
    Token eof;
    eof.kind = TokenKind::Eof;
    if (!tokens_.empty()) {
      const uint32_t end = tokens_.back().end();
      eof.range = SourceRange(end, end);
    } else {
      eof.range = SourceRange(0, 0);
    }
    tokens_.push_back(eof);
  }

  std::vector<Stmt *> stmts;
  skip_newlines_and_comments();
  while (!at_eof()) {
    Stmt * s = parse_stmt();
    if (!s) {
      return nullptr;
    }
    stmts.push_back(s);
    skip_newlines_and_comments();
  }

  const SourceRange range(0, tokens_.back().end());
  return ast_.create<Program>(ast_.copy_to_arena(stmts), range);
}

bool Parser::looks_like_function_def() const
{
  // name ( ... ) =
  if (cur().kind != TokenKind::Identifier || cur(1).kind != TokenKind::LParen) {
    return false;
  }
  size_t i = 1;
  int depth = 0;
  while (true) {
    const TokenKind k = cur(i).kind;
    if (k == TokenKind::Eof) {
      return false;
    }
    if (k == TokenKind::LParen) {
      ++depth;
    } else if (k == TokenKind::RParen) {
      --depth;
      if (depth == 0) {
        return cur(i + 1).kind == TokenKind::Eq;
      }
    }
    ++i;
  }
}

Stmt * Parser::parse_stmt()
{
  if (looks_like_function_def()) {
    return parse_function_def();
  }

  const Token target = cur();
  if (target.kind == TokenKind::Identifier || target.kind == TokenKind::Underscore) {
    if (const auto op = compound_assign_op(cur(1).kind)) {
      advance();
      advance();
      Expr * value = parse_expr();
      if (!value) return nullptr;
      return ast_.create<CompoundAssignStmt>(
        ast_.intern(target.text), *op, value, join_ranges(target.range, value->get_range()));
    }

    if (cur(1).kind == TokenKind::Eq) {
      advance();
      advance();
      Expr * value = parse_expr();
      if (!value) return nullptr;
      const SourceRange range = join_ranges(target.range, value->get_range());

      if (target.kind == TokenKind::Underscore) {
        return ast_.create<ReturnStmt>(std::nullopt, value, range);
      }
      if (target.text.size() > 1 && target.text.front() == '_') {
        return ast_.create<ReturnStmt>(ast_.intern(target.text.substr(1)), value, range);
      }
      return ast_.create<AssignStmt>(ast_.intern(target.text), value, range);
    }
  }

  Expr * e = parse_expr();
  if (!e) return nullptr;
  return ast_.create<ExprStmt>(e, e->get_range());
}

FunctionDefStmt * Parser::parse_function_def()
{
  const Token name = advance();
  advance();  // (

  std::vector<std::string_view> params;
  if (!at(TokenKind::RParen)) {
    do {
      if (!at(TokenKind::Identifier)) {
        error_at(cur(), "Expected parameter name");
        return nullptr;
      }
      params.push_back(ast_.intern(advance().text));
    } while (match(TokenKind::Comma));
  }

  if (!expect(TokenKind::RParen, "Expected ')' after parameters")) return nullptr;
  if (!expect(TokenKind::Eq, "Expected '=' after function definition")) return nullptr;

  Expr * body = parse_expr();
  if (!body) return nullptr;

  return ast_.create<FunctionDefStmt>(
    ast_.intern(name.text), ast_.copy_to_arena(params), body,
    join_ranges(name.range, body->get_range()));
}

BlockExpr * Parser::parse_block()
{
  const Token open = advance();  // {

  std::vector<Stmt *> stmts;
  skip_newlines_and_comments();
  while (!at(TokenKind::RBrace) && !at_eof()) {
    Stmt * s = parse_stmt();
    if (!s) return nullptr;
    stmts.push_back(s);
    skip_newlines_and_comments();
  }

  if (!at(TokenKind::RBrace)) {
    if (!speculating_) {
      diags_.report_error(cur().range, "Expected '}' after block")
        .with_code(diag_code::k_syntax_error)
        .with_secondary_label(open.range, "block opened here");
    }
    return nullptr;
  }
  const Token close = advance();
  return ast_.create<BlockExpr>(ast_.copy_to_arena(stmts), join_ranges(open.range, close.range));
}

// ============================================================================
// Expressions
// ============================================================================

Expr * Parser::parse_expr()
{
  Expr * lhs = parse_or();
  if (!lhs) return nullptr;

  while (match(TokenKind::PipeGreater)) {
    Expr * rhs = parse_or();
    if (!rhs) return nullptr;
    lhs = ast_.create<PipeExpr>(lhs, rhs, join_ranges(lhs->get_range(), rhs->get_range()));
  }
  return lhs;
}

Expr * Parser::parse_or()
{
  Expr * lhs = parse_and();
  if (!lhs) return nullptr;

  while (match(TokenKind::OrOr)) {
    Expr * rhs = parse_and();
    if (!rhs) return nullptr;
    lhs = ast_.create<BinaryExpr>(
      lhs, BinaryOp::Or, rhs, join_ranges(lhs->get_range(), rhs->get_range()));
  }
  return lhs;
}

Expr * Parser::parse_and()
{
  Expr * lhs = parse_comparison();
  if (!lhs) return nullptr;

  while (match(TokenKind::AndAnd)) {
    Expr * rhs = parse_comparison();
    if (!rhs) return nullptr;
    lhs = ast_.create<BinaryExpr>(
      lhs, BinaryOp::And, rhs, join_ranges(lhs->get_range(), rhs->get_range()));
  }
  return lhs;
}

Expr * Parser::parse_comparison()
{
  Expr * lhs = parse_add();
  if (!lhs) return nullptr;

  while (true) {
    BinaryOp op;
    if (at(TokenKind::Lt)) {
      op = BinaryOp::Lt;
    } else if (at(TokenKind::Gt)) {
      op = BinaryOp::Gt;
    } else if (at(TokenKind::Le)) {
      op = BinaryOp::Le;
    } else if (at(TokenKind::Ge)) {
      op = BinaryOp::Ge;
    } else if (at(TokenKind::EqEq)) {
      op = BinaryOp::Eq;
    } else {
      break;
    }
    advance();

    Expr * rhs = parse_add();
    if (!rhs) return nullptr;
    lhs = ast_.create<BinaryExpr>(lhs, op, rhs, join_ranges(lhs->get_range(), rhs->get_range()));
  }
  return lhs;
}

Expr * Parser::parse_add()
{
  Expr * lhs = parse_mul();
  if (!lhs) return nullptr;

  while (at(TokenKind::Plus) || at(TokenKind::Minus)) {
    const BinaryOp op = at(TokenKind::Plus) ? BinaryOp::Add : BinaryOp::Sub;
    advance();
    Expr * rhs = parse_mul();
    if (!rhs) return nullptr;
    lhs = ast_.create<BinaryExpr>(lhs, op, rhs, join_ranges(lhs->get_range(), rhs->get_range()));
  }
  return lhs;
}

Expr * Parser::parse_mul()
{
  Expr * lhs = parse_unary();
  if (!lhs) return nullptr;

  while (at(TokenKind::Star) || at(TokenKind::Slash) || at(TokenKind::Percent)) {
    BinaryOp op = BinaryOp::Mul;
    if (at(TokenKind::Slash)) {
      op = BinaryOp::Div;
    } else if (at(TokenKind::Percent)) {
      op = BinaryOp::Mod;
    }
    advance();
    Expr * rhs = parse_unary();
    if (!rhs) return nullptr;
    lhs = ast_.create<BinaryExpr>(lhs, op, rhs, join_ranges(lhs->get_range(), rhs->get_range()));
  }
  return lhs;
}

Expr * Parser::parse_unary()
{
  skip_newlines_and_comments();
  if (at(TokenKind::Tilde) || at(TokenKind::Bang)) {
    const Token op_tok = advance();
    const UnaryOp op = (op_tok.kind == TokenKind::Tilde) ? UnaryOp::ToNumber : UnaryOp::Not;
    Expr * operand = parse_unary();
    if (!operand) return nullptr;
    return ast_.create<UnaryExpr>(op, operand, join_ranges(op_tok.range, operand->get_range()));
  }
  return parse_postfix();
}

Expr * Parser::parse_postfix()
{
  Expr * e = parse_primary();
  if (!e) return nullptr;

  while (true) {
    if (at(TokenKind::LBracket)) {
      e = parse_index_group(e);
      if (!e) return nullptr;
      continue;
    }

    if (match(TokenKind::Dot)) {
      if (!at(TokenKind::Identifier)) {
        error_at(cur(), "Expected method name after '.'");
        return nullptr;
      }
      const Token method = advance();
      if (!expect(TokenKind::LParen, "Expected '(' after method name")) return nullptr;

      std::vector<Expr *> args;
      if (!parse_expr_list(args, TokenKind::RParen)) return nullptr;
      if (!at(TokenKind::RParen)) {
        error_at(cur(), "Expected ')' after arguments");
        return nullptr;
      }
      const Token close = advance();
      e = ast_.create<MethodCallExpr>(
        e, ast_.intern(method.text), ast_.copy_to_arena(args),
        join_ranges(e->get_range(), close.range));
      continue;
    }

    break;
  }
  return e;
}

Expr * Parser::parse_primary()
{
  skip_newlines_and_comments();
  const Token t = cur();

  switch (t.kind) {
    case TokenKind::Number:
      advance();
      return ast_.create<NumberLiteralExpr>(t.number, t.range);

    case TokenKind::String:
      advance();
      return ast_.create<StringLiteralExpr>(ast_.intern(unescape_string(t.text)), t.range);

    case TokenKind::KwTrue:
    case TokenKind::KwFalse:
      advance();
      return ast_.create<BoolLiteralExpr>(t.kind == TokenKind::KwTrue, t.range);

    case TokenKind::KwInput:
      advance();
      return ast_.create<InputRefExpr>(t.range);

    case TokenKind::Underscore:
      advance();
      return ast_.create<ReturnValueExpr>(t.range);

    case TokenKind::Identifier: {
      advance();
      if (!match(TokenKind::LParen)) {
        return ast_.create<VarRefExpr>(ast_.intern(t.text), t.range);
      }
      std::vector<Expr *> args;
      if (!parse_expr_list(args, TokenKind::RParen)) return nullptr;
      if (!at(TokenKind::RParen)) {
        error_at(cur(), "Expected ')' after arguments");
        return nullptr;
      }
      const Token close = advance();
      return ast_.create<CallExpr>(
        ast_.intern(t.text), ast_.copy_to_arena(args), join_ranges(t.range, close.range));
    }

    case TokenKind::LBracket:
      return parse_bracket_literal();

    case TokenKind::LBrace:
      return parse_block();

    case TokenKind::LParen: {
      advance();
      Expr * inner = parse_expr();
      if (!inner) return nullptr;
      skip_newlines_and_comments();
      if (!expect(TokenKind::RParen, "Expected ')' after expression")) return nullptr;
      return inner;
    }

    case TokenKind::KwIf:
    case TokenKind::KwFor:
    case TokenKind::KwLen:
    case TokenKind::KwMax:
    case TokenKind::KwMin:
    case TokenKind::KwFloor:
    case TokenKind::KwCeil:
      return parse_builtin();

    case TokenKind::Eof:
      error_at(t, "Unexpected end of input");
      return nullptr;

    default:
      error_at(t, "Unexpected token: " + describe(t));
      return nullptr;
  }
}

Expr * Parser::parse_bracket_literal()
{
  const Token open = advance();  // [
  const size_t checkpoint = idx_;

  // `[start..end]` is a range literal. When the first element parses but is
  // not followed by `..` it is kept as the first array element.
  Expr * first = nullptr;
  size_t after_first = checkpoint;
  {
    const SpeculationScope speculate(speculating_);
    skip_newlines_and_comments();
    if (!at(TokenKind::RBracket)) {
      first = parse_expr();
      after_first = idx_;
    }
    if (first) {
      skip_newlines_and_comments();
      if (match(TokenKind::DotDot)) {
        skip_newlines_and_comments();
        Expr * last = parse_expr();
        if (last) {
          skip_newlines_and_comments();
          if (at(TokenKind::RBracket)) {
            const Token close = advance();
            return ast_.create<RangeLiteralExpr>(
              first, last, join_ranges(open.range, close.range));
          }
        }
        // Not a well-formed range; reparse as an array so the error is reported.
        first = nullptr;
      }
    }
  }

  std::vector<Expr *> elements;
  if (first) {
    idx_ = after_first;
    elements.push_back(first);
    skip_newlines_and_comments();
    while (match(TokenKind::Comma)) {
      Expr * e = parse_expr();
      if (!e) return nullptr;
      elements.push_back(e);
      skip_newlines_and_comments();
    }
  } else {
    idx_ = checkpoint;
    if (!parse_expr_list(elements, TokenKind::RBracket)) return nullptr;
  }

  if (!at(TokenKind::RBracket)) {
    error_at(cur(), "Expected ']' after array elements");
    return nullptr;
  }
  const Token close = advance();
  return ast_.create<ArrayLiteralExpr>(
    ast_.copy_to_arena(elements), join_ranges(open.range, close.range));
}

IndexExpr * Parser::parse_index_group(Expr * base)
{
  advance();  // [

  std::vector<IndexComponent *> components;
  do {
    IndexComponent * c = parse_index_component();
    if (!c) return nullptr;
    components.push_back(c);
    skip_newlines_and_comments();
  } while (match(TokenKind::Comma));

  if (!at(TokenKind::RBracket)) {
    error_at(cur(), "Expected ']' after index");
    return nullptr;
  }
  const Token close = advance();
  return ast_.create<IndexExpr>(
    base, ast_.copy_to_arena(components), join_ranges(base->get_range(), close.range));
}

IndexComponent * Parser::parse_index_component()
{
  skip_newlines_and_comments();

  Expr * start = nullptr;
  if (!at(TokenKind::DotDot)) {
    start = parse_expr();
    if (!start) return nullptr;
    if (!at(TokenKind::DotDot)) {
      return ast_.create<IndexComponent>(start, start->get_range());
    }
  }

  const Token dots = advance();  // ..
  SourceRange range = start ? join_ranges(start->get_range(), dots.range) : dots.range;

  Expr * end = nullptr;
  if (!at(TokenKind::RBracket) && !at(TokenKind::Comma)) {
    end = parse_expr();
    if (!end) return nullptr;
    range = join_ranges(range, end->get_range());
  }
  return ast_.create<IndexComponent>(start, end, range);
}

Expr * Parser::parse_builtin()
{
  const Token kw = advance();
  if (kw.kind == TokenKind::KwFor) {
    return parse_for(kw);
  }

  BuiltinKind builtin = BuiltinKind::If;
  std::string_view close_message = "Expected ')' after arguments";
  switch (kw.kind) {
    case TokenKind::KwIf:
      builtin = BuiltinKind::If;
      close_message = "Expected ')' after if expression";
      break;
    case TokenKind::KwLen:
      builtin = BuiltinKind::Len;
      close_message = "Expected ')' after len argument";
      break;
    case TokenKind::KwMax:
      builtin = BuiltinKind::Max;
      break;
    case TokenKind::KwMin:
      builtin = BuiltinKind::Min;
      break;
    case TokenKind::KwFloor:
      builtin = BuiltinKind::Floor;
      break;
    case TokenKind::KwCeil:
      builtin = BuiltinKind::Ceil;
      break;
    default:
      error_at(kw, "Unexpected token: " + describe(kw));
      return nullptr;
  }

  const std::string open_message = "Expected '(' after '" + std::string(kw.text) + "'";
  if (!expect(TokenKind::LParen, open_message)) return nullptr;

  std::vector<Expr *> args;
  if (!parse_expr_list(args, TokenKind::RParen)) return nullptr;
  if (!at(TokenKind::RParen)) {
    error_at(cur(), close_message);
    return nullptr;
  }
  const Token close = advance();
  return ast_.create<BuiltinExpr>(
    builtin, ast_.copy_to_arena(args), join_ranges(kw.range, close.range));
}

Expr * Parser::parse_for(const Token & kw)
{
  if (!expect(TokenKind::LParen, "Expected '(' after 'for'")) return nullptr;

  skip_newlines_and_comments();
  if (!at(TokenKind::Identifier)) {
    error_at(cur(), "Expected variable name after 'for'");
    return nullptr;
  }
  const Token var = advance();
  if (!expect(TokenKind::KwOf, "Expected 'of' after variable name")) return nullptr;

  // array, body[, initial]
  std::vector<Expr *> args;
  if (!parse_expr_list(args, TokenKind::RParen)) return nullptr;
  if (!at(TokenKind::RParen)) {
    error_at(cur(), "Expected ')' after for expression");
    return nullptr;
  }
  const Token close = advance();
  return ast_.create<BuiltinExpr>(
    BuiltinKind::For, ast_.intern(var.text), ast_.copy_to_arena(args),
    join_ranges(kw.range, close.range));
}

bool Parser::parse_expr_list(std::vector<Expr *> & out, TokenKind close)
{
  skip_newlines_and_comments();
  if (at(close)) {
    return true;
  }
  while (true) {
    Expr * e = parse_expr();
    if (!e) return false;
    out.push_back(e);
    skip_newlines_and_comments();
    if (!match(TokenKind::Comma)) {
      return true;
    }
  }
}

}  // namespace xmas::syntax
