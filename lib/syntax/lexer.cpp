// xmas/syntax/lexer.cpp - Hand-written lexer
//
#include "xmas/syntax/lexer.hpp"

#include <cctype>
#include <charconv>
#include <system_error>

namespace xmas::syntax
{
namespace
{

bool is_ident_start(unsigned char c) { return (std::isalpha(c) != 0) || c == '_'; }
bool is_ident_continue(unsigned char c) { return (std::isalnum(c) != 0) || c == '_'; }

TokenKind keyword_kind(std::string_view word)
{
  struct Keyword
  {
    std::string_view text;
    TokenKind kind;
  };
  static constexpr Keyword k_keywords[] = {
    {"if", TokenKind::KwIf},       {"for", TokenKind::KwFor},     {"of", TokenKind::KwOf},
    {"input", TokenKind::KwInput}, {"len", TokenKind::KwLen},     {"max", TokenKind::KwMax},
    {"min", TokenKind::KwMin},     {"floor", TokenKind::KwFloor}, {"ceil", TokenKind::KwCeil},
    {"true", TokenKind::KwTrue},   {"false", TokenKind::KwFalse},
  };
  for (const auto & kw : k_keywords) {
    if (kw.text == word) {
      return kw.kind;
    }
  }
  return TokenKind::Identifier;
}

}  // namespace

bool Lexer::starts_with(std::string_view s) const noexcept
{
  return src_.size() >= pos_ + s.size() && src_.substr(pos_, s.size()) == s;
}

void Lexer::advance(size_t n) noexcept
{
  for (size_t i = 0; i < n && !eof(); ++i) {
    if (src_[pos_] == '\n') {
      ++line_;
      column_ = 1;
    } else {
      ++column_;
    }
    ++pos_;
  }
}

void Lexer::skip_whitespace()
{
  while (!eof()) {
    const char c = peek();
    if (c == ' ' || c == '\t' || c == '\r') {
      advance(1);
      continue;
    }
    break;
  }
}

Token Lexer::make_token(TokenKind kind, uint32_t start, LineColumn pos) const noexcept
{
  const auto end = static_cast<uint32_t>(pos_);
  Token t;
  t.kind = kind;
  t.range = SourceRange(start, end);
  t.text = src_.substr(start, end - start);
  t.pos = pos;
  return t;
}

Token Lexer::lex_identifier_or_keyword(uint32_t start, LineColumn pos)
{
  advance(1);
  while (!eof() && is_ident_continue(static_cast<unsigned char>(peek()))) {
    advance(1);
  }
  Token t = make_token(TokenKind::Identifier, start, pos);
  t.kind = keyword_kind(t.text);
  return t;
}

Token Lexer::lex_number(uint32_t start, LineColumn pos)
{
  // Integers only: a following '.' (or '..') is never part of the literal.
  while (!eof() && std::isdigit(static_cast<unsigned char>(peek())) != 0) {
    advance(1);
  }

  Token t = make_token(TokenKind::Number, start, pos);
  int64_t v = 0;
  const auto res = std::from_chars(t.text.data(), t.text.data() + t.text.size(), v);
  t.number = (res.ec == std::errc()) ? v : 0;
  return t;
}

Token Lexer::lex_string(uint32_t start, LineColumn pos)
{
  advance(1);  // opening quote
  const auto payload_start = static_cast<uint32_t>(pos_);

  while (!eof() && peek() != '"') {
    if (peek() == '\\') {
      const char esc = peek(1);
      if (esc == 'n' || esc == 't' || esc == '\\' || esc == '"') {
        advance(2);
        continue;
      }
    }
    advance(1);
  }

  const auto payload_end = static_cast<uint32_t>(pos_);
  if (!eof()) {
    advance(1);  // closing quote; unterminated strings run to end of input
  }

  Token t = make_token(TokenKind::String, start, pos);
  t.text = src_.substr(payload_start, payload_end - payload_start);
  return t;
}

Token Lexer::lex_comment(uint32_t start, LineColumn pos)
{
  advance(2);  // //
  const auto body_start = static_cast<uint32_t>(pos_);
  while (!eof() && peek() != '\n') {
    advance(1);
  }
  Token t = make_token(TokenKind::Comment, start, pos);
  t.text = src_.substr(body_start, pos_ - body_start);
  return t;
}

Token Lexer::next_token()
{
  while (true) {
    skip_whitespace();

    const auto start = static_cast<uint32_t>(pos_);
    const LineColumn pos{line_, column_};

    if (eof()) {
      return make_token(TokenKind::Eof, start, pos);
    }

    const auto c = static_cast<unsigned char>(peek());

    if (c == '_' && !is_ident_continue(static_cast<unsigned char>(peek(1)))) {
      advance(1);
      return make_token(TokenKind::Underscore, start, pos);
    }
    if (is_ident_start(c)) {
      return lex_identifier_or_keyword(start, pos);
    }
    if (std::isdigit(c) != 0) {
      return lex_number(start, pos);
    }
    if (c == '"') {
      return lex_string(start, pos);
    }
    if (starts_with("//")) {
      return lex_comment(start, pos);
    }

    // Multi-char operators
    struct Op
    {
      std::string_view text;
      TokenKind kind;
    };
    static constexpr Op k_multi[] = {
      {"+=", TokenKind::PlusEq},      {"-=", TokenKind::MinusEq},    {"*=", TokenKind::StarEq},
      {"/=", TokenKind::SlashEq},     {"%=", TokenKind::PercentEq},  {"==", TokenKind::EqEq},
      {"<=", TokenKind::Le},          {">=", TokenKind::Ge},         {"|>", TokenKind::PipeGreater},
      {">|", TokenKind::PipeGreater}, {"&&", TokenKind::AndAnd},     {"||", TokenKind::OrOr},
      {"..", TokenKind::DotDot},
    };
    for (const auto & op : k_multi) {
      if (starts_with(op.text)) {
        advance(op.text.size());
        return make_token(op.kind, start, pos);
      }
    }

    // Single-char tokens
    const char ch = peek();
    advance(1);

    switch (ch) {
      case '\n':
        return make_token(TokenKind::Newline, start, pos);
      case '(':
        return make_token(TokenKind::LParen, start, pos);
      case ')':
        return make_token(TokenKind::RParen, start, pos);
      case '{':
        return make_token(TokenKind::LBrace, start, pos);
      case '}':
        return make_token(TokenKind::RBrace, start, pos);
      case '[':
        return make_token(TokenKind::LBracket, start, pos);
      case ']':
        return make_token(TokenKind::RBracket, start, pos);
      case ',':
        return make_token(TokenKind::Comma, start, pos);
      case '.':
        return make_token(TokenKind::Dot, start, pos);
      case '+':
        return make_token(TokenKind::Plus, start, pos);
      case '-':
        return make_token(TokenKind::Minus, start, pos);
      case '*':
        return make_token(TokenKind::Star, start, pos);
      case '/':
        return make_token(TokenKind::Slash, start, pos);
      case '%':
        return make_token(TokenKind::Percent, start, pos);
      case '~':
        return make_token(TokenKind::Tilde, start, pos);
      case '!':
        return make_token(TokenKind::Bang, start, pos);
      case '|':
        return make_token(TokenKind::Pipe, start, pos);
      case '=':
        return make_token(TokenKind::Eq, start, pos);
      case '<':
        return make_token(TokenKind::Lt, start, pos);
      case '>':
        return make_token(TokenKind::Gt, start, pos);
      case '&':
        return make_token(TokenKind::Unknown, start, pos);
      default:
        break;
    }
    // Anything else (including ';') carries no meaning and is dropped.
  }
}

std::vector<Token> Lexer::lex_all()
{
  std::vector<Token> out;
  while (true) {
    const Token t = next_token();
    out.push_back(t);
    if (t.kind == TokenKind::Eof) {
      break;
    }
  }
  return out;
}

}  // namespace xmas::syntax
