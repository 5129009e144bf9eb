// xmas/syntax/token.hpp - Token kinds and the Token record
//
#pragma once

#include <cstdint>
#include <string_view>

#include "xmas/basic/source_manager.hpp"

namespace xmas::syntax
{

enum class TokenKind : uint8_t {
  Eof,
  Unknown,  // a lone '&'

  // Statement separators; the parser skips them where the grammar allows
  Newline,
  Comment,  // // ...  (token.text is the comment body)

  Identifier,  // includes named return slots such as `_acc`
  Number,
  String,      // token.text is the raw interior (escapes not yet decoded)
  Underscore,  // bare `_`

  // Keywords
  KwIf,
  KwFor,
  KwOf,
  KwInput,
  KwLen,
  KwMax,
  KwMin,
  KwFloor,
  KwCeil,
  KwTrue,
  KwFalse,

  // Punctuation / operators
  LParen,
  RParen,
  LBrace,
  RBrace,
  LBracket,
  RBracket,
  Comma,
  Dot,
  DotDot,

  Plus,
  Minus,
  Star,
  Slash,
  Percent,
  Tilde,
  Bang,

  Pipe,
  PipeGreater,  // |> (also written >|)
  AndAnd,
  OrOr,

  Eq,
  EqEq,
  Lt,
  Le,
  Gt,
  Ge,

  PlusEq,
  MinusEq,
  StarEq,
  SlashEq,
  PercentEq,
};

struct Token
{
  TokenKind kind = TokenKind::Unknown;
  SourceRange range;      // byte range in the source (including quotes for strings)
  std::string_view text;  // slice view (String: interior, Comment: body)
  LineColumn pos;         // 1-based line/column of the first character
  int64_t number = 0;     // Number only; 0 when the literal overflows int64

  [[nodiscard]] uint32_t begin() const noexcept { return range.get_begin().get_offset(); }
  [[nodiscard]] uint32_t end() const noexcept { return range.get_end().get_offset(); }
};

[[nodiscard]] constexpr std::string_view to_string(TokenKind k) noexcept
{
  switch (k) {
    case TokenKind::Eof:
      return "<eof>";
    case TokenKind::Unknown:
      return "<unknown>";
    case TokenKind::Newline:
      return "<newline>";
    case TokenKind::Comment:
      return "<comment>";
    case TokenKind::Identifier:
      return "identifier";
    case TokenKind::Number:
      return "number";
    case TokenKind::String:
      return "string";
    case TokenKind::Underscore:
      return "_";
    case TokenKind::KwIf:
      return "if";
    case TokenKind::KwFor:
      return "for";
    case TokenKind::KwOf:
      return "of";
    case TokenKind::KwInput:
      return "input";
    case TokenKind::KwLen:
      return "len";
    case TokenKind::KwMax:
      return "max";
    case TokenKind::KwMin:
      return "min";
    case TokenKind::KwFloor:
      return "floor";
    case TokenKind::KwCeil:
      return "ceil";
    case TokenKind::KwTrue:
      return "true";
    case TokenKind::KwFalse:
      return "false";
    case TokenKind::LParen:
      return "(";
    case TokenKind::RParen:
      return ")";
    case TokenKind::LBrace:
      return "{";
    case TokenKind::RBrace:
      return "}";
    case TokenKind::LBracket:
      return "[";
    case TokenKind::RBracket:
      return "]";
    case TokenKind::Comma:
      return ",";
    case TokenKind::Dot:
      return ".";
    case TokenKind::DotDot:
      return "..";
    case TokenKind::Plus:
      return "+";
    case TokenKind::Minus:
      return "-";
    case TokenKind::Star:
      return "*";
    case TokenKind::Slash:
      return "/";
    case TokenKind::Percent:
      return "%";
    case TokenKind::Tilde:
      return "~";
    case TokenKind::Bang:
      return "!";
    case TokenKind::Pipe:
      return "|";
    case TokenKind::PipeGreater:
      return "|>";
    case TokenKind::AndAnd:
      return "&&";
    case TokenKind::OrOr:
      return "||";
    case TokenKind::Eq:
      return "=";
    case TokenKind::EqEq:
      return "==";
    case TokenKind::Lt:
      return "<";
    case TokenKind::Le:
      return "<=";
    case TokenKind::Gt:
      return ">";
    case TokenKind::Ge:
      return ">=";
    case TokenKind::PlusEq:
      return "+=";
    case TokenKind::MinusEq:
      return "-=";
    case TokenKind::StarEq:
      return "*=";
    case TokenKind::SlashEq:
      return "/=";
    case TokenKind::PercentEq:
      return "%=";
  }
  return "";
}

}  // namespace xmas::syntax
