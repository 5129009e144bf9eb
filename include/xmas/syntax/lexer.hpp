#pragma once

#include <cstdint>
#include <string_view>
#include <vector>

#include "xmas/syntax/token.hpp"

namespace xmas::syntax
{

/**
 * Tokenizer for xmas source text.
 *
 * Never fails: characters with no meaning are skipped, except a lone '&',
 * which becomes an Unknown token so the parser can report it.
 */
class Lexer
{
public:
  explicit Lexer(std::string_view src) : src_(src) {}

  /// Tokenize the whole source. The last token is always Eof.
  [[nodiscard]] std::vector<Token> lex_all();

private:
  [[nodiscard]] Token next_token();

  [[nodiscard]] bool eof() const noexcept { return pos_ >= src_.size(); }
  [[nodiscard]] char peek(size_t lookahead = 0) const noexcept
  {
    const size_t i = pos_ + lookahead;
    return (i < src_.size()) ? src_[i] : '\0';
  }
  [[nodiscard]] bool starts_with(std::string_view s) const noexcept;

  void advance(size_t n = 1) noexcept;

  void skip_whitespace();

  [[nodiscard]] Token lex_identifier_or_keyword(uint32_t start, LineColumn pos);
  [[nodiscard]] Token lex_number(uint32_t start, LineColumn pos);
  [[nodiscard]] Token lex_string(uint32_t start, LineColumn pos);
  [[nodiscard]] Token lex_comment(uint32_t start, LineColumn pos);

  [[nodiscard]] Token make_token(TokenKind kind, uint32_t start, LineColumn pos) const noexcept;

  std::string_view src_;
  size_t pos_ = 0;
  uint32_t line_ = 1;
  uint32_t column_ = 1;
};

}  // namespace xmas::syntax
