// xmas/syntax/frontend.cpp - High-level parse pipeline
#include "xmas/syntax/frontend.hpp"

#include <utility>

#include "xmas/syntax/lexer.hpp"
#include "xmas/syntax/parser.hpp"

namespace xmas
{

Program * parse_source(std::string_view source_text, AstContext & ast, DiagnosticBag & diags)
{
  syntax::Lexer lexer(source_text);
  syntax::Parser parser(ast, diags, lexer.lex_all());
  return parser.parse_program();
}

}  // namespace xmas
