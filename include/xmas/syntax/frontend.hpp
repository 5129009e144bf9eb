// xmas/syntax/frontend.hpp - High-level parse pipeline entry point
#pragma once

#include <string_view>

#include "xmas/ast/ast.hpp"
#include "xmas/ast/ast_context.hpp"
#include "xmas/basic/diagnostic.hpp"

namespace xmas
{

// Parse pipeline:
// source -> lexer (token stream) -> recursive-descent parser (AST) -> diagnostics
//
// Returns nullptr after reporting the first syntax error to `diags`.
// Names and string literals are interned in `ast`, so the returned tree does
// not reference `source_text`.
[[nodiscard]] Program * parse_source(
  std::string_view source_text, AstContext & ast, DiagnosticBag & diags);

}  // namespace xmas
