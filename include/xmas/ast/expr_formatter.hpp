// xmas/ast/expr_formatter.hpp - Render expressions back to source-like text
//
#pragma once

#include <string>

#include "xmas/ast/ast.hpp"

namespace xmas
{

/**
 * Format an expression for the debug trace.
 *
 * Binary operations are fully parenthesized and blocks are abbreviated to
 * `{ ... }`, e.g. `(x % 2) == 0` renders as `((x % 2) == 0)`.
 */
[[nodiscard]] std::string format_expr(const Expr * expr);

}  // namespace xmas
