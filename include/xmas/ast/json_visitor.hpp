// xmas/ast/json_visitor.hpp - JSON serialization for AST nodes
//
// Used by `xmas --dump-ast` and by parser tests to compare tree shapes.
//
#pragma once

#include <nlohmann/json.hpp>

#include "xmas/ast/ast.hpp"

namespace xmas
{

/**
 * Serialize an AST node to JSON.
 *
 * Every object carries "type" (node class name) and "range" (byte offsets,
 * or nulls for synthesized nodes).
 */
[[nodiscard]] nlohmann::json to_json(const AstNode * node);

/// Serialize a Program with all of its statements.
[[nodiscard]] nlohmann::json to_json(const Program * program);

}  // namespace xmas
