// xmas/ast/ast_enums.hpp - AST enumeration definitions
//
// Node kinds, operators and builtin identifiers used by the xmas AST.
//
#pragma once

#include <cstdint>
#include <string_view>

namespace xmas
{

// ============================================================================
// NodeKind - Identifies all AST node types
// ============================================================================

/**
 * Node kind enumeration for LLVM-style RTTI.
 * Generated from ast_nodes.def; categories are contiguous.
 */
enum class NodeKind : uint8_t {
// === Expressions ===
#define AST_NODE_EXPR(Class, Kind, Snake) Kind,
#include "xmas/ast/ast_nodes.def"

// === Statements ===
#define AST_NODE_STMT(Class, Kind, Snake) Kind,
#include "xmas/ast/ast_nodes.def"

// === Supporting nodes ===
#define AST_NODE_SUPPORT(Class, Kind, Snake) Kind,
#include "xmas/ast/ast_nodes.def"

// === Top-level ===
#define AST_NODE_TOP(Class, Kind, Snake) Kind,
#include "xmas/ast/ast_nodes.def"
};

// ============================================================================
// Operators
// ============================================================================

enum class BinaryOp : uint8_t {
  // Arithmetic
  Add,  ///< +
  Sub,  ///< -
  Mul,  ///< *
  Div,  ///< /
  Mod,  ///< %
  // Comparison
  Lt,  ///< <
  Gt,  ///< >
  Le,  ///< <=
  Ge,  ///< >=
  Eq,  ///< ==
  // Logical (value-returning)
  And,  ///< &&
  Or,   ///< ||
};

enum class UnaryOp : uint8_t {
  ToNumber,  ///< ~
  Not,       ///< !
};

/**
 * Builtins are parsed as dedicated forms, never as user calls.
 */
enum class BuiltinKind : uint8_t {
  If,
  For,
  Len,
  Max,
  Min,
  Floor,
  Ceil,
};

// ============================================================================
// to_string() Helper Functions
// ============================================================================

[[nodiscard]] constexpr std::string_view to_string(BinaryOp op) noexcept
{
  switch (op) {
    case BinaryOp::Add:
      return "+";
    case BinaryOp::Sub:
      return "-";
    case BinaryOp::Mul:
      return "*";
    case BinaryOp::Div:
      return "/";
    case BinaryOp::Mod:
      return "%";
    case BinaryOp::Lt:
      return "<";
    case BinaryOp::Gt:
      return ">";
    case BinaryOp::Le:
      return "<=";
    case BinaryOp::Ge:
      return ">=";
    case BinaryOp::Eq:
      return "==";
    case BinaryOp::And:
      return "&&";
    case BinaryOp::Or:
      return "||";
  }
  return "";
}

/// Spelling of the compound assignment built on `op` ("+=" for Add).
[[nodiscard]] constexpr std::string_view to_assign_string(BinaryOp op) noexcept
{
  switch (op) {
    case BinaryOp::Add:
      return "+=";
    case BinaryOp::Sub:
      return "-=";
    case BinaryOp::Mul:
      return "*=";
    case BinaryOp::Div:
      return "/=";
    case BinaryOp::Mod:
      return "%=";
    default:
      break;
  }
  return "?=";
}

[[nodiscard]] constexpr std::string_view to_string(UnaryOp op) noexcept
{
  switch (op) {
    case UnaryOp::ToNumber:
      return "~";
    case UnaryOp::Not:
      return "!";
  }
  return "";
}

[[nodiscard]] constexpr std::string_view to_string(BuiltinKind kind) noexcept
{
  switch (kind) {
    case BuiltinKind::If:
      return "if";
    case BuiltinKind::For:
      return "for";
    case BuiltinKind::Len:
      return "len";
    case BuiltinKind::Max:
      return "max";
    case BuiltinKind::Min:
      return "min";
    case BuiltinKind::Floor:
      return "floor";
    case BuiltinKind::Ceil:
      return "ceil";
  }
  return "";
}

// ============================================================================
// NodeKind Range Helpers
// ============================================================================

namespace detail
{

inline constexpr NodeKind k_first_expr_kind = NodeKind::NumberLiteral;
inline constexpr NodeKind k_last_expr_kind = NodeKind::Block;

inline constexpr NodeKind k_first_stmt_kind = NodeKind::Assign;
inline constexpr NodeKind k_last_stmt_kind = NodeKind::ExprStmt;

}  // namespace detail

[[nodiscard]] constexpr bool is_expr_kind(NodeKind kind) noexcept
{
  return kind >= detail::k_first_expr_kind && kind <= detail::k_last_expr_kind;
}

[[nodiscard]] constexpr bool is_stmt_kind(NodeKind kind) noexcept
{
  return kind >= detail::k_first_stmt_kind && kind <= detail::k_last_stmt_kind;
}

}  // namespace xmas
