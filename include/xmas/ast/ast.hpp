// xmas/ast/ast.hpp - AST node class definitions for xmas
//
// This header contains all AST node class definitions following the
// LLVM/Clang style with classof() for RTTI support.
//
#pragma once

#include <cstdint>
#include <gsl/span>
#include <optional>
#include <string_view>

#include "xmas/ast/ast_enums.hpp"
#include "xmas/basic/casting.hpp"
#include "xmas/basic/source_manager.hpp"

namespace xmas
{

// ============================================================================
// Base Classes
// ============================================================================

/**
 * Base class for all AST nodes.
 *
 * Every AST node has:
 * - A NodeKind for RTTI (using classof pattern)
 * - A SourceRange indicating its location in source
 *
 * Nodes are non-copyable and managed by AstContext.
 */
class AstNode
{
public:
  const NodeKind kind;
  SourceRange range_;

  AstNode(const AstNode &) = delete;
  AstNode & operator=(const AstNode &) = delete;
  AstNode(AstNode &&) = delete;
  AstNode & operator=(AstNode &&) = delete;

  [[nodiscard]] NodeKind get_kind() const noexcept { return kind; }

  [[nodiscard]] SourceRange get_range() const noexcept { return range_; }

protected:
  explicit AstNode(NodeKind k, SourceRange r = {}) : kind(k), range_(r) {}
  ~AstNode() = default;  // Non-virtual, protected: prevents polymorphic delete
};

// ============================================================================
// CRTP Base for Automatic classof()
// ============================================================================

/**
 * CRTP base class that automatically implements classof().
 *
 * @tparam Derived The concrete node class
 * @tparam Base The base class to inherit from
 * @tparam K The NodeKind for this node type
 */
template <typename Derived, typename Base, NodeKind K>
class NodeBase : public Base
{
public:
  static constexpr NodeKind kind = K;

  static bool classof(const AstNode * node) { return node->get_kind() == K; }

protected:
  explicit NodeBase(SourceRange r = {}) : Base(K, r) {}
};

// ============================================================================
// Category Base Classes
// ============================================================================

/**
 * Base class for expressions.
 */
class Expr : public AstNode
{
public:
  static bool classof(const AstNode * node) { return is_expr_kind(node->kind); }

protected:
  explicit Expr(NodeKind k, SourceRange r = {}) : AstNode(k, r) {}
};

/**
 * Base class for statements.
 */
class Stmt : public AstNode
{
public:
  static bool classof(const AstNode * node) { return is_stmt_kind(node->kind); }

protected:
  explicit Stmt(NodeKind k, SourceRange r = {}) : AstNode(k, r) {}
};

// ============================================================================
// Literal Expressions
// ============================================================================

/// Integer literal. Values that overflow while lexing are stored as 0.
class NumberLiteralExpr : public NodeBase<NumberLiteralExpr, Expr, NodeKind::NumberLiteral>
{
public:
  int64_t value;

  explicit NumberLiteralExpr(int64_t v, SourceRange r = {}) : NodeBase(r), value(v) {}
};

/// `true` / `false`.
class BoolLiteralExpr : public NodeBase<BoolLiteralExpr, Expr, NodeKind::BoolLiteral>
{
public:
  bool value;

  explicit BoolLiteralExpr(bool v, SourceRange r = {}) : NodeBase(r), value(v) {}
};

/// String literal with escapes already decoded.
class StringLiteralExpr : public NodeBase<StringLiteralExpr, Expr, NodeKind::StringLiteral>
{
public:
  std::string_view value;

  explicit StringLiteralExpr(std::string_view v, SourceRange r = {}) : NodeBase(r), value(v) {}
};

// ============================================================================
// References
// ============================================================================

/// Variable reference. Named return slots (`_acc`) keep their leading '_'.
class VarRefExpr : public NodeBase<VarRefExpr, Expr, NodeKind::VarRef>
{
public:
  std::string_view name;

  explicit VarRefExpr(std::string_view n, SourceRange r = {}) : NodeBase(r), name(n) {}

  /// True for `_name` references, which read a named return slot.
  [[nodiscard]] bool is_named_return() const noexcept
  {
    return name.size() > 1 && name.front() == '_';
  }
};

/// The `input` keyword.
class InputRefExpr : public NodeBase<InputRefExpr, Expr, NodeKind::InputRef>
{
public:
  explicit InputRefExpr(SourceRange r = {}) : NodeBase(r) {}
};

/// A bare `_` in expression position: reads the current return value.
class ReturnValueExpr : public NodeBase<ReturnValueExpr, Expr, NodeKind::ReturnValue>
{
public:
  explicit ReturnValueExpr(SourceRange r = {}) : NodeBase(r) {}
};

// ============================================================================
// Compound Expressions
// ============================================================================

/// Array literal: [a, b, c]
class ArrayLiteralExpr : public NodeBase<ArrayLiteralExpr, Expr, NodeKind::ArrayLiteral>
{
public:
  gsl::span<Expr *> elements;

  explicit ArrayLiteralExpr(gsl::span<Expr *> elems, SourceRange r = {})
  : NodeBase(r), elements(elems)
  {
  }
};

/// Range literal: [start..end], both ends inclusive.
class RangeLiteralExpr : public NodeBase<RangeLiteralExpr, Expr, NodeKind::RangeLiteral>
{
public:
  Expr * start;
  Expr * end;

  RangeLiteralExpr(Expr * s, Expr * e, SourceRange r = {}) : NodeBase(r), start(s), end(e) {}
};

class UnaryExpr : public NodeBase<UnaryExpr, Expr, NodeKind::Unary>
{
public:
  UnaryOp op;
  Expr * operand;

  UnaryExpr(UnaryOp o, Expr * e, SourceRange r = {}) : NodeBase(r), op(o), operand(e) {}
};

class BinaryExpr : public NodeBase<BinaryExpr, Expr, NodeKind::Binary>
{
public:
  Expr * lhs;
  BinaryOp op;
  Expr * rhs;

  BinaryExpr(Expr * l, BinaryOp o, Expr * r, SourceRange range = {})
  : NodeBase(range), lhs(l), op(o), rhs(r)
  {
  }
};

/// Pipe: lhs |> rhs. The rhs sees the lhs value as `__pipe_temp__`.
class PipeExpr : public NodeBase<PipeExpr, Expr, NodeKind::Pipe>
{
public:
  Expr * lhs;
  Expr * rhs;

  PipeExpr(Expr * l, Expr * r, SourceRange range = {}) : NodeBase(range), lhs(l), rhs(r) {}
};

/// Call of a user-defined function: name(args...)
class CallExpr : public NodeBase<CallExpr, Expr, NodeKind::Call>
{
public:
  std::string_view callee;
  gsl::span<Expr *> args;

  CallExpr(std::string_view c, gsl::span<Expr *> a, SourceRange r = {})
  : NodeBase(r), callee(c), args(a)
  {
  }
};

/**
 * One comma-separated component of an index group.
 *
 * Either a single index (`single` set) or a range with optional bounds
 * (`is_range`, `start` and/or `end` may be null for open ends).
 */
class IndexComponent : public NodeBase<IndexComponent, AstNode, NodeKind::IndexComponent>
{
public:
  bool is_range = false;
  Expr * single = nullptr;
  Expr * start = nullptr;
  Expr * end = nullptr;

  explicit IndexComponent(Expr * index, SourceRange r = {}) : NodeBase(r), single(index) {}

  IndexComponent(Expr * s, Expr * e, SourceRange r = {})
  : NodeBase(r), is_range(true), start(s), end(e)
  {
  }
};

/// Index/slice: base[c1, c2, ...]
class IndexExpr : public NodeBase<IndexExpr, Expr, NodeKind::Index>
{
public:
  Expr * base;
  gsl::span<IndexComponent *> components;

  IndexExpr(Expr * b, gsl::span<IndexComponent *> c, SourceRange r = {})
  : NodeBase(r), base(b), components(c)
  {
  }
};

/**
 * Builtin form: if, for, len, max, min, floor, ceil.
 *
 * For `for(x of arr, body[, init])`, `loop_var` holds `x` and `args` holds
 * arr, body and the optional init. Arity is checked at evaluation time.
 */
class BuiltinExpr : public NodeBase<BuiltinExpr, Expr, NodeKind::Builtin>
{
public:
  BuiltinKind builtin;
  std::string_view loop_var;
  gsl::span<Expr *> args;

  BuiltinExpr(BuiltinKind b, gsl::span<Expr *> a, SourceRange r = {})
  : NodeBase(r), builtin(b), args(a)
  {
  }

  BuiltinExpr(BuiltinKind b, std::string_view var, gsl::span<Expr *> a, SourceRange r = {})
  : NodeBase(r), builtin(b), loop_var(var), args(a)
  {
  }
};

/// Method call: object.method(args...)
class MethodCallExpr : public NodeBase<MethodCallExpr, Expr, NodeKind::MethodCall>
{
public:
  Expr * object;
  std::string_view method;
  gsl::span<Expr *> args;

  MethodCallExpr(Expr * o, std::string_view m, gsl::span<Expr *> a, SourceRange r = {})
  : NodeBase(r), object(o), method(m), args(a)
  {
  }
};

/// Block: { stmt* }. Evaluates to its last statement's value.
class BlockExpr : public NodeBase<BlockExpr, Expr, NodeKind::Block>
{
public:
  gsl::span<Stmt *> statements;

  explicit BlockExpr(gsl::span<Stmt *> s, SourceRange r = {}) : NodeBase(r), statements(s) {}
};

// ============================================================================
// Statement Nodes
// ============================================================================

/// name = value
class AssignStmt : public NodeBase<AssignStmt, Stmt, NodeKind::Assign>
{
public:
  std::string_view name;
  Expr * value;

  AssignStmt(std::string_view n, Expr * v, SourceRange r = {}) : NodeBase(r), name(n), value(v) {}
};

/**
 * target op= value
 *
 * `target` is spelled as written: a variable, `_`, or `_name`.
 */
class CompoundAssignStmt : public NodeBase<CompoundAssignStmt, Stmt, NodeKind::CompoundAssign>
{
public:
  std::string_view target;
  BinaryOp op;
  Expr * value;

  CompoundAssignStmt(std::string_view t, BinaryOp o, Expr * v, SourceRange r = {})
  : NodeBase(r), target(t), op(o), value(v)
  {
  }

  [[nodiscard]] bool targets_return_value() const noexcept { return target == "_"; }

  [[nodiscard]] bool targets_named_return() const noexcept
  {
    return target.size() > 1 && target.front() == '_';
  }
};

/**
 * `_ = value` or `_name = value`.
 *
 * `name` is the slot name without the leading underscore; unset for `_`.
 */
class ReturnStmt : public NodeBase<ReturnStmt, Stmt, NodeKind::Return>
{
public:
  std::optional<std::string_view> name;
  Expr * value;

  ReturnStmt(std::optional<std::string_view> n, Expr * v, SourceRange r = {})
  : NodeBase(r), name(n), value(v)
  {
  }
};

/// name(params...) = body
class FunctionDefStmt : public NodeBase<FunctionDefStmt, Stmt, NodeKind::FunctionDef>
{
public:
  std::string_view name;
  gsl::span<std::string_view> params;
  Expr * body;

  FunctionDefStmt(
    std::string_view n, gsl::span<std::string_view> p, Expr * b, SourceRange r = {})
  : NodeBase(r), name(n), params(p), body(b)
  {
  }
};

class ExprStmt : public NodeBase<ExprStmt, Stmt, NodeKind::ExprStmt>
{
public:
  Expr * expr;

  explicit ExprStmt(Expr * e, SourceRange r = {}) : NodeBase(r), expr(e) {}
};

// ============================================================================
// Program (Root Node)
// ============================================================================

class Program : public NodeBase<Program, AstNode, NodeKind::Program>
{
public:
  gsl::span<Stmt *> statements;

  explicit Program(gsl::span<Stmt *> s, SourceRange r = {}) : NodeBase(r), statements(s) {}
};

// ============================================================================
// Helper Functions
// ============================================================================

[[nodiscard]] inline SourceRange get_range(const AstNode * node) noexcept
{
  return node ? node->get_range() : SourceRange{};
}

}  // namespace xmas
