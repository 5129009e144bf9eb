// xmas/runtime/interpreter.hpp - Tree-walking interpreter
//
#pragma once

#include <cstddef>
#include <optional>

#include "xmas/ast/ast.hpp"
#include "xmas/basic/result.hpp"
#include "xmas/runtime/environment.hpp"
#include "xmas/runtime/trace_observer.hpp"
#include "xmas/runtime/value.hpp"

namespace xmas
{

/**
 * Evaluates a parsed Program against an Environment.
 *
 * Every evaluation step returns EvalResult; the first runtime error aborts
 * the enclosing statement and is returned unchanged to the caller. State
 * saved around calls, blocks and loops is restored on error as well.
 *
 * The result of a program is the value of `_` if it is set when the last
 * statement finishes, otherwise the value of the last expression statement,
 * otherwise an empty Array1D.
 */
class Interpreter
{
public:
  explicit Interpreter(Environment & env, TraceObserver * trace = nullptr)
  : env_(env), trace_(trace)
  {
  }

  [[nodiscard]] EvalResult<Value> interpret(const Program * program);

  [[nodiscard]] EvalResult<Value> evaluate(const Expr * expr);
  [[nodiscard]] ExecResult execute(const Stmt * stmt);

private:
  // Statements
  [[nodiscard]] ExecResult exec_assign(const AssignStmt * node);
  [[nodiscard]] ExecResult exec_compound_assign(const CompoundAssignStmt * node);
  [[nodiscard]] ExecResult exec_return(const ReturnStmt * node);

  // Expressions
  [[nodiscard]] EvalResult<Value> eval_var_ref(const VarRefExpr * node);
  [[nodiscard]] EvalResult<Value> eval_array_literal(const ArrayLiteralExpr * node);
  [[nodiscard]] EvalResult<Value> eval_range_literal(const RangeLiteralExpr * node);
  [[nodiscard]] EvalResult<Value> eval_unary(const UnaryExpr * node);
  [[nodiscard]] EvalResult<Value> eval_binary(const BinaryExpr * node);
  [[nodiscard]] EvalResult<Value> eval_pipe(const PipeExpr * node);
  [[nodiscard]] EvalResult<Value> eval_call(const CallExpr * node);
  [[nodiscard]] EvalResult<Value> eval_index(const IndexExpr * node);
  [[nodiscard]] EvalResult<Value> eval_method_call(const MethodCallExpr * node);
  [[nodiscard]] EvalResult<Value> eval_block(const BlockExpr * node);

  // Builtins
  [[nodiscard]] EvalResult<Value> eval_builtin(const BuiltinExpr * node);
  [[nodiscard]] EvalResult<Value> eval_if(const BuiltinExpr * node);
  [[nodiscard]] EvalResult<Value> eval_for(const BuiltinExpr * node);
  [[nodiscard]] EvalResult<Value> eval_len(const BuiltinExpr * node);
  [[nodiscard]] EvalResult<Value> eval_min_max(const BuiltinExpr * node);
  [[nodiscard]] EvalResult<Value> eval_floor_ceil(const BuiltinExpr * node);

  // Indexing helpers
  [[nodiscard]] EvalResult<size_t> eval_index_value(const Expr * expr);
  [[nodiscard]] EvalResult<std::optional<size_t>> eval_bound(const Expr * expr);

  Environment & env_;
  TraceObserver * trace_;
};

}  // namespace xmas
