// xmas/runtime/trace_observer.hpp - Hooks for observing program execution
//
#pragma once

#include <string_view>

#include "xmas/ast/ast.hpp"
#include "xmas/ast/ast_enums.hpp"
#include "xmas/runtime/value.hpp"

namespace xmas
{

/**
 * Receives a callback at each traced point of execution.
 *
 * The interpreter calls enter_nested()/leave_nested() around a taken `if`
 * branch and around each `for` iteration, so observers can indent.
 */
class TraceObserver
{
public:
  virtual ~TraceObserver() = default;

  /// `name = value`. `old_value` is null when the variable was undefined.
  virtual void on_assign(std::string_view name, const Value * old_value, const Value & new_value) = 0;

  /// `name op= value`, including `_` and `_name` targets.
  virtual void on_compound_assign(
    std::string_view name, BinaryOp op, const Value * old_value, const Value & new_value) = 0;

  virtual void on_if(const Expr * condition, bool taken) = 0;

  virtual void on_for_iteration(std::string_view var, const Value & element) = 0;

  virtual void enter_nested() {}
  virtual void leave_nested() {}
};

}  // namespace xmas
