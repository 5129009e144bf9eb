// xmas/runtime/debug_trace_printer.hpp - `--debug` trace output
//
#pragma once

#include <ostream>
#include <string_view>

#include "xmas/runtime/trace_observer.hpp"

namespace xmas
{

/**
 * Writes one `DEBUG:` line per traced event:
 *
 *   DEBUG: total: undefined → 0
 *   DEBUG: for n: 1
 *   DEBUG:   total +=: 0 → 1
 *   DEBUG: if (total > 0): true
 *
 * Nested events are indented by two spaces per level.
 */
class DebugTracePrinter : public TraceObserver
{
public:
  explicit DebugTracePrinter(std::ostream & out) : out_(out) {}

  void on_assign(std::string_view name, const Value * old_value, const Value & new_value) override;
  void on_compound_assign(
    std::string_view name, BinaryOp op, const Value * old_value, const Value & new_value) override;
  void on_if(const Expr * condition, bool taken) override;
  void on_for_iteration(std::string_view var, const Value & element) override;

  void enter_nested() override { indent_ += 2; }
  void leave_nested() override { indent_ -= 2; }

private:
  void emit(std::string_view text);

  std::ostream & out_;
  int indent_ = 0;
};

}  // namespace xmas
