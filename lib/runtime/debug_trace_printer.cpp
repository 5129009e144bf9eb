// xmas/runtime/debug_trace_printer.cpp - `--debug` trace output
//
#include "xmas/runtime/debug_trace_printer.hpp"

#include <fmt/format.h>
#include <fmt/ostream.h>

#include "xmas/ast/expr_formatter.hpp"

namespace xmas
{

namespace
{

std::string old_or_undefined(const Value * v)
{
  return v ? format_debug_value(*v) : std::string("undefined");
}

}  // namespace

void DebugTracePrinter::emit(std::string_view text)
{
  fmt::print(out_, "DEBUG: {:{}}{}\n", "", indent_, text);
}

void DebugTracePrinter::on_assign(
  std::string_view name, const Value * old_value, const Value & new_value)
{
  emit(fmt::format(
    "{}: {} → {}", name, old_or_undefined(old_value), format_debug_value(new_value)));
}

void DebugTracePrinter::on_compound_assign(
  std::string_view name, BinaryOp op, const Value * old_value, const Value & new_value)
{
  emit(fmt::format(
    "{} {}: {} → {}", name, to_assign_string(op), old_or_undefined(old_value),
    format_debug_value(new_value)));
}

void DebugTracePrinter::on_if(const Expr * condition, bool taken)
{
  emit(fmt::format("if {}: {}", format_expr(condition), taken ? "true" : "false"));
}

void DebugTracePrinter::on_for_iteration(std::string_view var, const Value & element)
{
  emit(fmt::format("for {}: {}", var, format_debug_value(element)));
}

}  // namespace xmas
