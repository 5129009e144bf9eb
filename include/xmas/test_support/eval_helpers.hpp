// xmas/test_support/eval_helpers.hpp - helpers for interpreter unit tests
//
// Parses and runs a script in one call. A syntax error is returned as a
// RuntimeError whose message starts with "syntax error: " so that tests can
// tell the two apart.
//
#pragma once

#include <string>
#include <string_view>

#include "xmas/basic/result.hpp"
#include "xmas/runtime/environment.hpp"
#include "xmas/runtime/interpreter.hpp"
#include "xmas/runtime/trace_observer.hpp"
#include "xmas/runtime/value.hpp"
#include "xmas/test_support/parse_helpers.hpp"

namespace xmas::test_support
{

[[nodiscard]] inline EvalResult<Value> eval(
  std::string src, std::string_view input = {}, TraceObserver * trace = nullptr)
{
  auto unit = parse(std::move(src));
  if (!unit.ok()) {
    const std::string message =
      unit.diags.empty() ? std::string("no program") : unit.diags.all().front().message;
    return runtime_error("syntax error: " + message);
  }

  Environment env(make_input_grid(input));
  Interpreter interpreter(env, trace);
  return interpreter.interpret(unit.program);
}

/// Message of the runtime error, or "<no error>" when evaluation succeeded.
[[nodiscard]] inline std::string error_of(const EvalResult<Value> & r)
{
  return r.has_error() ? r.error().message : std::string("<no error>");
}

/// Display rendering of the value, or "error: <message>".
[[nodiscard]] inline std::string show(const EvalResult<Value> & r)
{
  return r.has_value() ? format_value(r.value()) : "error: " + r.error().message;
}

}  // namespace xmas::test_support
