// xmas/driver/runner.cpp - Script runner implementation
//
#include "xmas/driver/runner.hpp"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>

#include "xmas/ast/ast_context.hpp"
#include "xmas/runtime/debug_trace_printer.hpp"
#include "xmas/runtime/environment.hpp"
#include "xmas/runtime/interpreter.hpp"
#include "xmas/syntax/frontend.hpp"

namespace xmas
{

std::optional<std::string> read_file(const std::filesystem::path & path, std::string & error)
{
  std::error_code ec;
  if (std::filesystem::is_directory(path, ec)) {
    error = "Is a directory";
    return std::nullopt;
  }

  std::ifstream in(path, std::ios::binary);
  if (!in) {
    error = std::strerror(errno);
    return std::nullopt;
  }

  std::ostringstream ss;
  ss << in.rdbuf();
  if (in.bad()) {
    error = "read failed";
    return std::nullopt;
  }
  return ss.str();
}

Value Runner::load_input(const RunOptions & options, DiagnosticBag & diags)
{
  if (options.input_text) {
    return make_input_grid(*options.input_text);
  }
  if (!options.input_path) {
    return Value::make_grid();
  }

  std::string error;
  auto text = read_file(*options.input_path, error);
  if (!text) {
    diags
      .report_warning(
        SourceRange{},
        "Could not read input file '" + options.input_path->string() + "': " + error)
      .with_code(diag_code::k_unreadable_input);
    return Value::make_grid();
  }
  return make_input_grid(*text);
}

RunResult Runner::run_source(
  const std::filesystem::path & name, std::string text, const RunOptions & options)
{
  RunResult result;
  result.source = SourceManager(name, std::move(text));

  AstContext ast;
  const Program * program = parse_source(result.source.get_source(), ast, result.diagnostics);
  if (!program) {
    return result;
  }

  Environment env(load_input(options, result.diagnostics));

  std::unique_ptr<DebugTracePrinter> trace;
  if (options.debug) {
    trace = std::make_unique<DebugTracePrinter>(
      options.trace_stream ? *options.trace_stream : std::cerr);
  }

  Interpreter interpreter(env, trace.get());
  auto value = interpreter.interpret(program);
  if (!value) {
    const RuntimeError & err = value.error();
    result.diagnostics.report_error(err.range, err.message).with_code(diag_code::k_runtime_error);
    return result;
  }

  result.value = std::move(value).value();
  result.success = true;
  return result;
}

RunResult Runner::run_file(const std::filesystem::path & path, const RunOptions & options)
{
  std::string error;
  auto text = read_file(path, error);
  if (!text) {
    RunResult result;
    result.source = SourceManager(path, std::string());
    result.diagnostics.report_error(
      SourceRange{}, "Could not read script '" + path.string() + "': " + error);
    return result;
  }
  return run_source(path, std::move(*text), options);
}

}  // namespace xmas
