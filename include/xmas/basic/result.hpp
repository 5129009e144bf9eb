// xmas/basic/result.hpp - Value-or-error result type for evaluation
//
// Runtime faults in the interpreter are ordinary values, not exceptions.
// Every evaluation step returns EvalResult<T> and callers propagate the error
// unchanged.
//
#pragma once

#include <string>
#include <utility>
#include <variant>

#include "xmas/basic/source_manager.hpp"

namespace xmas
{

/**
 * A runtime error: descriptive message plus the source range of the
 * expression or statement that raised it (may be invalid).
 */
struct RuntimeError
{
  std::string message;
  SourceRange range;
};

/**
 * Result type using std::variant.
 * Holds either a success value T or a RuntimeError.
 */
template <typename T>
class EvalResult
{
public:
  using ValueType = T;
  using ErrorType = RuntimeError;

  EvalResult(T value) : data_(std::move(value)) {}  // NOLINT(google-explicit-constructor)

  EvalResult(RuntimeError error) : data_(std::move(error)) {}  // NOLINT(google-explicit-constructor)

  [[nodiscard]] bool has_value() const { return std::holds_alternative<T>(data_); }
  [[nodiscard]] bool has_error() const { return std::holds_alternative<ErrorType>(data_); }

  explicit operator bool() const { return has_value(); }

  // Get the value (undefined behavior if has_error())
  T & value() & { return std::get<T>(data_); }
  [[nodiscard]] const T & value() const & { return std::get<T>(data_); }
  T && value() && { return std::get<T>(std::move(data_)); }

  // Get the error (undefined behavior if has_value())
  ErrorType & error() & { return std::get<ErrorType>(data_); }
  [[nodiscard]] const ErrorType & error() const & { return std::get<ErrorType>(data_); }
  ErrorType && error() && { return std::get<ErrorType>(std::move(data_)); }

  T * operator->() { return &value(); }
  const T * operator->() const { return &value(); }
  T & operator*() & { return value(); }
  const T & operator*() const & { return value(); }

private:
  std::variant<T, ErrorType> data_;
};

/// Result of executing a statement (no value on success).
using ExecResult = EvalResult<std::monostate>;

[[nodiscard]] inline ExecResult exec_ok() { return ExecResult(std::monostate{}); }

/// Build a RuntimeError at `range`.
[[nodiscard]] inline RuntimeError runtime_error(std::string message, SourceRange range = {})
{
  return RuntimeError{std::move(message), range};
}

}  // namespace xmas
