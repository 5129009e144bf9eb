// xmas/runtime/environment.hpp - Interpreter state and scope guards
//
// The language has one flat variable namespace. Calls, blocks and loops
// emulate scoping by saving and restoring parts of the Environment:
// - blocks scope only the return slots (ReturnScope),
// - calls scope the return slots and their parameter names (BindingScope),
// - loops scope the return slots and the loop variable.
//
#pragma once

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "xmas/ast/ast.hpp"
#include "xmas/runtime/value.hpp"

namespace xmas
{

/// Build the `input` grid: one row per line, one single-character string per byte.
[[nodiscard]] Value make_input_grid(std::string_view text);

class Environment
{
public:
  Environment() : input_(Value::make_grid()) {}

  /// `input` must be an Array2D (see make_input_grid).
  explicit Environment(Value input) : input_(std::move(input)) {}

  Environment(const Environment &) = delete;
  Environment & operator=(const Environment &) = delete;

  // ===========================================================================
  // Variables
  // ===========================================================================

  [[nodiscard]] const Value * lookup(std::string_view name) const;
  void assign(std::string_view name, Value value);
  void erase(std::string_view name);

  // ===========================================================================
  // Functions
  // ===========================================================================

  /// Define or replace a user function. The definition node must outlive the
  /// environment's use of it.
  void define_function(const FunctionDefStmt * def);
  [[nodiscard]] const FunctionDefStmt * find_function(std::string_view name) const;

  // ===========================================================================
  // Return slots
  // ===========================================================================

  [[nodiscard]] const std::optional<Value> & return_value() const noexcept { return return_value_; }
  void set_return_value(Value value) { return_value_ = std::move(value); }

  /// `name` is given without its leading '_'.
  [[nodiscard]] const Value * named_return(std::string_view name) const;
  void set_named_return(std::string_view name, Value value);

  // ===========================================================================
  // Input
  // ===========================================================================

  [[nodiscard]] const Value & input() const noexcept { return input_; }

private:
  friend class ReturnScope;

  using ValueMap = std::map<std::string, Value, std::less<>>;

  ValueMap variables_;
  std::map<std::string, const FunctionDefStmt *, std::less<>> functions_;
  std::optional<Value> return_value_;
  ValueMap named_returns_;
  Value input_;
};

// ============================================================================
// Scope guards
// ============================================================================

/**
 * Saves and clears `_` and every named return slot; restores them when the
 * scope ends, whether evaluation inside it succeeded or failed.
 */
class ReturnScope
{
public:
  explicit ReturnScope(Environment & env);
  ~ReturnScope();

  ReturnScope(const ReturnScope &) = delete;
  ReturnScope & operator=(const ReturnScope &) = delete;

private:
  Environment & env_;
  std::optional<Value> saved_return_;
  Environment::ValueMap saved_named_;
};

/**
 * Temporarily binds variables. On scope exit each name gets its previous
 * value back, or is removed if it was not defined before.
 */
class BindingScope
{
public:
  explicit BindingScope(Environment & env) : env_(env) {}
  BindingScope(Environment & env, std::string_view name, Value value) : env_(env)
  {
    bind(name, std::move(value));
  }
  ~BindingScope();

  BindingScope(const BindingScope &) = delete;
  BindingScope & operator=(const BindingScope &) = delete;

  void bind(std::string_view name, Value value);

private:
  struct Saved
  {
    std::string name;
    std::optional<Value> previous;
  };

  Environment & env_;
  std::vector<Saved> saved_;
};

}  // namespace xmas
