// xmas/runtime/value.hpp - Runtime value representation
//
// A Value is one of five variants: Number (int64), Boolean, String,
// Array1D (vector of values) and Array2D (rows of values). Values own their
// contents and are copied on assignment.
//
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "xmas/ast/ast_enums.hpp"
#include "xmas/basic/result.hpp"

namespace xmas
{

// ============================================================================
// Value Kind
// ============================================================================

enum class ValueKind : uint8_t {
  Number,
  Boolean,
  String,
  Array1D,
  Array2D,
};

[[nodiscard]] constexpr std::string_view to_string(ValueKind k) noexcept
{
  switch (k) {
    case ValueKind::Number:
      return "number";
    case ValueKind::Boolean:
      return "boolean";
    case ValueKind::String:
      return "string";
    case ValueKind::Array1D:
      return "1D array";
    case ValueKind::Array2D:
      return "2D array";
  }
  return "";
}

// ============================================================================
// Value
// ============================================================================

class Value
{
public:
  using Array = std::vector<Value>;
  using Grid = std::vector<Array>;

  /// The empty Array1D: value of statements, missing else branches and loops
  /// without an initial value.
  Value() : data_(Array{}) {}

  // ===========================================================================
  // Factory Methods
  // ===========================================================================

  static Value make_number(int64_t n) { return Value(Data(std::in_place_index<0>, n)); }

  static Value make_bool(bool b) { return Value(Data(std::in_place_index<1>, b)); }

  static Value make_string(std::string s)
  {
    return Value(Data(std::in_place_index<2>, std::move(s)));
  }

  static Value make_array(Array elements = {})
  {
    return Value(Data(std::in_place_index<3>, std::move(elements)));
  }

  static Value make_grid(Grid rows = {}) { return Value(Data(std::in_place_index<4>, std::move(rows))); }

  // ===========================================================================
  // Kind Queries
  // ===========================================================================

  [[nodiscard]] ValueKind kind() const noexcept { return static_cast<ValueKind>(data_.index()); }

  [[nodiscard]] bool is_number() const noexcept { return kind() == ValueKind::Number; }
  [[nodiscard]] bool is_bool() const noexcept { return kind() == ValueKind::Boolean; }
  [[nodiscard]] bool is_string() const noexcept { return kind() == ValueKind::String; }
  [[nodiscard]] bool is_array() const noexcept { return kind() == ValueKind::Array1D; }
  [[nodiscard]] bool is_grid() const noexcept { return kind() == ValueKind::Array2D; }

  // ===========================================================================
  // Value Accessors (only valid for the matching kind)
  // ===========================================================================

  [[nodiscard]] int64_t as_number() const { return std::get<0>(data_); }
  [[nodiscard]] bool as_bool() const { return std::get<1>(data_); }
  [[nodiscard]] const std::string & as_string() const { return std::get<2>(data_); }
  [[nodiscard]] const Array & as_array() const { return std::get<3>(data_); }
  [[nodiscard]] const Grid & as_grid() const { return std::get<4>(data_); }

  /// Nonzero number, `true`, non-empty string or non-empty array.
  [[nodiscard]] bool truthy() const noexcept;

  /// Structural equality. Never coerces between kinds: `5 == true` is false.
  friend bool operator==(const Value & a, const Value & b) { return a.data_ == b.data_; }
  friend bool operator!=(const Value & a, const Value & b) { return !(a == b); }

private:
  using Data = std::variant<int64_t, bool, std::string, Array, Grid>;

  explicit Value(Data data) : data_(std::move(data)) {}

  Data data_;
};

// ============================================================================
// Operators
// ============================================================================

/**
 * Apply a binary operator to two evaluated operands.
 *
 * This is the single coercion table of the language:
 * - `+`: numbers add, strings and Array1Ds concatenate.
 * - `- * /`: numbers only.
 * - Arithmetic treats a Boolean mixed with a Number as 0/1.
 * - `%` and the ordering comparisons accept two Numbers only.
 * - `==` is structural and never coerces.
 * - `&&`/`||` return one of their operands by truthiness.
 *
 * Arithmetic wraps on overflow. `/` and `%` truncate toward zero.
 */
[[nodiscard]] EvalResult<Value> apply_binary_op(BinaryOp op, const Value & lhs, const Value & rhs);

/// `~v`: convert to a Number.
[[nodiscard]] EvalResult<Value> to_number(const Value & v);

/// Parse a whole string as a decimal integer with an optional sign.
[[nodiscard]] std::optional<int64_t> parse_number(std::string_view s);

// ============================================================================
// Formatting
// ============================================================================

/// Program output rendering: strings verbatim, arrays as `[a, b]`.
[[nodiscard]] std::string format_value(const Value & v);

/// Debug trace rendering: strings quoted, a non-empty Array1D of one-character
/// strings shown as a single quoted string.
[[nodiscard]] std::string format_debug_value(const Value & v);

}  // namespace xmas
