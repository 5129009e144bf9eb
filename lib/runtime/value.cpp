// xmas/runtime/value.cpp - Value operations and formatting
//
#include "xmas/runtime/value.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <charconv>
#include <limits>
#include <string>
#include <system_error>
#include <vector>

#include "xmas/basic/utf8.hpp"

namespace xmas
{

namespace
{

// Two's complement wrap-around arithmetic.
int64_t wrap_add(int64_t a, int64_t b)
{
  return static_cast<int64_t>(static_cast<uint64_t>(a) + static_cast<uint64_t>(b));
}
int64_t wrap_sub(int64_t a, int64_t b)
{
  return static_cast<int64_t>(static_cast<uint64_t>(a) - static_cast<uint64_t>(b));
}
int64_t wrap_mul(int64_t a, int64_t b)
{
  return static_cast<int64_t>(static_cast<uint64_t>(a) * static_cast<uint64_t>(b));
}

// b must be nonzero
int64_t wrap_div(int64_t a, int64_t b)
{
  if (a == std::numeric_limits<int64_t>::min() && b == -1) return a;
  return a / b;
}
int64_t wrap_rem(int64_t a, int64_t b)
{
  if (b == -1) return 0;
  return a % b;
}

/// Operand as a number for arithmetic: Number as is, Boolean as 0/1.
std::optional<int64_t> arith_operand(const Value & v)
{
  if (v.is_number()) return v.as_number();
  if (v.is_bool()) return v.as_bool() ? 1 : 0;
  return std::nullopt;
}

/// Both operands for `- * /`: at least one side must be a real Number.
bool arith_operands(const Value & lhs, const Value & rhs, int64_t & a, int64_t & b)
{
  if (lhs.is_bool() && rhs.is_bool()) return false;
  const auto l = arith_operand(lhs);
  const auto r = arith_operand(rhs);
  if (!l || !r) return false;
  a = *l;
  b = *r;
  return true;
}

RuntimeError invalid_operands(BinaryOp op)
{
  return runtime_error(fmt::format("Invalid operands for {}", to_string(op)));
}

std::string join_formatted(const Value::Array & items, std::string (*fmt_item)(const Value &))
{
  std::vector<std::string> parts;
  parts.reserve(items.size());
  for (const auto & item : items) {
    parts.push_back(fmt_item(item));
  }
  return fmt::format("[{}]", fmt::join(parts, ", "));
}

std::string join_rows(const Value::Grid & rows, std::string (*fmt_item)(const Value &))
{
  std::vector<std::string> parts;
  parts.reserve(rows.size());
  for (const auto & row : rows) {
    parts.push_back(join_formatted(row, fmt_item));
  }
  return fmt::format("[{}]", fmt::join(parts, ", "));
}

}  // namespace

// ============================================================================
// Value
// ============================================================================

bool Value::truthy() const noexcept
{
  switch (kind()) {
    case ValueKind::Number:
      return as_number() != 0;
    case ValueKind::Boolean:
      return as_bool();
    case ValueKind::String:
      return !as_string().empty();
    case ValueKind::Array1D:
      return !as_array().empty();
    case ValueKind::Array2D:
      return !as_grid().empty();
  }
  return false;
}

// ============================================================================
// Operators
// ============================================================================

EvalResult<Value> apply_binary_op(BinaryOp op, const Value & lhs, const Value & rhs)
{
  int64_t a = 0;
  int64_t b = 0;

  switch (op) {
    case BinaryOp::Add:
      if (lhs.is_string() && rhs.is_string()) {
        return Value::make_string(lhs.as_string() + rhs.as_string());
      }
      if (lhs.is_array() && rhs.is_array()) {
        Value::Array out = lhs.as_array();
        out.insert(out.end(), rhs.as_array().begin(), rhs.as_array().end());
        return Value::make_array(std::move(out));
      }
      if (!arith_operands(lhs, rhs, a, b)) return invalid_operands(op);
      return Value::make_number(wrap_add(a, b));

    case BinaryOp::Sub:
      if (!arith_operands(lhs, rhs, a, b)) return invalid_operands(op);
      return Value::make_number(wrap_sub(a, b));

    case BinaryOp::Mul:
      if (!arith_operands(lhs, rhs, a, b)) return invalid_operands(op);
      return Value::make_number(wrap_mul(a, b));

    case BinaryOp::Div:
      if (!arith_operands(lhs, rhs, a, b)) return invalid_operands(op);
      if (b == 0) return runtime_error("Division by zero");
      return Value::make_number(wrap_div(a, b));

    case BinaryOp::Mod:
      if (!lhs.is_number() || !rhs.is_number()) return invalid_operands(op);
      if (rhs.as_number() == 0) return runtime_error("Modulo by zero");
      return Value::make_number(wrap_rem(lhs.as_number(), rhs.as_number()));

    case BinaryOp::Lt:
    case BinaryOp::Gt:
    case BinaryOp::Le:
    case BinaryOp::Ge: {
      if (!lhs.is_number() || !rhs.is_number()) return invalid_operands(op);
      a = lhs.as_number();
      b = rhs.as_number();
      bool result = false;
      if (op == BinaryOp::Lt) {
        result = a < b;
      } else if (op == BinaryOp::Gt) {
        result = a > b;
      } else if (op == BinaryOp::Le) {
        result = a <= b;
      } else {
        result = a >= b;
      }
      return Value::make_bool(result);
    }

    case BinaryOp::Eq:
      return Value::make_bool(lhs == rhs);

    case BinaryOp::And:
      return lhs.truthy() ? rhs : lhs;

    case BinaryOp::Or:
      return lhs.truthy() ? lhs : rhs;
  }
  return invalid_operands(op);
}

std::optional<int64_t> parse_number(std::string_view s)
{
  if (!s.empty() && s.front() == '+') {
    s.remove_prefix(1);
    if (!s.empty() && s.front() == '-') return std::nullopt;
  }
  if (s.empty()) return std::nullopt;

  int64_t value = 0;
  const char * begin = s.data();
  const char * end = s.data() + s.size();
  auto [ptr, ec] = std::from_chars(begin, end, value);
  if (ec != std::errc{} || ptr != end) {
    return std::nullopt;
  }
  return value;
}

EvalResult<Value> to_number(const Value & v)
{
  switch (v.kind()) {
    case ValueKind::Number:
      return v;

    case ValueKind::Boolean:
      return Value::make_number(v.as_bool() ? 1 : 0);

    case ValueKind::String: {
      const auto n = parse_number(v.as_string());
      if (!n) return runtime_error(fmt::format("Cannot convert '{}' to number", v.as_string()));
      return Value::make_number(*n);
    }

    case ValueKind::Array1D: {
      // A row of characters (e.g. a slice of an input line) reads as one string.
      std::string text;
      for (const auto & element : v.as_array()) {
        if (!element.is_string()) {
          return runtime_error("Cannot convert non-string array element to number");
        }
        text += element.as_string();
      }
      const auto n = parse_number(text);
      if (!n) return runtime_error(fmt::format("Cannot convert '{}' to number", text));
      return Value::make_number(*n);
    }

    case ValueKind::Array2D:
      break;
  }
  return runtime_error("Cannot convert to number");
}

// ============================================================================
// Formatting
// ============================================================================

std::string format_value(const Value & v)
{
  switch (v.kind()) {
    case ValueKind::Number:
      return fmt::format("{}", v.as_number());
    case ValueKind::Boolean:
      return v.as_bool() ? "true" : "false";
    case ValueKind::String:
      return v.as_string();
    case ValueKind::Array1D:
      return join_formatted(v.as_array(), &format_value);
    case ValueKind::Array2D:
      return join_rows(v.as_grid(), &format_value);
  }
  return {};
}

std::string format_debug_value(const Value & v)
{
  switch (v.kind()) {
    case ValueKind::Number:
    case ValueKind::Boolean:
      return format_value(v);

    case ValueKind::String:
      return fmt::format("\"{}\"", v.as_string());

    case ValueKind::Array1D: {
      const auto & items = v.as_array();
      std::string chars;
      bool is_char_row = !items.empty();
      for (const auto & item : items) {
        if (!item.is_string() || utf8_length(item.as_string()) != 1) {
          is_char_row = false;
          break;
        }
        chars += item.as_string();
      }
      if (is_char_row) {
        return fmt::format("\"{}\"", chars);
      }
      return join_formatted(items, &format_debug_value);
    }

    case ValueKind::Array2D:
      return join_rows(v.as_grid(), &format_debug_value);
  }
  return {};
}

}  // namespace xmas
