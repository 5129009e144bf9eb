// xmas/runtime/interpreter.cpp - Tree-walking interpreter
//
#include "xmas/runtime/interpreter.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <string>
#include <utility>
#include <vector>

#include "xmas/basic/casting.hpp"
#include "xmas/basic/utf8.hpp"

namespace xmas
{

namespace
{

constexpr std::string_view k_pipe_temp = "__pipe_temp__";

/// Attach `range` to an error that does not carry a location yet.
EvalResult<Value> at_range(EvalResult<Value> result, SourceRange range)
{
  if (result.has_error() && result.error().range.is_invalid()) {
    result.error().range = range;
  }
  return result;
}

/// Brackets a region whose trace output is indented one level deeper.
class NestedTrace
{
public:
  explicit NestedTrace(TraceObserver * trace) : trace_(trace)
  {
    if (trace_) trace_->enter_nested();
  }
  ~NestedTrace()
  {
    if (trace_) trace_->leave_nested();
  }

  NestedTrace(const NestedTrace &) = delete;
  NestedTrace & operator=(const NestedTrace &) = delete;

private:
  TraceObserver * trace_;
};

EvalResult<Value> index_value(const Value & v, size_t idx, SourceRange range)
{
  switch (v.kind()) {
    case ValueKind::Array1D: {
      const auto & arr = v.as_array();
      if (idx >= arr.size()) {
        return runtime_error(
          fmt::format("Index {} out of bounds (array length: {})", idx, arr.size()), range);
      }
      return arr[idx];
    }
    case ValueKind::Array2D: {
      const auto & rows = v.as_grid();
      if (idx >= rows.size()) {
        return runtime_error(fmt::format("Index {} out of bounds", idx), range);
      }
      return Value::make_array(rows[idx]);
    }
    case ValueKind::String: {
      const auto chars = utf8_chars(v.as_string());
      if (idx >= chars.size()) {
        return runtime_error(fmt::format("Index {} out of bounds", idx), range);
      }
      return Value::make_string(std::string(chars[idx]));
    }
    default:
      return runtime_error("Cannot index non-array value", range);
  }
}

/// Clamp [start, end) to [0, size]; an inverted range becomes empty.
std::pair<size_t, size_t> clamp_slice(size_t start, std::optional<size_t> end, size_t size)
{
  const size_t hi = std::min(end.value_or(size), size);
  const size_t lo = std::min(start, hi);
  return {lo, hi};
}

EvalResult<Value> slice_value(
  const Value & v, size_t start, std::optional<size_t> end, SourceRange range)
{
  switch (v.kind()) {
    case ValueKind::Array1D: {
      const auto & arr = v.as_array();
      const auto [lo, hi] = clamp_slice(start, end, arr.size());
      return Value::make_array(Value::Array(arr.begin() + lo, arr.begin() + hi));
    }
    case ValueKind::Array2D: {
      const auto & rows = v.as_grid();
      const auto [lo, hi] = clamp_slice(start, end, rows.size());
      return Value::make_grid(Value::Grid(rows.begin() + lo, rows.begin() + hi));
    }
    case ValueKind::String: {
      const auto chars = utf8_chars(v.as_string());
      const auto [lo, hi] = clamp_slice(start, end, chars.size());
      std::string out;
      for (size_t i = lo; i < hi; ++i) {
        out += chars[i];
      }
      return Value::make_string(std::move(out));
    }
    default:
      return runtime_error("Cannot slice non-array value", range);
  }
}

}  // namespace

// ============================================================================
// Program / statements
// ============================================================================

EvalResult<Value> Interpreter::interpret(const Program * program)
{
  Value last;
  if (program) {
    for (const auto * stmt : program->statements) {
      if (const auto * es = dyn_cast<ExprStmt>(stmt)) {
        auto r = evaluate(es->expr);
        if (!r) return std::move(r).error();
        last = std::move(r).value();
        continue;
      }
      auto r = execute(stmt);
      if (!r) return std::move(r).error();
    }
  }

  if (env_.return_value()) {
    return *env_.return_value();
  }
  return last;
}

ExecResult Interpreter::execute(const Stmt * stmt)
{
  switch (stmt->get_kind()) {
    case NodeKind::Assign:
      return exec_assign(cast<AssignStmt>(stmt));
    case NodeKind::CompoundAssign:
      return exec_compound_assign(cast<CompoundAssignStmt>(stmt));
    case NodeKind::Return:
      return exec_return(cast<ReturnStmt>(stmt));
    case NodeKind::FunctionDef:
      env_.define_function(cast<FunctionDefStmt>(stmt));
      return exec_ok();
    case NodeKind::ExprStmt: {
      auto r = evaluate(cast<ExprStmt>(stmt)->expr);
      if (!r) return std::move(r).error();
      return exec_ok();
    }
    default:
      break;
  }
  return runtime_error("Unsupported statement", stmt->get_range());
}

ExecResult Interpreter::exec_assign(const AssignStmt * node)
{
  auto value = evaluate(node->value);
  if (!value) return std::move(value).error();

  if (trace_) {
    trace_->on_assign(node->name, env_.lookup(node->name), *value);
  }
  env_.assign(node->name, std::move(value).value());
  return exec_ok();
}

ExecResult Interpreter::exec_compound_assign(const CompoundAssignStmt * node)
{
  const bool named = node->targets_named_return();

  if (named || node->targets_return_value()) {
    const std::string_view slot = named ? node->target.substr(1) : std::string_view{};

    // A named slot that is not set yet starts from `_`.
    const Value * current = named ? env_.named_return(slot) : nullptr;
    if (!current && env_.return_value()) {
      current = &*env_.return_value();
    }
    if (!current) {
      return runtime_error(
        named ? fmt::format("No return value set for _{}", slot) : "No return value set",
        node->get_range());
    }
    const Value lhs = *current;

    auto rhs = evaluate(node->value);
    if (!rhs) return std::move(rhs).error();

    auto result = at_range(apply_binary_op(node->op, lhs, *rhs), node->get_range());
    if (!result) return std::move(result).error();

    if (trace_) {
      const Value * old = nullptr;
      if (named) {
        old = env_.named_return(slot);
      } else if (env_.return_value()) {
        old = &*env_.return_value();
      }
      trace_->on_compound_assign(node->target, node->op, old, *result);
    }

    if (named) {
      env_.set_named_return(slot, std::move(result).value());
    } else {
      env_.set_return_value(std::move(result).value());
    }
    return exec_ok();
  }

  const Value * current = env_.lookup(node->target);
  if (!current) {
    return runtime_error(fmt::format("Undefined variable: {}", node->target), node->get_range());
  }
  const Value lhs = *current;

  auto rhs = evaluate(node->value);
  if (!rhs) return std::move(rhs).error();

  auto result = at_range(apply_binary_op(node->op, lhs, *rhs), node->get_range());
  if (!result) return std::move(result).error();

  if (trace_) {
    trace_->on_compound_assign(node->target, node->op, env_.lookup(node->target), *result);
  }
  env_.assign(node->target, std::move(result).value());
  return exec_ok();
}

ExecResult Interpreter::exec_return(const ReturnStmt * node)
{
  auto value = evaluate(node->value);
  if (!value) return std::move(value).error();

  if (node->name) {
    env_.set_named_return(*node->name, *value);
  }
  env_.set_return_value(std::move(value).value());
  return exec_ok();
}

// ============================================================================
// Expressions
// ============================================================================

EvalResult<Value> Interpreter::evaluate(const Expr * expr)
{
  switch (expr->get_kind()) {
    case NodeKind::NumberLiteral:
      return Value::make_number(cast<NumberLiteralExpr>(expr)->value);
    case NodeKind::BoolLiteral:
      return Value::make_bool(cast<BoolLiteralExpr>(expr)->value);
    case NodeKind::StringLiteral:
      return Value::make_string(std::string(cast<StringLiteralExpr>(expr)->value));
    case NodeKind::VarRef:
      return eval_var_ref(cast<VarRefExpr>(expr));
    case NodeKind::InputRef:
      return env_.input();
    case NodeKind::ReturnValue:
      if (!env_.return_value()) {
        return runtime_error("No return value set", expr->get_range());
      }
      return *env_.return_value();
    case NodeKind::ArrayLiteral:
      return eval_array_literal(cast<ArrayLiteralExpr>(expr));
    case NodeKind::RangeLiteral:
      return eval_range_literal(cast<RangeLiteralExpr>(expr));
    case NodeKind::Unary:
      return eval_unary(cast<UnaryExpr>(expr));
    case NodeKind::Binary:
      return eval_binary(cast<BinaryExpr>(expr));
    case NodeKind::Pipe:
      return eval_pipe(cast<PipeExpr>(expr));
    case NodeKind::Call:
      return eval_call(cast<CallExpr>(expr));
    case NodeKind::Index:
      return eval_index(cast<IndexExpr>(expr));
    case NodeKind::Builtin:
      return eval_builtin(cast<BuiltinExpr>(expr));
    case NodeKind::MethodCall:
      return eval_method_call(cast<MethodCallExpr>(expr));
    case NodeKind::Block:
      return eval_block(cast<BlockExpr>(expr));
    default:
      break;
  }
  return runtime_error("Unsupported expression", expr->get_range());
}

EvalResult<Value> Interpreter::eval_var_ref(const VarRefExpr * node)
{
  if (node->is_named_return()) {
    if (const Value * v = env_.named_return(node->name.substr(1))) {
      return *v;
    }
    return runtime_error(fmt::format("Undefined named return: {}", node->name), node->get_range());
  }

  if (const Value * v = env_.lookup(node->name)) {
    return *v;
  }
  return runtime_error(fmt::format("Undefined variable: {}", node->name), node->get_range());
}

EvalResult<Value> Interpreter::eval_array_literal(const ArrayLiteralExpr * node)
{
  Value::Array elements;
  elements.reserve(node->elements.size());
  for (const auto * e : node->elements) {
    auto v = evaluate(e);
    if (!v) return v;
    elements.push_back(std::move(v).value());
  }
  return Value::make_array(std::move(elements));
}

EvalResult<Value> Interpreter::eval_range_literal(const RangeLiteralExpr * node)
{
  auto start = evaluate(node->start);
  if (!start) return start;
  auto end = evaluate(node->end);
  if (!end) return end;

  if (!start->is_number()) {
    return runtime_error("Range start must be a number", node->start->get_range());
  }
  if (!end->is_number()) {
    return runtime_error("Range end must be a number", node->end->get_range());
  }

  // Inclusive at both ends; counts down when start > end.
  const int64_t from = start->as_number();
  const int64_t to = end->as_number();
  const int64_t step = (from <= to) ? 1 : -1;

  Value::Array out;
  for (int64_t i = from;; i += step) {
    out.push_back(Value::make_number(i));
    if (i == to) break;
  }
  return Value::make_array(std::move(out));
}

EvalResult<Value> Interpreter::eval_unary(const UnaryExpr * node)
{
  auto operand = evaluate(node->operand);
  if (!operand) return operand;

  if (node->op == UnaryOp::Not) {
    return Value::make_bool(!operand->truthy());
  }
  return at_range(to_number(*operand), node->get_range());
}

EvalResult<Value> Interpreter::eval_binary(const BinaryExpr * node)
{
  // Both operands are always evaluated; `&&` and `||` do not short-circuit.
  auto lhs = evaluate(node->lhs);
  if (!lhs) return lhs;
  auto rhs = evaluate(node->rhs);
  if (!rhs) return rhs;

  return at_range(apply_binary_op(node->op, *lhs, *rhs), node->get_range());
}

EvalResult<Value> Interpreter::eval_pipe(const PipeExpr * node)
{
  auto lhs = evaluate(node->lhs);
  if (!lhs) return lhs;

  // The left value is visible to the right side only as `__pipe_temp__`.
  const BindingScope temp(env_, k_pipe_temp, std::move(lhs).value());
  return evaluate(node->rhs);
}

EvalResult<Value> Interpreter::eval_call(const CallExpr * node)
{
  const FunctionDefStmt * fn = env_.find_function(node->callee);
  if (!fn) {
    return runtime_error(fmt::format("Undefined function: {}", node->callee), node->get_range());
  }
  if (node->args.size() != fn->params.size()) {
    return runtime_error(
      fmt::format(
        "Function {} expects {} arguments, got {}", node->callee, fn->params.size(),
        node->args.size()),
      node->get_range());
  }

  std::vector<Value> args;
  args.reserve(node->args.size());
  for (const auto * a : node->args) {
    auto v = evaluate(a);
    if (!v) return v;
    args.push_back(std::move(v).value());
  }

  BindingScope params(env_);
  for (size_t i = 0; i < args.size(); ++i) {
    params.bind(fn->params[i], std::move(args[i]));
  }
  const ReturnScope returns(env_);

  auto result = evaluate(fn->body);

  // An expression body yields its own value unless it set `_`.
  if (!env_.return_value()) {
    return result;
  }
  if (!result) return result;
  return *env_.return_value();
}

EvalResult<size_t> Interpreter::eval_index_value(const Expr * expr)
{
  auto v = evaluate(expr);
  if (!v) return std::move(v).error();

  if (!v->is_number()) {
    return runtime_error("Array index must be a number", expr->get_range());
  }
  if (v->as_number() < 0) {
    return runtime_error("Array index must be non-negative integer", expr->get_range());
  }
  return static_cast<size_t>(v->as_number());
}

EvalResult<std::optional<size_t>> Interpreter::eval_bound(const Expr * expr)
{
  if (!expr) {
    return std::optional<size_t>{};
  }
  auto idx = eval_index_value(expr);
  if (!idx) return std::move(idx).error();
  return std::optional<size_t>(*idx);
}

EvalResult<Value> Interpreter::eval_index(const IndexExpr * node)
{
  auto base = evaluate(node->base);
  if (!base) return base;

  Value current = std::move(base).value();
  const auto & comps = node->components;

  size_t i = 0;
  while (i < comps.size()) {
    const IndexComponent * c = comps[i];

    // grid[rows.., col]: a row range followed by a single index selects a column.
    if (current.is_grid() && c->is_range && i + 1 < comps.size() && !comps[i + 1]->is_range) {
      auto col = eval_index_value(comps[i + 1]->single);
      if (!col) return std::move(col).error();
      auto start = eval_bound(c->start);
      if (!start) return std::move(start).error();
      auto end = eval_bound(c->end);
      if (!end) return std::move(end).error();

      const auto & rows = current.as_grid();
      const auto [lo, hi] = clamp_slice(start->value_or(0), *end, rows.size());

      // Rows too short for the column are skipped.
      Value::Array column;
      for (size_t r = lo; r < hi; ++r) {
        if (*col < rows[r].size()) {
          column.push_back(rows[r][*col]);
        }
      }
      current = Value::make_array(std::move(column));
      i += 2;
      continue;
    }

    if (!c->is_range) {
      auto idx = eval_index_value(c->single);
      if (!idx) return std::move(idx).error();
      auto next = index_value(current, *idx, c->get_range());
      if (!next) return next;
      current = std::move(next).value();
    } else {
      auto start = eval_bound(c->start);
      if (!start) return std::move(start).error();
      auto end = eval_bound(c->end);
      if (!end) return std::move(end).error();
      auto next = slice_value(current, start->value_or(0), *end, c->get_range());
      if (!next) return next;
      current = std::move(next).value();
    }
    ++i;
  }
  return current;
}

EvalResult<Value> Interpreter::eval_method_call(const MethodCallExpr * node)
{
  auto object = evaluate(node->object);
  if (!object) return object;

  if (node->method != "rows") {
    return runtime_error(fmt::format("Unknown method: {}", node->method), node->get_range());
  }
  if (!node->args.empty()) {
    return runtime_error("rows() method takes no arguments", node->get_range());
  }
  if (!object->is_grid()) {
    return runtime_error("rows() method only works on 2D arrays", node->get_range());
  }

  Value::Array rows;
  rows.reserve(object->as_grid().size());
  for (const auto & row : object->as_grid()) {
    rows.push_back(Value::make_array(row));
  }
  return Value::make_array(std::move(rows));
}

EvalResult<Value> Interpreter::eval_block(const BlockExpr * node)
{
  // Blocks scope the return slots only; variables stay global.
  const ReturnScope returns(env_);

  for (const auto * stmt : node->statements) {
    auto r = execute(stmt);
    if (!r) return std::move(r).error();
  }

  if (env_.return_value()) {
    return *env_.return_value();
  }
  return Value();
}

// ============================================================================
// Builtins
// ============================================================================

EvalResult<Value> Interpreter::eval_builtin(const BuiltinExpr * node)
{
  switch (node->builtin) {
    case BuiltinKind::If:
      return eval_if(node);
    case BuiltinKind::For:
      return eval_for(node);
    case BuiltinKind::Len:
      return eval_len(node);
    case BuiltinKind::Max:
    case BuiltinKind::Min:
      return eval_min_max(node);
    case BuiltinKind::Floor:
    case BuiltinKind::Ceil:
      return eval_floor_ceil(node);
  }
  return runtime_error(
    fmt::format("Unknown builtin function: {}", to_string(node->builtin)), node->get_range());
}

EvalResult<Value> Interpreter::eval_if(const BuiltinExpr * node)
{
  const auto & args = node->args;
  if (args.size() < 2 || args.size() > 3) {
    return runtime_error(
      "if requires 2 or 3 arguments: condition, trueBlock, [falseBlock]", node->get_range());
  }

  auto cond = evaluate(args[0]);
  if (!cond) return cond;
  const bool taken = cond->truthy();
  if (trace_) {
    trace_->on_if(args[0], taken);
  }

  const NestedTrace nested(trace_);
  if (taken) {
    return evaluate(args[1]);
  }
  if (args.size() == 3) {
    return evaluate(args[2]);
  }
  return Value();
}

EvalResult<Value> Interpreter::eval_for(const BuiltinExpr * node)
{
  // The loop variable counts as the first argument.
  const auto & args = node->args;
  if (args.size() + 1 < 3 || args.size() + 1 > 4) {
    return runtime_error(
      "for requires 3 or 4 arguments: variable, array, block, [initialValue]", node->get_range());
  }

  auto array = evaluate(args[0]);
  if (!array) return array;
  if (array->is_grid()) {
    return runtime_error("for loop requires 1D array", args[0]->get_range());
  }
  if (!array->is_array()) {
    return runtime_error("for loop requires array", args[0]->get_range());
  }
  const Value::Array elements = array->as_array();

  const bool has_initial = args.size() == 3;
  Value initial;
  if (has_initial) {
    auto init = evaluate(args[2]);
    if (!init) return init;
    initial = std::move(init).value();
  }

  const ReturnScope returns(env_);
  if (has_initial) {
    env_.set_return_value(initial);
  }

  const Expr * body = args[1];
  const auto * block = dyn_cast<BlockExpr>(body);

  for (const auto & element : elements) {
    if (trace_) {
      trace_->on_for_iteration(node->loop_var, element);
    }
    const BindingScope binding(env_, node->loop_var, element);
    const NestedTrace nested(trace_);

    // A literal block body runs in the loop's return scope so `_` accumulates.
    if (block) {
      for (const auto * stmt : block->statements) {
        auto r = execute(stmt);
        if (!r) return std::move(r).error();
      }
    } else {
      auto r = evaluate(body);
      if (!r) return r;
    }
  }

  if (!has_initial) {
    return Value();
  }
  if (env_.return_value()) {
    return *env_.return_value();
  }
  return initial;
}

EvalResult<Value> Interpreter::eval_len(const BuiltinExpr * node)
{
  if (node->args.size() != 1) {
    return runtime_error("len requires 1 argument", node->get_range());
  }
  auto v = evaluate(node->args[0]);
  if (!v) return v;

  switch (v->kind()) {
    case ValueKind::Array1D:
      return Value::make_number(static_cast<int64_t>(v->as_array().size()));
    case ValueKind::Array2D: {
      const auto & rows = v->as_grid();
      const auto n_rows = static_cast<int64_t>(rows.size());
      const auto n_cols = rows.empty() ? 0 : static_cast<int64_t>(rows.front().size());
      return Value::make_array({Value::make_number(n_rows), Value::make_number(n_cols)});
    }
    case ValueKind::String:
      return Value::make_number(static_cast<int64_t>(utf8_length(v->as_string())));
    default:
      break;
  }
  return runtime_error("len requires array or string", node->get_range());
}

EvalResult<Value> Interpreter::eval_min_max(const BuiltinExpr * node)
{
  const bool is_max = node->builtin == BuiltinKind::Max;
  const std::string_view name = to_string(node->builtin);

  if (node->args.size() != 2) {
    return runtime_error(fmt::format("{} requires 2 arguments", name), node->get_range());
  }
  auto a = evaluate(node->args[0]);
  if (!a) return a;
  auto b = evaluate(node->args[1]);
  if (!b) return b;

  if (!a->is_number() || !b->is_number()) {
    return runtime_error(fmt::format("{} requires 2 numbers", name), node->get_range());
  }
  const int64_t x = a->as_number();
  const int64_t y = b->as_number();
  return Value::make_number(is_max ? std::max(x, y) : std::min(x, y));
}

EvalResult<Value> Interpreter::eval_floor_ceil(const BuiltinExpr * node)
{
  const std::string_view name = to_string(node->builtin);

  if (node->args.size() != 1) {
    return runtime_error(fmt::format("{} requires 1 argument", name), node->get_range());
  }
  auto v = evaluate(node->args[0]);
  if (!v) return v;

  // Numbers are integers, so rounding is the identity.
  if (!v->is_number()) {
    return runtime_error(fmt::format("{} requires a number", name), node->get_range());
  }
  return v;
}

}  // namespace xmas
