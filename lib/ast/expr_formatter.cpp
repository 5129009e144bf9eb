// xmas/ast/expr_formatter.cpp - Render expressions back to source-like text
//
#include "xmas/ast/expr_formatter.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <string>
#include <vector>

#include "xmas/ast/visitor.hpp"

namespace xmas
{

namespace
{

class ExprFormatter : public ConstAstVisitor<ExprFormatter, std::string>
{
public:
  std::string visit_number_literal_expr(const NumberLiteralExpr * node)
  {
    return fmt::format("{}", node->value);
  }

  std::string visit_bool_literal_expr(const BoolLiteralExpr * node)
  {
    return node->value ? "true" : "false";
  }

  std::string visit_string_literal_expr(const StringLiteralExpr * node)
  {
    return fmt::format("\"{}\"", node->value);
  }

  std::string visit_var_ref_expr(const VarRefExpr * node) { return std::string(node->name); }

  std::string visit_input_ref_expr(const InputRefExpr * /*node*/) { return "input"; }

  std::string visit_return_value_expr(const ReturnValueExpr * /*node*/) { return "_"; }

  std::string visit_array_literal_expr(const ArrayLiteralExpr * node)
  {
    return fmt::format("[{}]", join(node->elements));
  }

  std::string visit_range_literal_expr(const RangeLiteralExpr * node)
  {
    return fmt::format("[{}..{}]", visit(node->start), visit(node->end));
  }

  std::string visit_unary_expr(const UnaryExpr * node)
  {
    return fmt::format("{}{}", to_string(node->op), visit(node->operand));
  }

  std::string visit_binary_expr(const BinaryExpr * node)
  {
    return fmt::format("({} {} {})", visit(node->lhs), to_string(node->op), visit(node->rhs));
  }

  std::string visit_pipe_expr(const PipeExpr * node)
  {
    return fmt::format("{} |> {}", visit(node->lhs), visit(node->rhs));
  }

  std::string visit_call_expr(const CallExpr * node)
  {
    return fmt::format("{}({})", node->callee, join(node->args));
  }

  std::string visit_index_expr(const IndexExpr * node)
  {
    std::vector<std::string> parts;
    for (const auto * c : node->components) {
      parts.push_back(visit_index_component(c));
    }
    return fmt::format("{}[{}]", visit(node->base), fmt::join(parts, ", "));
  }

  std::string visit_index_component(const IndexComponent * node)
  {
    if (!node->is_range) {
      return visit(node->single);
    }
    return fmt::format("{}..{}", visit(node->start), visit(node->end));
  }

  std::string visit_builtin_expr(const BuiltinExpr * node)
  {
    if (node->builtin == BuiltinKind::For) {
      return fmt::format("for({} of {})", node->loop_var, join(node->args));
    }
    return fmt::format("{}({})", to_string(node->builtin), join(node->args));
  }

  std::string visit_method_call_expr(const MethodCallExpr * node)
  {
    return fmt::format("{}.{}({})", visit(node->object), node->method, join(node->args));
  }

  std::string visit_block_expr(const BlockExpr * /*node*/) { return "{ ... }"; }

private:
  std::string join(gsl::span<Expr * const> exprs)
  {
    std::vector<std::string> parts;
    parts.reserve(exprs.size());
    for (const auto * e : exprs) {
      parts.push_back(visit(e));
    }
    return fmt::format("{}", fmt::join(parts, ", "));
  }
};

}  // namespace

std::string format_expr(const Expr * expr)
{
  ExprFormatter formatter;
  return formatter.visit(expr);
}

}  // namespace xmas
