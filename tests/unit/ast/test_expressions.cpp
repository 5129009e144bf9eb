#include <gtest/gtest.h>

#include <string>

#include "xmas/ast/ast.hpp"
#include "xmas/basic/casting.hpp"
#include "xmas/test_support/parse_helpers.hpp"

using xmas::cast;
using xmas::dyn_cast;
using xmas::isa;

namespace
{

/// Parse `src` as one expression statement and return its expression.
const xmas::Expr * parse_expr(xmas::test_support::TestParseUnit & unit)
{
  EXPECT_TRUE(unit.ok());
  if (!unit.program || unit.program->statements.size() != 1) {
    return nullptr;
  }
  const auto * stmt = dyn_cast<xmas::ExprStmt>(unit.program->statements[0]);
  return stmt ? stmt->expr : nullptr;
}

}  // namespace

// ============================================================================
// Precedence
// ============================================================================

TEST(AstExpressions, MultiplicationBindsTighterThanAddition)
{
  auto unit = xmas::test_support::parse("a + b * c");
  const auto * e = parse_expr(unit);
  ASSERT_NE(e, nullptr);

  const auto * add = dyn_cast<xmas::BinaryExpr>(e);
  ASSERT_NE(add, nullptr);
  EXPECT_EQ(add->op, xmas::BinaryOp::Add);
  EXPECT_TRUE(isa<xmas::VarRefExpr>(add->lhs));

  const auto * mul = dyn_cast<xmas::BinaryExpr>(add->rhs);
  ASSERT_NE(mul, nullptr);
  EXPECT_EQ(mul->op, xmas::BinaryOp::Mul);
}

TEST(AstExpressions, LogicalPrecedence)
{
  // a || (b && (c == d))
  auto unit = xmas::test_support::parse("a || b && c == d");
  const auto * e = parse_expr(unit);
  ASSERT_NE(e, nullptr);

  const auto * lor = cast<xmas::BinaryExpr>(e);
  EXPECT_EQ(lor->op, xmas::BinaryOp::Or);
  const auto * land = cast<xmas::BinaryExpr>(lor->rhs);
  EXPECT_EQ(land->op, xmas::BinaryOp::And);
  const auto * eq = cast<xmas::BinaryExpr>(land->rhs);
  EXPECT_EQ(eq->op, xmas::BinaryOp::Eq);
}

TEST(AstExpressions, ComparisonChainsFoldLeft)
{
  auto unit = xmas::test_support::parse("a < b < c");
  const auto * e = parse_expr(unit);
  ASSERT_NE(e, nullptr);

  const auto * outer = cast<xmas::BinaryExpr>(e);
  EXPECT_EQ(outer->op, xmas::BinaryOp::Lt);
  EXPECT_TRUE(isa<xmas::BinaryExpr>(outer->lhs));
  EXPECT_TRUE(isa<xmas::VarRefExpr>(outer->rhs));
}

TEST(AstExpressions, PipeIsLoosestAndLeftAssociative)
{
  auto unit = xmas::test_support::parse("a + 1 |> f(x) |> g(y) || z");
  const auto * e = parse_expr(unit);
  ASSERT_NE(e, nullptr);

  const auto * outer = dyn_cast<xmas::PipeExpr>(e);
  ASSERT_NE(outer, nullptr);
  EXPECT_TRUE(isa<xmas::BinaryExpr>(outer->rhs));  // g(y) || z

  const auto * inner = dyn_cast<xmas::PipeExpr>(outer->lhs);
  ASSERT_NE(inner, nullptr);
  EXPECT_TRUE(isa<xmas::BinaryExpr>(inner->lhs));  // a + 1
  EXPECT_TRUE(isa<xmas::CallExpr>(inner->rhs));
}

TEST(AstExpressions, UnaryAppliesToIndexedOperand)
{
  auto unit = xmas::test_support::parse("~line[1..]");
  const auto * e = parse_expr(unit);
  ASSERT_NE(e, nullptr);

  const auto * un = cast<xmas::UnaryExpr>(e);
  EXPECT_EQ(un->op, xmas::UnaryOp::ToNumber);
  EXPECT_TRUE(isa<xmas::IndexExpr>(un->operand));
}

TEST(AstExpressions, ParenthesesGroup)
{
  auto unit = xmas::test_support::parse("(a + b) * c");
  const auto * e = parse_expr(unit);
  ASSERT_NE(e, nullptr);

  const auto * mul = cast<xmas::BinaryExpr>(e);
  EXPECT_EQ(mul->op, xmas::BinaryOp::Mul);
  EXPECT_TRUE(isa<xmas::BinaryExpr>(mul->lhs));
}

// ============================================================================
// Array vs. range literals
// ============================================================================

TEST(AstExpressions, RangeLiteral)
{
  auto unit = xmas::test_support::parse("[1..n + 1]");
  const auto * e = parse_expr(unit);
  ASSERT_NE(e, nullptr);

  const auto * range = dyn_cast<xmas::RangeLiteralExpr>(e);
  ASSERT_NE(range, nullptr);
  EXPECT_TRUE(isa<xmas::NumberLiteralExpr>(range->start));
  EXPECT_TRUE(isa<xmas::BinaryExpr>(range->end));
}

TEST(AstExpressions, ArrayLiteral)
{
  auto unit = xmas::test_support::parse("[1, [2, 3], \"x\"]");
  const auto * e = parse_expr(unit);
  ASSERT_NE(e, nullptr);

  const auto * arr = dyn_cast<xmas::ArrayLiteralExpr>(e);
  ASSERT_NE(arr, nullptr);
  ASSERT_EQ(arr->elements.size(), 3U);
  EXPECT_TRUE(isa<xmas::ArrayLiteralExpr>(arr->elements[1]));
  EXPECT_TRUE(isa<xmas::StringLiteralExpr>(arr->elements[2]));
}

TEST(AstExpressions, EmptyArrayAndSingleElement)
{
  auto empty = xmas::test_support::parse("[]");
  const auto * e = parse_expr(empty);
  ASSERT_NE(e, nullptr);
  EXPECT_EQ(cast<xmas::ArrayLiteralExpr>(e)->elements.size(), 0U);

  auto single = xmas::test_support::parse("[[1..3]]");
  const auto * s = parse_expr(single);
  ASSERT_NE(s, nullptr);
  const auto * outer = cast<xmas::ArrayLiteralExpr>(s);
  ASSERT_EQ(outer->elements.size(), 1U);
  EXPECT_TRUE(isa<xmas::RangeLiteralExpr>(outer->elements[0]));
}

TEST(AstExpressions, ArrayLiteralMaySpanLines)
{
  auto unit = xmas::test_support::parse("[\n  1,\n  2\n]");
  const auto * e = parse_expr(unit);
  ASSERT_NE(e, nullptr);
  EXPECT_EQ(cast<xmas::ArrayLiteralExpr>(e)->elements.size(), 2U);
}

// ============================================================================
// Postfix forms
// ============================================================================

TEST(AstExpressions, EachBracketGroupIsOneIndexExpr)
{
  auto unit = xmas::test_support::parse("grid[1][2..]");
  const auto * e = parse_expr(unit);
  ASSERT_NE(e, nullptr);

  const auto * outer = cast<xmas::IndexExpr>(e);
  ASSERT_EQ(outer->components.size(), 1U);
  EXPECT_TRUE(outer->components[0]->is_range);
  EXPECT_NE(outer->components[0]->start, nullptr);
  EXPECT_EQ(outer->components[0]->end, nullptr);

  const auto * inner = cast<xmas::IndexExpr>(outer->base);
  ASSERT_EQ(inner->components.size(), 1U);
  EXPECT_FALSE(inner->components[0]->is_range);
  EXPECT_TRUE(isa<xmas::VarRefExpr>(inner->base));
}

TEST(AstExpressions, IndexComponentForms)
{
  auto unit = xmas::test_support::parse("a[..3, 1..2, .., 4]");
  const auto * e = parse_expr(unit);
  ASSERT_NE(e, nullptr);

  const auto * idx = cast<xmas::IndexExpr>(e);
  ASSERT_EQ(idx->components.size(), 4U);

  EXPECT_TRUE(idx->components[0]->is_range);
  EXPECT_EQ(idx->components[0]->start, nullptr);
  EXPECT_NE(idx->components[0]->end, nullptr);

  EXPECT_TRUE(idx->components[1]->is_range);
  EXPECT_NE(idx->components[1]->start, nullptr);
  EXPECT_NE(idx->components[1]->end, nullptr);

  EXPECT_TRUE(idx->components[2]->is_range);
  EXPECT_EQ(idx->components[2]->start, nullptr);
  EXPECT_EQ(idx->components[2]->end, nullptr);

  EXPECT_FALSE(idx->components[3]->is_range);
  EXPECT_NE(idx->components[3]->single, nullptr);
}

TEST(AstExpressions, MethodCallAfterCallAndIndex)
{
  auto unit = xmas::test_support::parse("f(x)[0].rows()");
  const auto * e = parse_expr(unit);
  ASSERT_NE(e, nullptr);

  const auto * m = cast<xmas::MethodCallExpr>(e);
  EXPECT_EQ(m->method, "rows");
  const auto * idx = cast<xmas::IndexExpr>(m->object);
  EXPECT_TRUE(isa<xmas::CallExpr>(idx->base));
}

TEST(AstExpressions, UnknownMethodParses)
{
  auto unit = xmas::test_support::parse("x.cols(1)");
  const auto * e = parse_expr(unit);
  ASSERT_NE(e, nullptr);

  const auto * m = cast<xmas::MethodCallExpr>(e);
  EXPECT_EQ(m->method, "cols");
  EXPECT_EQ(m->args.size(), 1U);
}

// ============================================================================
// Builtins
// ============================================================================

TEST(AstExpressions, BuiltinsAreNotCalls)
{
  auto unit = xmas::test_support::parse("if(len(a) > 0, max(1, 2), min(3, 4))");
  const auto * e = parse_expr(unit);
  ASSERT_NE(e, nullptr);

  const auto * b = cast<xmas::BuiltinExpr>(e);
  EXPECT_EQ(b->builtin, xmas::BuiltinKind::If);
  ASSERT_EQ(b->args.size(), 3U);
  EXPECT_EQ(cast<xmas::BuiltinExpr>(b->args[1])->builtin, xmas::BuiltinKind::Max);
  EXPECT_EQ(cast<xmas::BuiltinExpr>(b->args[2])->builtin, xmas::BuiltinKind::Min);
}

TEST(AstExpressions, ForWithoutInitialValue)
{
  auto unit = xmas::test_support::parse("for(n of nums, { x += n })");
  const auto * e = parse_expr(unit);
  ASSERT_NE(e, nullptr);

  const auto * b = cast<xmas::BuiltinExpr>(e);
  EXPECT_EQ(b->builtin, xmas::BuiltinKind::For);
  EXPECT_EQ(b->loop_var, "n");
  ASSERT_EQ(b->args.size(), 2U);
  EXPECT_TRUE(isa<xmas::BlockExpr>(b->args[1]));
}

TEST(AstExpressions, BuiltinArgumentsMaySpanLines)
{
  auto unit = xmas::test_support::parse("if(x,\n  {\n    _ = 1\n  },\n  2\n)");
  const auto * e = parse_expr(unit);
  ASSERT_NE(e, nullptr);
  EXPECT_EQ(cast<xmas::BuiltinExpr>(e)->args.size(), 3U);
}
