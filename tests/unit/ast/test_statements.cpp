#include <gtest/gtest.h>

#include <string>

#include "xmas/ast/ast.hpp"
#include "xmas/basic/casting.hpp"
#include "xmas/test_support/parse_helpers.hpp"

using xmas::cast;
using xmas::dyn_cast;
using xmas::isa;

TEST(AstStatements, StatementsSeparatedByNewlinesAndComments)
{
  auto unit = xmas::test_support::parse(
    "// header\n"
    "\n"
    "x = 1 // one\n"
    "y = 2\n"
    "\n");
  ASSERT_TRUE(unit.ok());
  ASSERT_EQ(unit.program->statements.size(), 2U);
  EXPECT_TRUE(isa<xmas::AssignStmt>(unit.program->statements[0]));
  EXPECT_TRUE(isa<xmas::AssignStmt>(unit.program->statements[1]));
}

TEST(AstStatements, SemicolonsAreIgnored)
{
  auto unit = xmas::test_support::parse("{ x = 5; y = 10 }");
  ASSERT_TRUE(unit.ok());
  ASSERT_EQ(unit.program->statements.size(), 1U);

  const auto * stmt = cast<xmas::ExprStmt>(unit.program->statements[0]);
  const auto * block = cast<xmas::BlockExpr>(stmt->expr);
  EXPECT_EQ(block->statements.size(), 2U);
}

TEST(AstStatements, FunctionDefinitionVsCall)
{
  auto unit = xmas::test_support::parse("add(a, b) = a + b\nadd(1, 2)");
  ASSERT_TRUE(unit.ok());
  ASSERT_EQ(unit.program->statements.size(), 2U);

  const auto * def = dyn_cast<xmas::FunctionDefStmt>(unit.program->statements[0]);
  ASSERT_NE(def, nullptr);
  EXPECT_EQ(def->name, "add");
  ASSERT_EQ(def->params.size(), 2U);
  EXPECT_EQ(def->params[0], "a");
  EXPECT_EQ(def->params[1], "b");
  EXPECT_TRUE(isa<xmas::BinaryExpr>(def->body));

  const auto * call_stmt = dyn_cast<xmas::ExprStmt>(unit.program->statements[1]);
  ASSERT_NE(call_stmt, nullptr);
  const auto * call = cast<xmas::CallExpr>(call_stmt->expr);
  EXPECT_EQ(call->callee, "add");
  EXPECT_EQ(call->args.size(), 2U);
}

TEST(AstStatements, FunctionWithoutParameters)
{
  auto unit = xmas::test_support::parse("answer() = 42");
  ASSERT_TRUE(unit.ok());
  const auto * def = cast<xmas::FunctionDefStmt>(unit.program->statements[0]);
  EXPECT_TRUE(def->params.empty());
}

TEST(AstStatements, CallWithNestedParensIsNotADefinition)
{
  auto unit = xmas::test_support::parse("f((1 + 2) * 3) == 9");
  ASSERT_TRUE(unit.ok());
  ASSERT_EQ(unit.program->statements.size(), 1U);
  EXPECT_TRUE(isa<xmas::ExprStmt>(unit.program->statements[0]));
}

TEST(AstStatements, ReturnTargets)
{
  auto unit = xmas::test_support::parse("_ = 1\n_best = 2\nbest = 3");
  ASSERT_TRUE(unit.ok());
  ASSERT_EQ(unit.program->statements.size(), 3U);

  const auto * unnamed = cast<xmas::ReturnStmt>(unit.program->statements[0]);
  EXPECT_FALSE(unnamed->name.has_value());

  const auto * named = cast<xmas::ReturnStmt>(unit.program->statements[1]);
  ASSERT_TRUE(named->name.has_value());
  EXPECT_EQ(*named->name, "best");

  const auto * plain = cast<xmas::AssignStmt>(unit.program->statements[2]);
  EXPECT_EQ(plain->name, "best");
}

TEST(AstStatements, CompoundAssignOperators)
{
  auto unit = xmas::test_support::parse("x += 1\nx -= 1\nx *= 2\nx /= 2\nx %= 3\n_ += 1\n_acc += 1");
  ASSERT_TRUE(unit.ok());
  ASSERT_EQ(unit.program->statements.size(), 7U);

  const xmas::BinaryOp expected[] = {
    xmas::BinaryOp::Add, xmas::BinaryOp::Sub, xmas::BinaryOp::Mul,
    xmas::BinaryOp::Div, xmas::BinaryOp::Mod, xmas::BinaryOp::Add,
    xmas::BinaryOp::Add};
  for (size_t i = 0; i < 7; ++i) {
    const auto * s = dyn_cast<xmas::CompoundAssignStmt>(unit.program->statements[i]);
    ASSERT_NE(s, nullptr) << "statement " << i;
    EXPECT_EQ(s->op, expected[i]);
  }

  const auto * ret = cast<xmas::CompoundAssignStmt>(unit.program->statements[5]);
  EXPECT_TRUE(ret->targets_return_value());
  const auto * named = cast<xmas::CompoundAssignStmt>(unit.program->statements[6]);
  EXPECT_TRUE(named->targets_named_return());
}

TEST(AstStatements, BareIdentifierIsAnExpressionStatement)
{
  auto unit = xmas::test_support::parse("x\n_\n_acc");
  ASSERT_TRUE(unit.ok());
  ASSERT_EQ(unit.program->statements.size(), 3U);

  const auto * a = cast<xmas::ExprStmt>(unit.program->statements[0]);
  EXPECT_TRUE(isa<xmas::VarRefExpr>(a->expr));
  const auto * b = cast<xmas::ExprStmt>(unit.program->statements[1]);
  EXPECT_TRUE(isa<xmas::ReturnValueExpr>(b->expr));
  const auto * c = cast<xmas::ExprStmt>(unit.program->statements[2]);
  EXPECT_TRUE(cast<xmas::VarRefExpr>(c->expr)->is_named_return());
}

TEST(AstStatements, RangesCoverTheStatement)
{
  auto unit = xmas::test_support::parse("total = a + b");
  ASSERT_TRUE(unit.ok());

  const auto * s = unit.program->statements[0];
  EXPECT_EQ(unit.slice(s->get_range()), "total = a + b");

  const auto * assign = cast<xmas::AssignStmt>(s);
  EXPECT_EQ(unit.slice(assign->value->get_range()), "a + b");
}
