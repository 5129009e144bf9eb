#include <gtest/gtest.h>

#include <string>

#include "xmas/basic/diagnostic.hpp"
#include "xmas/test_support/parse_helpers.hpp"

namespace
{

struct ParseFailure
{
  std::string message;
  std::string code;
  std::string at;  // source text under the primary label
};

ParseFailure expect_failure(const std::string & src)
{
  auto unit = xmas::test_support::parse(src);
  EXPECT_EQ(unit.program, nullptr) << src;
  EXPECT_EQ(unit.diags.size(), 1U) << src;
  if (unit.diags.empty()) {
    return {};
  }
  const auto & d = unit.diags.all().front();
  EXPECT_EQ(d.severity, xmas::Severity::Error);
  return {d.message, d.code, std::string(unit.slice(d.primary_range()))};
}

}  // namespace

TEST(SyntaxParseErrors, SuccessfulParseReportsNothing)
{
  auto unit = xmas::test_support::parse("x = [1..3]\nfor(n of x, { _ += n }, 0)");
  EXPECT_TRUE(unit.ok());
  EXPECT_TRUE(unit.diags.empty());
}

TEST(SyntaxParseErrors, MissingCloseParenAfterArguments)
{
  const auto f = expect_failure("add(1, 2");
  EXPECT_EQ(f.message, "Expected ')' after arguments");
  EXPECT_EQ(f.code, xmas::diag_code::k_syntax_error);
}

TEST(SyntaxParseErrors, MissingCloseParenAfterGroup)
{
  const auto f = expect_failure("x = (1 + 2");
  EXPECT_EQ(f.message, "Expected ')' after expression");
}

TEST(SyntaxParseErrors, UnexpectedEndOfInput)
{
  const auto f = expect_failure("x = ");
  EXPECT_EQ(f.message, "Unexpected end of input");
}

TEST(SyntaxParseErrors, UnexpectedToken)
{
  const auto f = expect_failure("x = )");
  EXPECT_EQ(f.message, "Unexpected token: ')'");
  EXPECT_EQ(f.at, ")");
}

TEST(SyntaxParseErrors, ForRequiresOf)
{
  const auto f = expect_failure("for(n in arr, x)");
  EXPECT_EQ(f.message, "Expected 'of' after variable name");
  EXPECT_EQ(f.at, "in");
}

TEST(SyntaxParseErrors, ForRequiresVariable)
{
  const auto f = expect_failure("for(1 of arr, x)");
  EXPECT_EQ(f.message, "Expected variable name after 'for'");
}

TEST(SyntaxParseErrors, BuiltinRequiresParen)
{
  const auto f = expect_failure("len x");
  EXPECT_EQ(f.message, "Expected '(' after 'len'");
}

TEST(SyntaxParseErrors, BuiltinCloseParenMessages)
{
  EXPECT_EQ(expect_failure("if(a, b").message, "Expected ')' after if expression");
  EXPECT_EQ(expect_failure("len(a b)").message, "Expected ')' after len argument");
  EXPECT_EQ(expect_failure("for(n of a, b").message, "Expected ')' after for expression");
}

TEST(SyntaxParseErrors, UnclosedArray)
{
  const auto f = expect_failure("[1, 2");
  EXPECT_EQ(f.message, "Expected ']' after array elements");
}

TEST(SyntaxParseErrors, MalformedRangeIsReportedAsArray)
{
  const auto f = expect_failure("[1..]");
  EXPECT_EQ(f.message, "Expected ']' after array elements");
  EXPECT_EQ(f.at, "..");
}

TEST(SyntaxParseErrors, UnclosedIndex)
{
  const auto f = expect_failure("a[1");
  EXPECT_EQ(f.message, "Expected ']' after index");
}

TEST(SyntaxParseErrors, UnclosedBlock)
{
  const auto f = expect_failure("{ x = 1");
  EXPECT_EQ(f.message, "Expected '}' after block");
}

TEST(SyntaxParseErrors, UnclosedBlockPointsAtItsOpeningBrace)
{
  auto unit = xmas::test_support::parse("y = {\n  x = 1\n");
  ASSERT_EQ(unit.diags.size(), 1U);

  const auto & labels = unit.diags.all().front().labels;
  ASSERT_EQ(labels.size(), 2U);
  EXPECT_EQ(labels[0].style, xmas::LabelStyle::Primary);
  EXPECT_EQ(labels[1].style, xmas::LabelStyle::Secondary);
  EXPECT_EQ(labels[1].message, "block opened here");
  EXPECT_EQ(unit.slice(labels[1].range), "{");
}

TEST(SyntaxParseErrors, MethodCallShape)
{
  EXPECT_EQ(expect_failure("x.1").message, "Expected method name after '.'");
  EXPECT_EQ(expect_failure("x.rows").message, "Expected '(' after method name");
}

TEST(SyntaxParseErrors, LoneAmpersandIsAnUnexpectedCharacter)
{
  auto unit = xmas::test_support::parse("a = 1 & 2");
  ASSERT_EQ(unit.program, nullptr);
  ASSERT_EQ(unit.diags.size(), 1U);

  const auto & d = unit.diags.all().front();
  EXPECT_EQ(d.message, "unexpected character '&'");
  EXPECT_EQ(d.code, xmas::diag_code::k_unexpected_character);
  ASSERT_TRUE(d.help_message.has_value());
  EXPECT_EQ(*d.help_message, "use '&&' for logical and");
  EXPECT_EQ(unit.slice(d.primary_range()), "&");
}

TEST(SyntaxParseErrors, OnlyTheFirstErrorIsReported)
{
  auto unit = xmas::test_support::parse("x = )\ny = ]");
  EXPECT_EQ(unit.program, nullptr);
  EXPECT_EQ(unit.diags.size(), 1U);
}
