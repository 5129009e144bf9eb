// test_environment.cpp - Input grid and scope guards
//
#include <gtest/gtest.h>

#include <string>

#include "xmas/runtime/environment.hpp"

namespace xmas
{

TEST(RuntimeEnvironment, InputGridSplitsLinesIntoCharacters)
{
  const Value grid = make_input_grid("L50\r\nR25\n");
  ASSERT_TRUE(grid.is_grid());

  const auto & rows = grid.as_grid();
  ASSERT_EQ(rows.size(), 2U);
  ASSERT_EQ(rows[0].size(), 3U);
  EXPECT_EQ(rows[0][0], Value::make_string("L"));
  EXPECT_EQ(rows[0][2], Value::make_string("0"));
  EXPECT_EQ(rows[1][0], Value::make_string("R"));
}

TEST(RuntimeEnvironment, InputGridKeepsMultiByteCharactersWhole)
{
  const Value grid = make_input_grid("\u00e9\u20ac1\n");
  const auto & rows = grid.as_grid();
  ASSERT_EQ(rows.size(), 1U);
  ASSERT_EQ(rows[0].size(), 3U);
  EXPECT_EQ(rows[0][0], Value::make_string("\u00e9"));
  EXPECT_EQ(rows[0][1], Value::make_string("\u20ac"));
  EXPECT_EQ(rows[0][2], Value::make_string("1"));
}

TEST(RuntimeEnvironment, EmptyInputIsAnEmptyGrid)
{
  const Value grid = make_input_grid("");
  ASSERT_TRUE(grid.is_grid());
  EXPECT_TRUE(grid.as_grid().empty());

  Environment env;
  EXPECT_TRUE(env.input().is_grid());
  EXPECT_TRUE(env.input().as_grid().empty());
}

TEST(RuntimeEnvironment, BlankLinesAreKept)
{
  const Value grid = make_input_grid("a\n\nb");
  ASSERT_EQ(grid.as_grid().size(), 3U);
  EXPECT_TRUE(grid.as_grid()[1].empty());
}

TEST(RuntimeEnvironment, ReturnScopeSavesAndClears)
{
  Environment env;
  env.set_return_value(Value::make_number(1));
  env.set_named_return("acc", Value::make_number(2));

  {
    const ReturnScope scope(env);
    EXPECT_FALSE(env.return_value().has_value());
    EXPECT_EQ(env.named_return("acc"), nullptr);

    env.set_return_value(Value::make_number(10));
    env.set_named_return("other", Value::make_number(20));
  }

  ASSERT_TRUE(env.return_value().has_value());
  EXPECT_EQ(*env.return_value(), Value::make_number(1));
  ASSERT_NE(env.named_return("acc"), nullptr);
  EXPECT_EQ(*env.named_return("acc"), Value::make_number(2));
  EXPECT_EQ(env.named_return("other"), nullptr);
}

TEST(RuntimeEnvironment, BindingScopeRestoresPreviousValues)
{
  Environment env;
  env.assign("x", Value::make_number(1));

  {
    BindingScope scope(env);
    scope.bind("x", Value::make_number(5));
    scope.bind("y", Value::make_number(6));
    EXPECT_EQ(*env.lookup("x"), Value::make_number(5));
    EXPECT_EQ(*env.lookup("y"), Value::make_number(6));

    // Writes through the binding are discarded too.
    env.assign("x", Value::make_number(7));
  }

  ASSERT_NE(env.lookup("x"), nullptr);
  EXPECT_EQ(*env.lookup("x"), Value::make_number(1));
  EXPECT_EQ(env.lookup("y"), nullptr);
}

TEST(RuntimeEnvironment, BindingSameNameTwiceRestoresOriginal)
{
  Environment env;
  {
    BindingScope scope(env);
    scope.bind("a", Value::make_number(1));
    scope.bind("a", Value::make_number(2));
    EXPECT_EQ(*env.lookup("a"), Value::make_number(2));
  }
  EXPECT_EQ(env.lookup("a"), nullptr);
}

}  // namespace xmas
