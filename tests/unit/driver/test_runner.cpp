// test_runner.cpp - parse / interpret pipeline
//
#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

#include "xmas/basic/diagnostic.hpp"
#include "xmas/driver/runner.hpp"

namespace fs = std::filesystem;

namespace xmas
{

namespace
{

RunResult run(const std::string & src, RunOptions options = {})
{
  return Runner::run_source("test.xmas", src, options);
}

class RunnerFileTest : public ::testing::Test
{
protected:
  void SetUp() override
  {
    const auto * info = ::testing::UnitTest::GetInstance()->current_test_info();
    dir_ = fs::temp_directory_path() / (std::string("xmas_runner_") + info->name());
    fs::remove_all(dir_);
    fs::create_directories(dir_);
  }

  void TearDown() override
  {
    std::error_code ec;
    fs::remove_all(dir_, ec);
  }

  fs::path write(const std::string & name, const std::string & text)
  {
    const fs::path p = dir_ / name;
    std::ofstream(p) << text;
    return p;
  }

  fs::path dir_;
};

}  // namespace

TEST(DriverRunner, SuccessfulRun)
{
  const auto r = run("_ = [1..3]");
  ASSERT_TRUE(r.success);
  ASSERT_TRUE(r.value.has_value());
  EXPECT_EQ(format_value(*r.value), "[1, 2, 3]");
  EXPECT_TRUE(r.diagnostics.empty());
}

TEST(DriverRunner, SyntaxErrorStopsBeforeRunning)
{
  std::ostringstream trace;
  RunOptions opts;
  opts.debug = true;
  opts.trace_stream = &trace;

  const auto r = run("x = 1\ny = (", opts);
  EXPECT_FALSE(r.success);
  EXPECT_FALSE(r.value.has_value());
  ASSERT_EQ(r.diagnostics.size(), 1U);
  EXPECT_EQ(r.diagnostics.all().front().code, diag_code::k_syntax_error);
  EXPECT_TRUE(trace.str().empty());
}

TEST(DriverRunner, RuntimeErrorBecomesLocatedDiagnostic)
{
  const auto r = run("x = 1\ny = x / 0");
  EXPECT_FALSE(r.success);
  ASSERT_EQ(r.diagnostics.size(), 1U);

  const auto & d = r.diagnostics.all().front();
  EXPECT_EQ(d.severity, Severity::Error);
  EXPECT_EQ(d.code, diag_code::k_runtime_error);
  EXPECT_EQ(d.message, "Division by zero");
  EXPECT_EQ(r.source.get_source_slice(d.primary_range()), "x / 0");
}

TEST(DriverRunner, InputTextBecomesGrid)
{
  RunOptions opts;
  opts.input_text = "ab\ncd\n";
  const auto r = run("_ = len(input)", opts);
  ASSERT_TRUE(r.success);
  EXPECT_EQ(format_value(*r.value), "[2, 2]");
}

TEST(DriverRunner, NoInputIsAnEmptyGrid)
{
  const auto r = run("_ = input.rows()");
  ASSERT_TRUE(r.success);
  EXPECT_EQ(format_value(*r.value), "[]");
}

TEST(DriverRunner, DebugTraceGoesToTheGivenStream)
{
  std::ostringstream trace;
  RunOptions opts;
  opts.debug = true;
  opts.trace_stream = &trace;

  const auto r = run("x = 2\nx *= 3", opts);
  ASSERT_TRUE(r.success);
  EXPECT_EQ(trace.str(), "DEBUG: x: undefined → 2\nDEBUG: x *=: 2 → 6\n");
}

TEST(DriverRunner, NoTraceUnlessDebug)
{
  std::ostringstream trace;
  RunOptions opts;
  opts.trace_stream = &trace;

  const auto r = run("x = 2", opts);
  ASSERT_TRUE(r.success);
  EXPECT_TRUE(trace.str().empty());
}

TEST_F(RunnerFileTest, RunFileWithInputFile)
{
  const auto script = write("solve.xmas", "total = 0\nfor(row of input.rows(), { total += ~row })\n_ = total\n");
  RunOptions opts;
  opts.input_path = write("input.txt", "10\n20\n12\n");

  const auto r = Runner::run_file(script, opts);
  ASSERT_TRUE(r.success);
  EXPECT_EQ(format_value(*r.value), "42");
  EXPECT_FALSE(r.has_warnings());
}

TEST_F(RunnerFileTest, UnreadableInputIsAWarning)
{
  RunOptions opts;
  opts.input_path = dir_ / "missing.txt";

  const auto r = run("_ = len(input)", opts);
  ASSERT_TRUE(r.success);
  EXPECT_EQ(format_value(*r.value), "[0, 0]");
  ASSERT_TRUE(r.has_warnings());

  const auto & w = r.diagnostics.all().front();
  EXPECT_EQ(w.severity, Severity::Warning);
  EXPECT_EQ(w.code, diag_code::k_unreadable_input);
  EXPECT_EQ(w.message.rfind("Could not read input file '", 0), 0U) << w.message;
}

TEST_F(RunnerFileTest, InputTextTakesPrecedenceOverPath)
{
  RunOptions opts;
  opts.input_path = dir_ / "missing.txt";
  opts.input_text = "x";

  const auto r = run("_ = input[0][0]", opts);
  ASSERT_TRUE(r.success);
  EXPECT_EQ(format_value(*r.value), "x");
  EXPECT_FALSE(r.has_warnings());
}

TEST_F(RunnerFileTest, UnreadableScriptIsAnError)
{
  const auto r = Runner::run_file(dir_ / "missing.xmas", {});
  EXPECT_FALSE(r.success);
  ASSERT_EQ(r.diagnostics.size(), 1U);
  EXPECT_EQ(r.diagnostics.all().front().message.rfind("Could not read script '", 0), 0U);
}

TEST_F(RunnerFileTest, DirectoryIsNotAScript)
{
  std::string error;
  EXPECT_FALSE(read_file(dir_, error).has_value());
  EXPECT_EQ(error, "Is a directory");
}

}  // namespace xmas
