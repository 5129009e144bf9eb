// test_cli.cpp - CLI integration tests for the xmas executable

#include <gtest/gtest.h>

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

#if defined(__unix__) || defined(__APPLE__)
#include <sys/wait.h>
#endif

namespace fs = std::filesystem;

namespace
{

std::string read_all(const fs::path & p)
{
  std::ifstream in(p);
  std::stringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

void write_all(const fs::path & p, const std::string & s)
{
  std::ofstream out(p);
  ASSERT_TRUE(out.is_open()) << "Failed to open file for writing: " << p.string();
  out << s;
}

fs::path make_temp_dir(std::string_view prefix)
{
  const auto base = fs::temp_directory_path();
  const auto now = std::chrono::steady_clock::now().time_since_epoch().count();
  const fs::path dir = base / (std::string(prefix) + "_" + std::to_string(now));
  fs::create_directories(dir);
  return dir;
}

std::string shell_quote(const std::string & s)
{
  // POSIX shell single-quote escaping.
  std::string out;
  out.reserve(s.size() + 2);
  out.push_back('\'');
  for (char c : s) {
    if (c == '\'') {
      out += "'\\''";
    } else {
      out.push_back(c);
    }
  }
  out.push_back('\'');
  return out;
}

struct CliResult
{
  int status = 0;
  std::string out;
  std::string err;
};

// Runs the CLI inside `dir` with stdout and stderr captured. stdin comes from
// `stdin_file` when given, otherwise from /dev/null.
CliResult run_cli(const fs::path & dir, const std::string & args, const fs::path & stdin_file = {})
{
  CliResult result;
#ifndef XMAS_CLI_PATH
  (void)dir;
  (void)args;
  (void)stdin_file;
#else
  const fs::path out_file = dir / "stdout.txt";
  const fs::path err_file = dir / "stderr.txt";
  const std::string in = stdin_file.empty() ? std::string("/dev/null") : stdin_file.string();

  const std::string cmd = "cd " + shell_quote(dir.string()) + " && " + shell_quote(XMAS_CLI_PATH) +
                          " " + args + " < " + shell_quote(in) + " > " +
                          shell_quote(out_file.string()) + " 2> " + shell_quote(err_file.string());

  const int rc = std::system(cmd.c_str());

#if defined(__unix__) || defined(__APPLE__)
  if (rc == -1) {
    result.status = 127;
  } else if (WIFEXITED(rc)) {
    result.status = WEXITSTATUS(rc);
  } else {
    result.status = 128;
  }
#else
  result.status = rc;
#endif

  result.out = read_all(out_file);
  result.err = read_all(err_file);
#endif
  return result;
}

class CliTest : public ::testing::Test
{
protected:
  void SetUp() override { dir_ = make_temp_dir("xmas_cli"); }

  void TearDown() override
  {
    std::error_code ec;
    fs::remove_all(dir_, ec);
  }

  fs::path dir_;
};

}  // namespace

TEST_F(CliTest, PrintsFinalValue)
{
#ifndef XMAS_CLI_PATH
  GTEST_SKIP() << "XMAS_CLI_PATH is not defined";
#endif
  write_all(dir_ / "sum.xmas", "_ = [1..3]\n");

  const auto r = run_cli(dir_, "sum.xmas");
  EXPECT_EQ(r.status, 0) << r.err;
  EXPECT_EQ(r.out, "[1, 2, 3]\n");
  EXPECT_EQ(r.err, "");
}

TEST_F(CliTest, EmptyArrayResultPrintsNothing)
{
#ifndef XMAS_CLI_PATH
  GTEST_SKIP() << "XMAS_CLI_PATH is not defined";
#endif
  write_all(dir_ / "assign.xmas", "x = 1\n");

  const auto r = run_cli(dir_, "assign.xmas");
  EXPECT_EQ(r.status, 0) << r.err;
  EXPECT_EQ(r.out, "");
}

TEST_F(CliTest, ScriptFromStdin)
{
#ifndef XMAS_CLI_PATH
  GTEST_SKIP() << "XMAS_CLI_PATH is not defined";
#endif
  write_all(dir_ / "piped.xmas", "_ = 6 * 7\n");

  const auto r = run_cli(dir_, "", dir_ / "piped.xmas");
  EXPECT_EQ(r.status, 0) << r.err;
  EXPECT_EQ(r.out, "42\n");

  const auto dash = run_cli(dir_, "-", dir_ / "piped.xmas");
  EXPECT_EQ(dash.status, 0) << dash.err;
  EXPECT_EQ(dash.out, "42\n");
}

TEST_F(CliTest, InputFileBecomesGrid)
{
#ifndef XMAS_CLI_PATH
  GTEST_SKIP() << "XMAS_CLI_PATH is not defined";
#endif
  write_all(dir_ / "solve.xmas", "total = 0\nfor(row of input.rows(), { total += ~row })\n_ = total\n");
  write_all(dir_ / "input.txt", "10\n20\n12\n");

  const auto r = run_cli(dir_, "solve.xmas -i input.txt");
  EXPECT_EQ(r.status, 0) << r.err;
  EXPECT_EQ(r.out, "42\n");

  const auto long_form = run_cli(dir_, "solve.xmas --input input.txt");
  EXPECT_EQ(long_form.out, "42\n");
}

TEST_F(CliTest, ScriptMayFollowOptions)
{
#ifndef XMAS_CLI_PATH
  GTEST_SKIP() << "XMAS_CLI_PATH is not defined";
#endif
  write_all(dir_ / "prog.xmas", "x = 2\n_ = x\n");

  const auto r = run_cli(dir_, "-d prog.xmas");
  EXPECT_EQ(r.status, 0) << r.err;
  EXPECT_EQ(r.out, "2\n");
  EXPECT_NE(r.err.find("DEBUG: x: undefined \xE2\x86\x92 2"), std::string::npos) << r.err;
}

TEST_F(CliTest, DebugTraceGoesToStderr)
{
#ifndef XMAS_CLI_PATH
  GTEST_SKIP() << "XMAS_CLI_PATH is not defined";
#endif
  write_all(dir_ / "prog.xmas", "x = 2\nx *= 3\n_ = x\n");

  const auto quiet = run_cli(dir_, "prog.xmas");
  EXPECT_EQ(quiet.out, "6\n");
  EXPECT_EQ(quiet.err.find("DEBUG:"), std::string::npos) << quiet.err;

  const auto traced = run_cli(dir_, "prog.xmas --debug");
  EXPECT_EQ(traced.status, 0) << traced.err;
  EXPECT_EQ(traced.out, "6\n");
  EXPECT_NE(traced.err.find("DEBUG: x *=: 2 \xE2\x86\x92 6"), std::string::npos) << traced.err;
}

TEST_F(CliTest, SyntaxErrorExitsWithOne)
{
#ifndef XMAS_CLI_PATH
  GTEST_SKIP() << "XMAS_CLI_PATH is not defined";
#endif
  write_all(dir_ / "broken.xmas", "x = 1\ny = (\n");

  const auto r = run_cli(dir_, "broken.xmas --no-color");
  EXPECT_EQ(r.status, 1);
  EXPECT_EQ(r.out, "");
  EXPECT_NE(r.err.find("error[E0001]"), std::string::npos) << r.err;
  EXPECT_NE(r.err.find("--> broken.xmas:"), std::string::npos) << r.err;
}

TEST_F(CliTest, RuntimeErrorExitsWithOne)
{
#ifndef XMAS_CLI_PATH
  GTEST_SKIP() << "XMAS_CLI_PATH is not defined";
#endif
  write_all(dir_ / "divide.xmas", "x = 1\n_ = x / 0\n");

  const auto r = run_cli(dir_, "divide.xmas --no-color");
  EXPECT_EQ(r.status, 1);
  EXPECT_EQ(r.out, "");
  EXPECT_NE(r.err.find("error[E0100]: Division by zero"), std::string::npos) << r.err;
}

TEST_F(CliTest, DumpAstPrintsJson)
{
#ifndef XMAS_CLI_PATH
  GTEST_SKIP() << "XMAS_CLI_PATH is not defined";
#endif
  write_all(dir_ / "prog.xmas", "_ = 1 / 0\n");

  const auto r = run_cli(dir_, "--dump-ast prog.xmas");
  EXPECT_EQ(r.status, 0) << r.err;
  EXPECT_NE(r.out.find("\"type\": \"Program\""), std::string::npos) << r.out;
  EXPECT_NE(r.out.find("\"statements\""), std::string::npos) << r.out;
  EXPECT_EQ(r.err, "");
}

TEST_F(CliTest, BadArgumentsExitWithOne)
{
#ifndef XMAS_CLI_PATH
  GTEST_SKIP() << "XMAS_CLI_PATH is not defined";
#endif
  write_all(dir_ / "a.xmas", "_ = 1\n");

  const auto unknown = run_cli(dir_, "a.xmas --frobnicate");
  EXPECT_EQ(unknown.status, 1);
  EXPECT_NE(unknown.err.find("unknown option '--frobnicate'"), std::string::npos) << unknown.err;

  const auto extra = run_cli(dir_, "a.xmas a.xmas");
  EXPECT_EQ(extra.status, 1);
  EXPECT_NE(extra.err.find("unexpected argument 'a.xmas'"), std::string::npos) << extra.err;

  const auto missing = run_cli(dir_, "a.xmas -i");
  EXPECT_EQ(missing.status, 1);
  EXPECT_NE(missing.err.find("missing path after '-i'"), std::string::npos) << missing.err;
}

TEST_F(CliTest, BrokenConfigExitsWithOne)
{
#ifndef XMAS_CLI_PATH
  GTEST_SKIP() << "XMAS_CLI_PATH is not defined";
#endif
  write_all(dir_ / "xmas.yaml", "run:\n  color: rainbow\n");
  write_all(dir_ / "a.xmas", "_ = 1\n");

  const auto r = run_cli(dir_, "a.xmas");
  EXPECT_EQ(r.status, 1);
  EXPECT_NE(r.err.find("invalid run.color"), std::string::npos) << r.err;
}
