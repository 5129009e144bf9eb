// xmas/driver/runner.hpp - Script runner
//
// Single entry point for the parse / interpret pipeline.
// Used by the CLI and by the driver tests.
//
#pragma once

#include <filesystem>
#include <iosfwd>
#include <optional>
#include <string>

#include "xmas/basic/diagnostic.hpp"
#include "xmas/basic/source_manager.hpp"
#include "xmas/runtime/value.hpp"

namespace xmas
{

// ============================================================================
// Run Options
// ============================================================================

struct RunOptions
{
  /// File providing the `input` grid
  std::optional<std::filesystem::path> input_path;

  /// Input text used instead of reading input_path
  std::optional<std::string> input_text;

  /// Emit the `DEBUG:` trace
  bool debug = false;

  /// Trace destination (std::cerr if null)
  std::ostream * trace_stream = nullptr;
};

// ============================================================================
// Run Result
// ============================================================================

struct RunResult
{
  /// Whether the script parsed and ran without errors
  bool success = false;

  /// Final program value (only set if success == true)
  std::optional<Value> value;

  /// Syntax errors, the runtime error if any, and input warnings
  DiagnosticBag diagnostics;

  /// The script, for rendering diagnostics
  SourceManager source;

  [[nodiscard]] bool has_warnings() const { return !diagnostics.warnings().empty(); }
};

// ============================================================================
// Runner
// ============================================================================

class Runner
{
public:
  /**
   * Parse and run a script held in memory.
   *
   * @param name Display path of the script (empty for stdin)
   * @param text Script source
   * @param options Input and trace options
   */
  [[nodiscard]] static RunResult run_source(
    const std::filesystem::path & name, std::string text, const RunOptions & options);

  /// Read `path` and run it. An unreadable script is reported as an error.
  [[nodiscard]] static RunResult run_file(
    const std::filesystem::path & path, const RunOptions & options);

private:
  /// Build the `input` grid, reporting W0001 if the file cannot be read.
  static Value load_input(const RunOptions & options, DiagnosticBag & diags);
};

/// Read a whole file; the error message is set on failure.
[[nodiscard]] std::optional<std::string> read_file(
  const std::filesystem::path & path, std::string & error);

}  // namespace xmas
