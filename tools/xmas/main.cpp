// xmas - Command line interpreter for xmas scripts
//
// Usage:
//   xmas [script.xmas] [-i input.txt] [-d] [--dump-ast] [--color | --no-color]
//
// The script is read from stdin when no path is given.
//
#include <filesystem>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>

#ifdef _WIN32
#include <io.h>
#define isatty _isatty
#define fileno _fileno
#else
#include <unistd.h>
#endif

#include "xmas/ast/ast_context.hpp"
#include "xmas/ast/json_visitor.hpp"
#include "xmas/basic/diagnostic_printer.hpp"
#include "xmas/driver/runner.hpp"
#include "xmas/project/project_config.hpp"
#include "xmas/syntax/frontend.hpp"

namespace fs = std::filesystem;

namespace
{

// ============================================================================
// Output Formatting
// ============================================================================

void print_usage(const char * program_name)
{
  std::cerr << "xmas v0.1.0\n\n"
            << "Usage: " << program_name << " [script.xmas] [options]\n\n"
            << "Reads the script from stdin if no path is given.\n\n"
            << "Options:\n"
            << "  -i, --input <path>       File bound to `input` as a 2D character grid\n"
            << "  -d, --debug              Trace assignments, branches and loops to stderr\n"
            << "  --dump-ast               Print the parsed AST as JSON and exit\n"
            << "  --color                  Always colour diagnostics\n"
            << "  --no-color               Never colour diagnostics\n"
            << "  -h, --help               Show this help message\n";
}

bool resolve_color(xmas::ColorMode mode)
{
  switch (mode) {
    case xmas::ColorMode::Always:
      return true;
    case xmas::ColorMode::Never:
      return false;
    case xmas::ColorMode::Auto:
      break;
  }
  return isatty(fileno(stderr)) != 0;
}

void print_diagnostics(
  const xmas::DiagnosticBag & diagnostics, const xmas::SourceManager & source, bool use_color)
{
  xmas::DiagnosticPrinter printer(std::cerr, use_color);
  printer.print_all(diagnostics, source);
}

// ============================================================================
// Argument Parsing
// ============================================================================

struct CommandArgs
{
  std::optional<std::string> script_file;
  std::optional<std::string> input_file;
  std::optional<xmas::ColorMode> color;
  bool debug = false;
  bool dump_ast = false;
  bool show_help = false;
  std::string error;
};

CommandArgs parse_args(int argc, char * argv[])
{
  CommandArgs args;
  bool seen_script = false;

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];

    if (arg == "-i" || arg == "--input") {
      if (i + 1 >= argc) {
        args.error = "missing path after '" + arg + "'";
        return args;
      }
      args.input_file = argv[++i];
    } else if (arg == "-d" || arg == "--debug") {
      args.debug = true;
    } else if (arg == "--dump-ast") {
      args.dump_ast = true;
    } else if (arg == "--color") {
      args.color = xmas::ColorMode::Always;
    } else if (arg == "--no-color") {
      args.color = xmas::ColorMode::Never;
    } else if (arg == "-h" || arg == "--help") {
      args.show_help = true;
    } else if (arg[0] == '-' && arg != "-") {
      args.error = "unknown option '" + arg + "'";
      return args;
    } else if (!seen_script) {
      // The first positional argument names the script; "-" means stdin.
      seen_script = true;
      if (arg != "-") {
        args.script_file = arg;
      }
    } else {
      args.error = "unexpected argument '" + arg + "'";
      return args;
    }
  }

  return args;
}

// ============================================================================
// Configuration
// ============================================================================

std::optional<fs::path> locate_config(const CommandArgs & args)
{
  std::error_code ec;
  const fs::path cwd = fs::current_path(ec);

  if (args.script_file) {
    if (auto found = xmas::find_project_config(fs::path(*args.script_file).parent_path())) {
      return found;
    }
  }
  if (ec) {
    return std::nullopt;
  }
  return xmas::find_project_config(cwd);
}

// ============================================================================
// Commands
// ============================================================================

int cmd_dump_ast(const std::string & name, const std::string & text, bool use_color)
{
  xmas::SourceManager source(name, text);
  xmas::AstContext ast;
  xmas::DiagnosticBag diags;

  const auto * program = xmas::parse_source(source.get_source(), ast, diags);
  if (!program) {
    print_diagnostics(diags, source, use_color);
    return 1;
  }

  std::cout << xmas::to_json(program).dump(2) << "\n";
  return 0;
}

int cmd_run(
  const std::string & name, std::string text, const xmas::RunOptions & options, bool use_color)
{
  const auto result = xmas::Runner::run_source(name, std::move(text), options);

  if (!result.diagnostics.empty()) {
    print_diagnostics(result.diagnostics, result.source, use_color);
  }
  if (!result.success) {
    return 1;
  }

  const xmas::Value & value = *result.value;
  if (!(value.is_array() && value.as_array().empty())) {
    std::cout << xmas::format_value(value) << "\n";
  }
  return 0;
}

}  // namespace

int main(int argc, char * argv[])
{
  const CommandArgs args = parse_args(argc, argv);

  if (args.show_help) {
    print_usage(argv[0]);
    return 0;
  }
  if (!args.error.empty()) {
    std::cerr << "error: " << args.error << "\n";
    print_usage(argv[0]);
    return 1;
  }

  xmas::ProjectConfig config;
  if (auto config_path = locate_config(args)) {
    auto loaded = xmas::load_project_config(*config_path);
    if (!loaded.success) {
      std::cerr << "error: " << config_path->string() << ": " << loaded.error << "\n";
      return 1;
    }
    config = std::move(loaded.config);
  }

  const bool use_color = resolve_color(args.color.value_or(config.run.color));

  // Read the script
  std::string name;
  std::string text;
  if (args.script_file) {
    name = *args.script_file;
    std::string error;
    auto contents = xmas::read_file(name, error);
    if (!contents) {
      std::cerr << "error: could not read script '" << name << "': " << error << "\n";
      return 1;
    }
    text = std::move(*contents);
  } else {
    std::ostringstream ss;
    ss << std::cin.rdbuf();
    text = ss.str();
  }

  if (args.dump_ast) {
    return cmd_dump_ast(name, text, use_color);
  }

  xmas::RunOptions options;
  options.debug = args.debug || config.run.debug;
  if (args.input_file) {
    options.input_path = fs::path(*args.input_file);
  } else if (config.run.input) {
    options.input_path = config.run.input;
  }

  return cmd_run(name, std::move(text), options, use_color);
}
