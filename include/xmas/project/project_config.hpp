// xmas/project/project_config.hpp - Project configuration (xmas.yaml)
//
// Parses and validates xmas.yaml files. Command-line flags take precedence
// over every value loaded here.
//
#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace xmas
{

// ============================================================================
// Configuration Structures
// ============================================================================

/// When diagnostics are coloured.
enum class ColorMode {
  Auto,    ///< only if stderr is a terminal
  Always,
  Never,
};

[[nodiscard]] std::optional<ColorMode> parse_color_mode(std::string_view text);

/**
 * The `run` section.
 */
struct RunConfig
{
  /// Default for `-d/--debug`
  bool debug = false;

  ColorMode color = ColorMode::Auto;

  /// Default input file, already resolved against the project root
  std::optional<std::filesystem::path> input;
};

/**
 * Complete project configuration (xmas.yaml).
 */
struct ProjectConfig
{
  RunConfig run;

  /// Directory containing xmas.yaml (for resolving relative paths)
  std::filesystem::path project_root;
};

// ============================================================================
// Configuration Loading Result
// ============================================================================

struct ConfigLoadResult
{
  /// Loaded configuration (only valid if success == true)
  ProjectConfig config;

  bool success = false;

  /// Error message if loading failed
  std::string error;

  static ConfigLoadResult ok(ProjectConfig cfg)
  {
    ConfigLoadResult r;
    r.config = std::move(cfg);
    r.success = true;
    return r;
  }

  static ConfigLoadResult fail(std::string msg)
  {
    ConfigLoadResult r;
    r.error = std::move(msg);
    r.success = false;
    return r;
  }
};

// ============================================================================
// Configuration Loading API
// ============================================================================

/**
 * Load a project configuration from an xmas.yaml file.
 *
 * Never throws: YAML syntax errors, values of the wrong type and unknown
 * `color` choices are all reported through ConfigLoadResult::fail.
 */
[[nodiscard]] ConfigLoadResult load_project_config(const std::filesystem::path & config_path);

/**
 * Search for xmas.yaml from start_dir (or its parent, if it is a file)
 * upward to the filesystem root.
 */
[[nodiscard]] std::optional<std::filesystem::path> find_project_config(
  const std::filesystem::path & start_dir);

inline constexpr const char * k_project_config_file_name = "xmas.yaml";

}  // namespace xmas
