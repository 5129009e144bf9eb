// xmas/project/project_config.cpp - Project configuration implementation
//
#include "xmas/project/project_config.hpp"

#include <yaml-cpp/yaml.h>

#include <system_error>

namespace xmas
{

std::optional<ColorMode> parse_color_mode(std::string_view text)
{
  if (text == "auto") return ColorMode::Auto;
  if (text == "always") return ColorMode::Always;
  if (text == "never") return ColorMode::Never;
  return std::nullopt;
}

namespace
{

/// Parse the `run` section into `run`; returns an error message on failure.
std::optional<std::string> parse_run_section(
  const YAML::Node & node, const std::filesystem::path & root, RunConfig & run)
{
  if (!node.IsMap()) {
    return std::string("'run' must be a map");
  }

  if (node["debug"]) {
    run.debug = node["debug"].as<bool>();
  }

  if (node["color"]) {
    const auto text = node["color"].as<std::string>();
    const auto mode = parse_color_mode(text);
    if (!mode) {
      return "invalid run.color: '" + text + "' (must be 'auto', 'always' or 'never')";
    }
    run.color = *mode;
  }

  if (node["input"]) {
    std::filesystem::path input = node["input"].as<std::string>();
    run.input = input.is_absolute() ? input : root / input;
  }

  return std::nullopt;
}

}  // namespace

ConfigLoadResult load_project_config(const std::filesystem::path & config_path)
{
  namespace fs = std::filesystem;

  std::error_code ec;
  if (!fs::exists(config_path, ec)) {
    return ConfigLoadResult::fail("configuration file not found: " + config_path.string());
  }

  ProjectConfig config;
  config.project_root = fs::absolute(config_path, ec).parent_path();

  try {
    const YAML::Node root = YAML::LoadFile(config_path.string());

    // An empty file is a valid configuration with all defaults.
    if (root.IsNull()) {
      return ConfigLoadResult::ok(std::move(config));
    }
    if (!root.IsMap()) {
      return ConfigLoadResult::fail("configuration root must be a map");
    }

    if (root["run"]) {
      if (auto error = parse_run_section(root["run"], config.project_root, config.run)) {
        return ConfigLoadResult::fail(std::move(*error));
      }
    }
  } catch (const YAML::ParserException & e) {
    return ConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("invalid configuration: " + std::string(e.what()));
  }

  return ConfigLoadResult::ok(std::move(config));
}

std::optional<std::filesystem::path> find_project_config(const std::filesystem::path & start_dir)
{
  namespace fs = std::filesystem;

  std::error_code ec;
  fs::path current = fs::absolute(start_dir, ec);
  if (ec) {
    return std::nullopt;
  }

  if (fs::is_regular_file(current, ec)) {
    current = current.parent_path();
  }

  while (true) {
    fs::path candidate = current / k_project_config_file_name;
    if (fs::exists(candidate, ec)) {
      return candidate;
    }

    const fs::path parent = current.parent_path();
    if (parent == current) {
      break;
    }
    current = parent;
  }

  return std::nullopt;
}

}  // namespace xmas
