// hh_outline/project/outline_config.cpp - Tool configuration loading
//
#include "hh_outline/project/outline_config.hpp"

#include <yaml-cpp/yaml.h>

#include <utility>

namespace hh_outline
{

namespace
{

ConfigLoadResult parse_config(const YAML::Node & root, const std::filesystem::path & config_root)
{
  OutlineConfig config;
  config.config_root = config_root;

  if (!root || root.IsNull()) {
    return ConfigLoadResult::ok(std::move(config));
  }
  if (!root.IsMap()) {
    return ConfigLoadResult::fail("configuration root must be a map");
  }

  // 'output' section
  if (root["output"]) {
    const auto & out = root["output"];
    if (!out.IsMap()) {
      return ConfigLoadResult::fail("output must be a map");
    }

    if (out["format"]) {
      const auto text = out["format"].as<std::string>();
      const auto format = parse_output_format(text);
      if (!format) {
        return ConfigLoadResult::fail(
          "invalid output.format: '" + text + "' (must be 'json', 'legacy' or 'text')");
      }
      config.output.format = *format;
    }

    if (out["indent"]) {
      const int indent = out["indent"].as<int>();
      if (indent < -1) {
        return ConfigLoadResult::fail("output.indent must be -1 (compact) or a non-negative number");
      }
      config.output.indent = indent;
    }

    if (out["color"]) {
      const auto text = out["color"].as<std::string>();
      const auto color = parse_color_mode(text);
      if (!color) {
        return ConfigLoadResult::fail(
          "invalid output.color: '" + text + "' (must be 'auto', 'always' or 'never')");
      }
      config.output.color = *color;
    }
  }

  return ConfigLoadResult::ok(std::move(config));
}

ConfigLoadResult parse_config_checked(const YAML::Node & root, const std::filesystem::path & config_root)
{
  try {
    return parse_config(root, config_root);
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("invalid configuration value: " + std::string(e.what()));
  }
}

}  // namespace

std::optional<OutputFormat> parse_output_format(std::string_view text) noexcept
{
  if (text == "json") return OutputFormat::Json;
  if (text == "legacy") return OutputFormat::Legacy;
  if (text == "text") return OutputFormat::Text;
  return std::nullopt;
}

std::optional<ColorMode> parse_color_mode(std::string_view text) noexcept
{
  if (text == "auto") return ColorMode::Auto;
  if (text == "always") return ColorMode::Always;
  if (text == "never") return ColorMode::Never;
  return std::nullopt;
}

ConfigLoadResult load_outline_config(const std::filesystem::path & config_path)
{
  namespace fs = std::filesystem;

  if (!fs::exists(config_path)) {
    return ConfigLoadResult::fail("configuration file not found: " + config_path.string());
  }

  YAML::Node root;
  try {
    root = YAML::LoadFile(config_path.string());
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }

  return parse_config_checked(root, fs::absolute(config_path).parent_path());
}

ConfigLoadResult load_outline_config_from_string(
  const std::string & yaml_text, const std::filesystem::path & root)
{
  YAML::Node node;
  try {
    node = YAML::Load(yaml_text);
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }
  return parse_config_checked(node, root);
}

std::optional<std::filesystem::path> find_outline_config(const std::filesystem::path & start_dir)
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
    const fs::path candidate = current / k_outline_config_file_name;
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

}  // namespace hh_outline
