// hh_outline/project/outline_config.hpp - Tool configuration (hh_outline.yaml)
//
// Optional defaults for the command-line tool. Every setting can be
// overridden by a flag.
//
#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace hh_outline
{

enum class OutputFormat : uint8_t {
  Json,    ///< structured tree
  Legacy,  ///< flat list for the legacy outline command
  Text,    ///< indented debug dump
};

enum class ColorMode : uint8_t { Auto, Always, Never };

struct OutputConfig
{
  OutputFormat format = OutputFormat::Json;

  /// JSON indentation; -1 writes compact JSON
  int indent = -1;

  /// Colors in diagnostics
  ColorMode color = ColorMode::Auto;
};

/**
 * Complete tool configuration.
 */
struct OutlineConfig
{
  OutputConfig output;

  /// Directory containing hh_outline.yaml (empty for defaults)
  std::filesystem::path config_root;
};

/**
 * Result of loading a configuration file.
 */
struct ConfigLoadResult
{
  /// Loaded configuration (only valid if success == true)
  OutlineConfig config;

  bool success = false;

  /// Error message if loading failed
  std::string error;

  static ConfigLoadResult ok(OutlineConfig cfg)
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

[[nodiscard]] std::optional<OutputFormat> parse_output_format(std::string_view text) noexcept;
[[nodiscard]] std::optional<ColorMode> parse_color_mode(std::string_view text) noexcept;

/**
 * Load configuration from an hh_outline.yaml file.
 *
 * @return ConfigLoadResult with the loaded config or error message
 */
[[nodiscard]] ConfigLoadResult load_outline_config(const std::filesystem::path & config_path);

/// Load configuration from YAML text. Relative settings resolve against `root`.
[[nodiscard]] ConfigLoadResult load_outline_config_from_string(
  const std::string & yaml_text, const std::filesystem::path & root = {});

/**
 * Search for hh_outline.yaml from start_dir upward to the filesystem root.
 * A regular file as start_dir starts the search in its directory.
 */
[[nodiscard]] std::optional<std::filesystem::path> find_outline_config(
  const std::filesystem::path & start_dir);

inline constexpr const char * k_outline_config_file_name = "hh_outline.yaml";

}  // namespace hh_outline
