// hh_outline - command line argument parsing
#pragma once

#include <optional>
#include <string>

#include "hh_outline/project/outline_config.hpp"

namespace hh_outline::cli
{

struct CommandArgs
{
  std::string command;
  std::string input_file;
  std::string config_path;
  std::optional<OutputFormat> format;
  std::optional<int> indent;
  std::optional<ColorMode> color;
  bool verbose = false;
  bool show_help = false;
  std::string error;  ///< non-empty when the command line is invalid
};

/// Parse `argv[1..]`. Errors are reported through CommandArgs::error.
[[nodiscard]] CommandArgs parse_args(int argc, const char * const argv[]);

}  // namespace hh_outline::cli
