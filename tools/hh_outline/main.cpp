// hh_outline - Hack file outline command line interface
//
// Usage:
//   hh_outline outline [--json | --legacy | --print] <file.php | ->
//   hh_outline check <file.php | ->
//
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
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

#include "hh_outline/basic/diagnostic_printer.hpp"
#include "hh_outline/outline/legacy.hpp"
#include "hh_outline/outline/outline_builder.hpp"
#include "hh_outline/outline/outline_json.hpp"
#include "hh_outline/outline/outline_printer.hpp"
#include "hh_outline/project/outline_config.hpp"
#include "hh_outline/syntax/frontend.hpp"

#include "command_args.hpp"

namespace fs = std::filesystem;

using hh_outline::cli::CommandArgs;
using hh_outline::cli::parse_args;

namespace
{

void print_usage(const char * program_name)
{
  std::cerr << "hh_outline v0.1.0\n\n"
            << "Usage: " << program_name << " <command> [options] <file | ->\n\n"
            << "Commands:\n"
            << "  outline                  Print the declaration outline of a file\n"
            << "  check                    Report syntax errors\n\n"
            << "Options:\n"
            << "  --json                   Structured outline (default)\n"
            << "  --legacy                 Flat list of functions, classes and methods\n"
            << "  --print                  Indented text dump\n"
            << "  --indent <n>             JSON indentation (-1 for compact)\n"
            << "  --color <when>           Diagnostic colors: auto, always, never\n"
            << "  --config <path>          Use this hh_outline.yaml\n"
            << "  -v, --verbose            Verbose output\n"
            << "  -h, --help               Show this help message\n\n"
            << "Reads standard input when the file is '-'.\n";
}

// ============================================================================
// Input and configuration
// ============================================================================

bool read_input(const std::string & input_file, std::string & content)
{
  if (input_file == "-") {
    content.assign(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
    return true;
  }

  std::ifstream file(input_file, std::ios::binary);
  if (!file.is_open()) {
    std::cerr << "error: failed to open file: " << input_file << "\n";
    return false;
  }
  std::stringstream buffer;
  buffer << file.rdbuf();
  content = buffer.str();
  return true;
}

/// Load hh_outline.yaml (explicit path, or searched upward) and apply flags.
bool resolve_config(const CommandArgs & args, hh_outline::OutlineConfig & config)
{
  std::optional<fs::path> config_path;
  if (!args.config_path.empty()) {
    config_path = fs::path(args.config_path);
  } else {
    const fs::path start =
      (args.input_file == "-") ? fs::current_path() : fs::absolute(args.input_file);
    config_path = hh_outline::find_outline_config(start);
  }

  if (config_path) {
    const auto result = hh_outline::load_outline_config(*config_path);
    if (!result.success) {
      std::cerr << "error: " << result.error << "\n";
      return false;
    }
    if (args.verbose) {
      std::cerr << "Using configuration: " << config_path->string() << "\n";
    }
    config = result.config;
  }

  if (args.format) config.output.format = *args.format;
  if (args.indent) config.output.indent = *args.indent;
  if (args.color) config.output.color = *args.color;
  return true;
}

bool use_color(hh_outline::ColorMode mode)
{
  switch (mode) {
    case hh_outline::ColorMode::Always:
      return true;
    case hh_outline::ColorMode::Never:
      return false;
    case hh_outline::ColorMode::Auto:
      break;
  }
  return isatty(fileno(stderr)) != 0;
}

/// Filename reported in positions; empty for standard input.
std::string display_path(const CommandArgs & args)
{
  return args.input_file == "-" ? std::string() : args.input_file;
}

// ============================================================================
// Commands
// ============================================================================

int cmd_outline(const CommandArgs & args, const hh_outline::OutlineConfig & config)
{
  std::string content;
  if (!read_input(args.input_file, content)) {
    return 1;
  }

  if (args.verbose) {
    std::cerr << "Outlining: " << (args.input_file == "-" ? "<stdin>" : args.input_file) << "\n";
  }

  const hh_outline::Outline outline = hh_outline::outline(std::move(content), display_path(args));

  switch (config.output.format) {
    case hh_outline::OutputFormat::Json:
      std::cout << hh_outline::to_json(outline).dump(config.output.indent) << "\n";
      break;
    case hh_outline::OutputFormat::Legacy:
      std::cout << hh_outline::to_json_legacy(hh_outline::to_legacy(outline))
                     .dump(config.output.indent)
                << "\n";
      break;
    case hh_outline::OutputFormat::Text:
      hh_outline::print(std::cout, outline);
      break;
  }

  if (args.verbose) {
    std::cerr << "Top-level declarations: " << outline.size() << "\n";
  }
  return 0;
}

int cmd_check(const CommandArgs & args, const hh_outline::OutlineConfig & config)
{
  std::string content;
  if (!read_input(args.input_file, content)) {
    return 1;
  }

  if (args.verbose) {
    std::cerr << "Checking: " << (args.input_file == "-" ? "<stdin>" : args.input_file) << "\n";
  }

  const auto parsed = hh_outline::parse_file(std::move(content), display_path(args));

  if (!parsed->diags.empty()) {
    hh_outline::DiagnosticPrinter printer(std::cerr, use_color(config.output.color));
    printer.print_all(parsed->diags, parsed->source);
  }

  if (parsed->diags.has_errors()) {
    std::cerr << "error: " << parsed->diags.error_count() << " syntax error(s)\n";
    return 1;
  }

  std::cout << (args.input_file == "-" ? "<stdin>" : args.input_file) << ": OK\n";
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
    return 1;
  }

  if (args.command != "outline" && args.command != "check") {
    std::cerr << "error: unknown command '" << args.command << "'\n";
    print_usage(argv[0]);
    return 1;
  }

  if (args.input_file.empty()) {
    std::cerr << "error: input file required (use '-' for standard input)\n";
    return 1;
  }

  if (args.input_file != "-" && !fs::exists(args.input_file)) {
    std::cerr << "error: file not found: " << args.input_file << "\n";
    return 1;
  }

  hh_outline::OutlineConfig config;
  if (!resolve_config(args, config)) {
    return 1;
  }

  if (args.command == "outline") {
    return cmd_outline(args, config);
  }
  return cmd_check(args, config);
}
