#include "command_args.hpp"

#include <exception>

namespace hh_outline::cli
{

CommandArgs parse_args(int argc, const char * const argv[])
{
  CommandArgs args;

  if (argc < 2) {
    args.show_help = true;
    return args;
  }

  args.command = argv[1];

  if (args.command == "-h" || args.command == "--help") {
    args.show_help = true;
    return args;
  }

  for (int i = 2; i < argc; ++i) {
    const std::string arg = argv[i];

    if (arg == "--json") {
      args.format = OutputFormat::Json;
    } else if (arg == "--legacy") {
      args.format = OutputFormat::Legacy;
    } else if (arg == "--print") {
      args.format = OutputFormat::Text;
    } else if (arg == "--indent") {
      if (i + 1 >= argc) {
        args.error = "--indent requires a value";
        return args;
      }
      try {
        args.indent = std::stoi(argv[++i]);
      } catch (const std::exception &) {
        args.error = std::string("invalid --indent value: ") + argv[i];
        return args;
      }
    } else if (arg == "--color") {
      if (i + 1 >= argc) {
        args.error = "--color requires a value";
        return args;
      }
      args.color = parse_color_mode(argv[++i]);
      if (!args.color) {
        args.error = std::string("invalid --color value: ") + argv[i];
        return args;
      }
    } else if (arg == "--config") {
      if (i + 1 >= argc) {
        args.error = "--config requires a value";
        return args;
      }
      args.config_path = argv[++i];
    } else if (arg == "-v" || arg == "--verbose") {
      args.verbose = true;
    } else if (arg == "-h" || arg == "--help") {
      args.show_help = true;
    } else if ((arg == "-" || arg[0] != '-') && args.input_file.empty()) {
      args.input_file = arg;
    } else {
      args.error = "unexpected argument '" + arg + "'";
      return args;
    }
  }

  return args;
}

}  // namespace hh_outline::cli
