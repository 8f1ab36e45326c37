/**
 * @file command_line_parser.cpp
 * @brief Command-line argument parser implementation
 */

#include "app/command_line_parser.h"

#include <charconv>
#include <iostream>
#include <system_error>

#include "version.h"

namespace pagedtable::app {

namespace {

/**
 * @brief Check if argument matches short or long option
 * @param arg Command-line argument
 * @param short_opt Short option (e.g., "-c")
 * @param long_opt Long option (e.g., "--config")
 * @return True if argument matches either option
 */
bool MatchesOption(const std::string& arg, const char* short_opt, const char* long_opt) {
  return arg == short_opt || arg == long_opt;
}

Expected<int, Error> ParseRowCount(const std::string& text) {
  int value = 0;
  const char* first = text.data();
  const char* last = text.data() + text.size();
  auto [ptr, ec] = std::from_chars(first, last, value);
  if (text.empty() || ec != std::errc() || ptr != last || value < 0) {
    return utils::MakeUnexpected(
        utils::MakeError(utils::ErrorCode::kInvalidArgument, "--rows expects a non-negative integer, got: " + text));
  }
  return value;
}

}  // namespace

// NOLINTNEXTLINE(cppcoreguidelines-avoid-c-arrays,modernize-avoid-c-arrays) - Standard C/C++ main signature
Expected<CommandLineArgs, Error> CommandLineParser::Parse(int argc, char* argv[]) {
  // NOLINTBEGIN(cppcoreguidelines-pro-bounds-pointer-arithmetic)
  CommandLineArgs args;

  if (argc < 1) {
    return utils::MakeUnexpected(
        utils::MakeError(utils::ErrorCode::kInvalidArgument, "Invalid argument count (argc < 1)"));
  }

  // Handle help and version flags first (early exit)
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (MatchesOption(arg, "-h", "--help")) {
      args.show_help = true;
      return args;
    }
    if (MatchesOption(arg, "-v", "--version")) {
      args.show_version = true;
      return args;
    }
  }

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];

    if (MatchesOption(arg, "-c", "--config")) {
      if (i + 1 >= argc) {
        return utils::MakeUnexpected(
            utils::MakeError(utils::ErrorCode::kInvalidArgument, "--config requires a file path argument"));
      }
      args.config_file = argv[++i];
    } else if (MatchesOption(arg, "-n", "--rows")) {
      if (i + 1 >= argc) {
        return utils::MakeUnexpected(
            utils::MakeError(utils::ErrorCode::kInvalidArgument, "--rows requires a count argument"));
      }
      auto count = ParseRowCount(argv[++i]);
      if (!count) {
        return utils::MakeUnexpected(count.error());
      }
      args.row_count = *count;
    } else if (MatchesOption(arg, "-t", "--config-test")) {
      args.config_test_mode = true;
    } else if (arg[0] == '-') {
      return utils::MakeUnexpected(utils::MakeError(utils::ErrorCode::kInvalidArgument, "Unknown option: " + arg));
    } else {
      // Positional argument: config file without -c flag
      if (args.config_file.empty()) {
        args.config_file = arg;
      } else {
        return utils::MakeUnexpected(
            utils::MakeError(utils::ErrorCode::kInvalidArgument,
                             "Unexpected positional argument: " + arg + " (config file already specified)"));
      }
    }
  }

  if (args.config_test_mode && args.config_file.empty()) {
    return utils::MakeUnexpected(
        utils::MakeError(utils::ErrorCode::kInvalidArgument, "--config-test requires a configuration file"));
  }

  // NOLINTEND(cppcoreguidelines-pro-bounds-pointer-arithmetic)
  return args;
}

void CommandLineParser::PrintHelp(const char* program_name) {
  std::cout << "Usage: " << program_name << " [OPTIONS] [config.yaml|config.json]\n";
  std::cout << "\n";
  std::cout << "Options:\n";
  std::cout << "  -c, --config <file>            Configuration file path\n";
  std::cout << "  -n, --rows <count>             Number of sample rows (default: " << CommandLineArgs::kDefaultRowCount
            << ")\n";
  std::cout << "  -t, --config-test              Test configuration file and exit\n";
  std::cout << "  -h, --help                     Show this help message\n";
  std::cout << "  -v, --version                  Show version information\n";
  std::cout << "\n";
  std::cout << "Configuration file format (auto-detected):\n";
  std::cout << "  - YAML (.yaml, .yml)\n";
  std::cout << "  - JSON (.json)\n";
  std::cout << "Without a configuration file the built-in defaults are used.\n";
}

void CommandLineParser::PrintVersion() {
  std::cout << Version::FullString() << "\n";
}

}  // namespace pagedtable::app
