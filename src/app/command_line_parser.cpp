/**
 * @file command_line_parser.cpp
 * @brief Command-line argument parser implementation
 */

#include "app/command_line_parser.h"

#include <charconv>
#include <iostream>

#include "utils/string_utils.h"
#include "version.h"

namespace phonegen::app {

using utils::ErrorCode;
using utils::MakeError;
using utils::MakeUnexpected;

namespace {

bool MatchesOption(const std::string& arg, const char* short_opt, const char* long_opt) {
  return arg == short_opt || arg == long_opt;
}

Expected<void, Error> SetOperation(CommandLineArgs& args, Operation operation, const std::string& arg) {
  if (args.operation != Operation::kNone && args.operation != operation) {
    return MakeUnexpected(MakeError(ErrorCode::kInvalidArgument, "Conflicting operation option: " + arg));
  }
  args.operation = operation;
  return {};
}

}  // namespace

Expected<std::set<int>, Error> CommandLineParser::ParseOperatorList(const std::string& text) {
  std::set<int> codes;
  for (const auto& token : utils::Split(text, ',')) {
    std::string item = utils::Trim(token);
    if (item.empty()) {
      continue;
    }
    int code = 0;
    auto [ptr, ec] = std::from_chars(item.data(), item.data() + item.size(), code);
    if (ec != std::errc() || ptr != item.data() + item.size()) {
      return MakeUnexpected(MakeError(ErrorCode::kInvalidArgument, "Invalid operator code: '" + item + "'"));
    }
    codes.insert(code);
  }
  return codes;
}

// NOLINTNEXTLINE(cppcoreguidelines-avoid-c-arrays,modernize-avoid-c-arrays) - Standard C/C++ main signature
Expected<CommandLineArgs, Error> CommandLineParser::Parse(int argc, char* argv[]) {
  // NOLINTBEGIN(cppcoreguidelines-pro-bounds-pointer-arithmetic)
  CommandLineArgs args;

  if (argc < 1) {
    return MakeUnexpected(MakeError(ErrorCode::kInvalidArgument, "Invalid argument count (argc < 1)"));
  }

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

  if (argc < 2) {
    return MakeUnexpected(MakeError(ErrorCode::kInvalidArgument, "No arguments provided. Use --help for usage."));
  }

  auto require_value = [&](int& index, const std::string& option) -> Expected<std::string, Error> {
    if (index + 1 >= argc) {
      return MakeUnexpected(MakeError(ErrorCode::kInvalidArgument, option + " requires an argument"));
    }
    return std::string(argv[++index]);
  };

  bool has_request_field = false;
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];

    if (MatchesOption(arg, "-t", "--config-test")) {
      args.config_test_mode = true;
      continue;
    }
    if (arg == "--list-provinces") {
      auto set = SetOperation(args, Operation::kListProvinces, arg);
      if (!set) {
        return MakeUnexpected(set.error());
      }
      continue;
    }
    if (arg == "--cleanup") {
      auto set = SetOperation(args, Operation::kCleanup, arg);
      if (!set) {
        return MakeUnexpected(set.error());
      }
      continue;
    }
    if (arg.empty() || arg[0] != '-') {
      return MakeUnexpected(MakeError(ErrorCode::kInvalidArgument, "Unexpected positional argument: " + arg));
    }

    // Remaining options all take a value
    static const char* const kValueOptions[] = {"-c",         "--config",  "-s",       "--schema",   "--prefix",
                                                "--province", "--city",    "--suffix4", "--suffix3", "--operators",
                                                "--list-cities"};
    bool known = false;
    for (const char* option : kValueOptions) {
      if (arg == option) {
        known = true;
        break;
      }
    }
    if (!known) {
      return MakeUnexpected(MakeError(ErrorCode::kInvalidArgument, "Unknown option: " + arg));
    }

    auto value = require_value(i, arg);
    if (!value) {
      return MakeUnexpected(value.error());
    }

    if (MatchesOption(arg, "-c", "--config")) {
      args.config_file = *value;
    } else if (MatchesOption(arg, "-s", "--schema")) {
      args.schema_file = *value;
    } else if (arg == "--list-cities") {
      auto set = SetOperation(args, Operation::kListCities, arg);
      if (!set) {
        return MakeUnexpected(set.error());
      }
      args.list_province = *value;
    } else {
      has_request_field = true;
      if (arg == "--prefix") {
        args.request.prefix = *value;
      } else if (arg == "--province") {
        args.request.province = *value;
      } else if (arg == "--city") {
        args.request.city = *value;
      } else if (arg == "--suffix4") {
        args.request.trailing_fixed4 = *value;
      } else if (arg == "--suffix3") {
        args.request.trailing_fixed3 = *value;
      } else {
        auto codes = ParseOperatorList(*value);
        if (!codes) {
          return MakeUnexpected(codes.error());
        }
        args.request.operator_codes = std::move(*codes);
      }
    }
  }

  if (has_request_field) {
    auto set = SetOperation(args, Operation::kGenerate, "--prefix");
    if (!set) {
      return MakeUnexpected(set.error());
    }
  }

  if (args.config_file.empty()) {
    return MakeUnexpected(
        MakeError(ErrorCode::kInvalidArgument, "Configuration file path required. Use --help for usage."));
  }
  if (args.operation == Operation::kNone && !args.config_test_mode) {
    return MakeUnexpected(MakeError(ErrorCode::kInvalidArgument,
                                    "No operation given (--prefix, --list-provinces, --list-cities or --cleanup)"));
  }

  // NOLINTEND(cppcoreguidelines-pro-bounds-pointer-arithmetic)
  return args;
}

void CommandLineParser::PrintHelp(const char* program_name) {
  std::cout << "Usage: " << program_name << " -c <config.yaml|config.json> [OPTIONS] <OPERATION>\n";
  std::cout << "\n";
  std::cout << "Operations:\n";
  std::cout << "  --prefix <ddd> --province <name> --city <name>\n";
  std::cout << "        [--suffix4 <dddd> | --suffix3 <ddd>] [--operators <codes 1-5, comma separated>]\n";
  std::cout << "                                 Generate numbers and print the file manifest\n";
  std::cout << "  --list-provinces               Print provinces with coverage\n";
  std::cout << "  --list-cities <province>       Print cities of a province\n";
  std::cout << "  --cleanup                      Remove expired output files\n";
  std::cout << "\n";
  std::cout << "Options:\n";
  std::cout << "  -c, --config <file>            Configuration file path\n";
  std::cout << "  -t, --config-test              Test configuration file and exit\n";
  std::cout << "  -s, --schema <schema.json>     Use custom JSON Schema (optional)\n";
  std::cout << "  -h, --help                     Show this help message\n";
  std::cout << "  -v, --version                  Show version information\n";
}

void CommandLineParser::PrintVersion() {
  std::cout << Version::FullString() << "\n";
}

}  // namespace phonegen::app
