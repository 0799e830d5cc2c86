/**
 * @file command_line_parser.h
 * @brief Command-line argument parser
 */

#ifndef PHONEGEN_APP_COMMAND_LINE_PARSER_H_
#define PHONEGEN_APP_COMMAND_LINE_PARSER_H_

#include <cstdint>
#include <string>

#include "plan/filter_request.h"
#include "utils/error.h"
#include "utils/expected.h"

namespace phonegen::app {

using utils::Error;
using utils::Expected;

/**
 * @brief Operation selected on the command line
 */
enum class Operation : uint8_t {
  kNone,           ///< Only valid with --config-test
  kGenerate,       ///< --prefix/--province/--city
  kListProvinces,  ///< --list-provinces
  kListCities,     ///< --list-cities <province>
  kCleanup,        ///< --cleanup
};

/**
 * @brief Parsed command-line arguments
 */
struct CommandLineArgs {
  std::string config_file;
  std::string schema_file;  ///< Optional JSON Schema file path
  bool config_test_mode = false;
  bool show_help = false;
  bool show_version = false;

  Operation operation = Operation::kNone;
  plan::FilterRequest request;  ///< kGenerate
  std::string list_province;    ///< kListCities
};

/**
 * @brief Command-line argument parser
 *
 * Supports short (-c) and long (--config) options. Exactly one operation
 * is required unless --config-test is given.
 */
class CommandLineParser {
 public:
  /**
   * @brief Parse command line arguments
   *
   * Supported options:
   * - -c, --config <file>: Configuration file path
   * - -t, --config-test: Test configuration file and exit
   * - -s, --schema <file>: Use custom JSON Schema
   * - --prefix <ddd> --province <name> --city <name>: Generate numbers
   * - --suffix4 <dddd> | --suffix3 <ddd>: Fixed trailing digits
   * - --operators <list>: Comma separated operator codes (1-5)
   * - --list-provinces, --list-cities <province>: Print selection lists
   * - --cleanup: Remove expired output files
   * - -h, --help / -v, --version
   *
   * @note Help and version flags take precedence
   */
  // NOLINTNEXTLINE(cppcoreguidelines-avoid-c-arrays,modernize-avoid-c-arrays) - Standard C/C++ main signature
  static Expected<CommandLineArgs, Error> Parse(int argc, char* argv[]);

  /**
   * @brief Parse "1,2,3" into operator codes
   *
   * Only the syntax is checked here; the code range is checked when the
   * request is resolved.
   */
  static Expected<std::set<int>, Error> ParseOperatorList(const std::string& text);

  static void PrintHelp(const char* program_name);

  static void PrintVersion();

 private:
  CommandLineParser() = default;
};

}  // namespace phonegen::app

#endif  // PHONEGEN_APP_COMMAND_LINE_PARSER_H_
