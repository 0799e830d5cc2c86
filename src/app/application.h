/**
 * @file application.h
 * @brief Main application class
 */

#ifndef PHONEGEN_APP_APPLICATION_H_
#define PHONEGEN_APP_APPLICATION_H_

#include <iostream>
#include <memory>
#include <ostream>

#include "app/command_line_parser.h"
#include "app/configuration_manager.h"
#include "index/lookup_index.h"
#include "utils/error.h"
#include "utils/expected.h"

namespace phonegen::app {

/**
 * @brief Main application class
 *
 * Lifecycle:
 * 1. Parse command-line arguments
 * 2. Load configuration
 * 3. Apply logging configuration
 * 4. Load records and build the lookup index (not needed for --cleanup)
 * 5. Run the requested operation and print its JSON response
 *
 * Usage:
 * @code
 * auto app = Application::Create(argc, argv);
 * if (!app) {
 *   std::cerr << "Failed to create application: " << app.error().to_string() << "\n";
 *   return 1;
 * }
 * return (*app)->Run();
 * @endcode
 */
class Application {
 public:
  /**
   * @brief Create application from command-line arguments
   *
   * Prints help or version directly; the returned application then exits
   * with 0 from Run().
   */
  // NOLINTNEXTLINE(cppcoreguidelines-avoid-c-arrays,modernize-avoid-c-arrays) - Standard C/C++ main signature
  static Expected<std::unique_ptr<Application>, Error> Create(int argc, char* argv[]);

  ~Application() = default;

  Application(const Application&) = delete;
  Application& operator=(const Application&) = delete;
  Application(Application&&) = delete;
  Application& operator=(Application&&) = delete;

  /**
   * @brief Run the requested operation
   * @param out Stream receiving the JSON response
   * @return Exit code (0 = success, including empty results; 1 = error)
   */
  int Run(std::ostream& out = std::cout);

 private:
  Application(CommandLineArgs args, std::unique_ptr<ConfigurationManager> config_mgr);

  int HandleSpecialModes();

  Expected<std::unique_ptr<index::LookupIndex>, Error> BuildIndex() const;

  int RunGenerate(const index::LookupIndex& index, std::ostream& out);
  int RunCleanup(std::ostream& out);

  CommandLineArgs args_;
  std::unique_ptr<ConfigurationManager> config_manager_;
};

}  // namespace phonegen::app

#endif  // PHONEGEN_APP_APPLICATION_H_
