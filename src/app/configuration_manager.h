/**
 * @file configuration_manager.h
 * @brief Configuration manager for loading and validating configuration files
 */

#ifndef PHONEGEN_APP_CONFIGURATION_MANAGER_H_
#define PHONEGEN_APP_CONFIGURATION_MANAGER_H_

#include <memory>
#include <string>

#include "config/config.h"
#include "utils/error.h"
#include "utils/expected.h"

namespace phonegen::app {

using utils::Error;
using utils::Expected;

/**
 * @brief Configuration manager
 *
 * Loads and validates the configuration once; Create() only returns an
 * instance for a valid file.
 */
class ConfigurationManager {
 public:
  /**
   * @brief Create manager and load configuration
   * @param config_file Path to configuration file
   * @param schema_file Optional schema file path (empty = use built-in)
   */
  static Expected<std::unique_ptr<ConfigurationManager>, Error> Create(const std::string& config_file,
                                                                       const std::string& schema_file = "");

  ~ConfigurationManager() = default;

  ConfigurationManager(const ConfigurationManager&) = delete;
  ConfigurationManager& operator=(const ConfigurationManager&) = delete;
  ConfigurationManager(ConfigurationManager&&) = delete;
  ConfigurationManager& operator=(ConfigurationManager&&) = delete;

  const config::Config& GetConfig() const { return config_; }

  /**
   * @brief Test mode: print configuration details
   * @return Exit code (0 = success)
   */
  int PrintConfigTest() const;

  /**
   * @brief Apply logging configuration
   *
   * Logs go to the configured file, or to stderr so that stdout carries
   * only command output. Sets the level and the structured log format.
   */
  Expected<void, Error> ApplyLoggingConfig();

  const std::string& GetConfigFilePath() const { return config_file_; }

 private:
  ConfigurationManager(std::string config_file, std::string schema_file, config::Config initial_config);

  std::string config_file_;
  std::string schema_file_;
  config::Config config_;
};

}  // namespace phonegen::app

#endif  // PHONEGEN_APP_CONFIGURATION_MANAGER_H_
