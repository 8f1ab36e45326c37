/**
 * @file configuration_manager.h
 * @brief Configuration manager for loading and validating configuration files
 */

#ifndef PAGEDTABLE_APP_CONFIGURATION_MANAGER_H_
#define PAGEDTABLE_APP_CONFIGURATION_MANAGER_H_

#include <memory>
#include <string>

#include "config/config.h"
#include "utils/error.h"
#include "utils/expected.h"

namespace pagedtable::app {

// Import Expected from utils namespace
using pagedtable::utils::Error;
using pagedtable::utils::Expected;

/**
 * @brief Configuration manager
 *
 * Responsibilities:
 * - Load configuration from file (YAML/JSON), or take the built-in defaults
 * - Apply logging configuration to spdlog and StructuredLog
 * - Provide read-only access to configuration
 *
 * Create() validates config before returning an instance.
 */
class ConfigurationManager {
 public:
  /**
   * @brief Create manager and load initial configuration
   * @param config_file Path to configuration file (empty = built-in defaults)
   * @return Expected with manager instance or error
   */
  static Expected<std::unique_ptr<ConfigurationManager>, Error> Create(const std::string& config_file);

  ~ConfigurationManager() = default;

  // Non-copyable, non-movable (owns configuration state)
  ConfigurationManager(const ConfigurationManager&) = delete;
  ConfigurationManager& operator=(const ConfigurationManager&) = delete;
  ConfigurationManager(ConfigurationManager&&) = delete;
  ConfigurationManager& operator=(ConfigurationManager&&) = delete;

  /**
   * @brief Get current configuration (read-only)
   */
  const config::Config& GetConfig() const { return config_; }

  /**
   * @brief Test mode: print configuration details
   * @return Exit code (0 = success)
   */
  int PrintConfigTest() const;

  /**
   * @brief Apply logging configuration
   * @return Expected with void or error
   *
   * Side effects:
   * - Configures file or console output (creates the log directory if needed)
   * - Sets spdlog log level (debug/info/warn/error)
   * - Sets the StructuredLog output format
   */
  Expected<void, Error> ApplyLoggingConfig();

  /**
   * @brief Config file path (empty when running on defaults)
   */
  const std::string& GetConfigFilePath() const { return config_file_; }

 private:
  ConfigurationManager(std::string config_file, config::Config initial_config);

  std::string config_file_;
  config::Config config_;
};

}  // namespace pagedtable::app

#endif  // PAGEDTABLE_APP_CONFIGURATION_MANAGER_H_
