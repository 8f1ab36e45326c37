/**
 * @file config.h
 * @brief Configuration structures and YAML/JSON loader
 */

#pragma once

#include <string>
#include <vector>

#include "utils/error.h"
#include "utils/expected.h"

namespace pagedtable::config {

// Default values for configuration
namespace defaults {

constexpr int kInitialPageSize = 20;
constexpr bool kCopyItems = true;
constexpr bool kKeepSelectionAcrossPages = true;

inline std::vector<int> PageSizes() {
  return {10, 20, 50, 100};  // NOLINT(cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers)
}

}  // namespace defaults

/**
 * @brief Table controller configuration
 */
struct TableConfig {
  int initial_page_size = defaults::kInitialPageSize;

  /**
   * @brief Page sizes offered to the user
   * Empty list = any positive page size is accepted.
   */
  std::vector<int> page_sizes = defaults::PageSizes();

  /**
   * @brief Copy fetched rows into the window instead of moving them
   */
  bool copy_items = defaults::kCopyItems;

  /**
   * @brief Keep positional selection/expansion when a fetch replaces the window
   * false = clear both whenever a new page lands.
   */
  bool keep_selection_across_pages = defaults::kKeepSelectionAcrossPages;
};

/**
 * @brief Logging configuration
 */
struct LoggingConfig {
  std::string level = "info";  ///< "debug", "info", "warn", "error"
  std::string format = "json";  ///< "json" or "text"
  std::string file;             ///< Log file path (empty = stdout, path = file output)
};

/**
 * @brief Root configuration
 */
struct Config {
  TableConfig table;
  LoggingConfig logging;
};

/**
 * @brief Source text format for ParseConfigString()
 */
enum class ConfigFormat { kYaml, kJson };

/**
 * @brief Load configuration from YAML or JSON file
 *
 * Detects the format from the extension (.yaml, .yml, .json); unknown
 * extensions try YAML first, then JSON. The result is validated with
 * ValidateConfig().
 *
 * @param path Path to configuration file
 * @return Expected<Config, Error> with configuration or error
 */
utils::Expected<Config, utils::Error> LoadConfig(const std::string& path);

/**
 * @brief Load configuration from YAML file
 */
utils::Expected<Config, utils::Error> LoadConfigYaml(const std::string& path);

/**
 * @brief Load configuration from JSON file
 */
utils::Expected<Config, utils::Error> LoadConfigJson(const std::string& path);

/**
 * @brief Parse configuration from an in-memory document
 *
 * @param text YAML or JSON document
 * @param format Document format
 * @return Expected<Config, Error> with validated configuration or error
 */
utils::Expected<Config, utils::Error> ParseConfigString(const std::string& text, ConfigFormat format);

/**
 * @brief Check value ranges and cross-field constraints
 *
 * - Every page size is positive
 * - initial_page_size is positive and listed in page_sizes (when non-empty)
 * - logging.level is one of debug/info/warn/error
 * - logging.format is json or text
 *
 * @return Expected<void, Error> with kConfigValidationError on failure
 */
utils::Expected<void, utils::Error> ValidateConfig(const Config& config);

}  // namespace pagedtable::config
