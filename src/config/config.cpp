/**
 * @file config.cpp
 * @brief Configuration parser implementation
 */

#include "config/config.h"

#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <fstream>
#include <nlohmann/json.hpp>
#include <sstream>
#include <stdexcept>

#include "utils/structured_log.h"

namespace pagedtable::config {

namespace {

using json = nlohmann::json;

/**
 * @brief Convert YAML node to JSON object recursively
 */
json YamlToJson(const YAML::Node& node) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
      return {};
    case YAML::NodeType::Scalar: {
      // Quoted scalars stay strings; plain numbers and booleans come back typed
      if (node.Tag() == "!") {
        return node.as<std::string>();
      }
      try {
        return json::parse(node.as<std::string>());
      } catch (const json::parse_error&) {
        return node.as<std::string>();
      }
    }
    case YAML::NodeType::Sequence: {
      json result = json::array();
      for (const auto& item : node) {
        result.push_back(YamlToJson(item));
      }
      return result;
    }
    case YAML::NodeType::Map: {
      json result = json::object();
      for (const auto& key_value : node) {
        result[key_value.first.as<std::string>()] = YamlToJson(key_value.second);
      }
      return result;
    }
    default:
      return {};
  }
}

/**
 * @brief Parse table configuration from JSON
 */
TableConfig ParseTableConfig(const json& json_obj) {
  TableConfig config;

  if (json_obj.contains("initial_page_size")) {
    config.initial_page_size = json_obj["initial_page_size"].get<int>();
  }
  if (json_obj.contains("page_sizes")) {
    if (!json_obj["page_sizes"].is_array()) {
      throw std::runtime_error("table.page_sizes must be a list of integers");
    }
    config.page_sizes.clear();
    for (const auto& size : json_obj["page_sizes"]) {
      config.page_sizes.push_back(size.get<int>());
    }
  }
  if (json_obj.contains("copy_items")) {
    config.copy_items = json_obj["copy_items"].get<bool>();
  }
  if (json_obj.contains("keep_selection_across_pages")) {
    config.keep_selection_across_pages = json_obj["keep_selection_across_pages"].get<bool>();
  }

  return config;
}

/**
 * @brief Parse logging configuration from JSON
 */
LoggingConfig ParseLoggingConfig(const json& json_obj) {
  LoggingConfig config;

  if (json_obj.contains("level")) {
    config.level = json_obj["level"].get<std::string>();
  }
  if (json_obj.contains("format")) {
    config.format = json_obj["format"].get<std::string>();
  }
  if (json_obj.contains("file")) {
    config.file = json_obj["file"].get<std::string>();
  }

  return config;
}

/**
 * @brief Parse root configuration from JSON (throws on type mismatch)
 */
Config ParseConfigFromJson(const json& root) {
  Config config;

  if (root.is_null()) {
    return config;
  }
  if (!root.is_object()) {
    throw std::runtime_error("Configuration root must be a mapping");
  }

  if (root.contains("table")) {
    config.table = ParseTableConfig(root["table"]);
  }
  if (root.contains("logging")) {
    config.logging = ParseLoggingConfig(root["logging"]);
  }

  return config;
}

/**
 * @brief Parse + validate, mapping exceptions to Error
 */
utils::Expected<Config, utils::Error> BuildConfig(const json& root, const std::string& origin) {
  Config config;
  try {
    config = ParseConfigFromJson(root);
  } catch (const json::exception& e) {
    return utils::MakeUnexpected(utils::MakeError(utils::ErrorCode::kConfigInvalidValue,
                                                  "Invalid value in configuration: " + std::string(e.what()), origin));
  } catch (const std::runtime_error& e) {
    return utils::MakeUnexpected(utils::MakeError(utils::ErrorCode::kConfigInvalidValue, e.what(), origin));
  }

  auto valid = ValidateConfig(config);
  if (!valid) {
    return utils::MakeUnexpected(
        utils::MakeError(valid.error().code(), valid.error().message(), origin));
  }

  return config;
}

/**
 * @brief Read file contents as string
 */
utils::Expected<std::string, utils::Error> ReadFileToString(const std::string& path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    std::stringstream err_msg;
    err_msg << "Failed to open configuration file: " << path << "\n";
    err_msg << "  Possible reasons:\n";
    err_msg << "    - File does not exist\n";
    err_msg << "    - Insufficient read permissions\n";
    err_msg << "    - Invalid file path";
    return utils::MakeUnexpected(utils::MakeError(utils::ErrorCode::kConfigFileNotFound, err_msg.str(), path));
  }
  std::stringstream buffer;
  buffer << file.rdbuf();
  return buffer.str();
}

/**
 * @brief Detect file format based on extension
 */
// NOLINTNEXTLINE(performance-enum-size)
enum class FileFormat { kYaml, kJson, kUnknown };

constexpr size_t kJsonExtLength = 5;  // ".json"
constexpr size_t kYamlExtLength = 5;  // ".yaml"
constexpr size_t kYmlExtLength = 4;   // ".yml"

FileFormat DetectFileFormat(const std::string& path) {
  if (path.size() >= kJsonExtLength && path.substr(path.size() - kJsonExtLength) == ".json") {
    return FileFormat::kJson;
  }
  if (path.size() >= kYamlExtLength && path.substr(path.size() - kYamlExtLength) == ".yaml") {
    return FileFormat::kYaml;
  }
  if (path.size() >= kYmlExtLength && path.substr(path.size() - kYmlExtLength) == ".yml") {
    return FileFormat::kYaml;
  }
  return FileFormat::kUnknown;
}

void LogLoaded(const std::string& path, const Config& config) {
  utils::StructuredLog()
      .Event("config_loaded")
      .Field("path", path)
      .Field("initial_page_size", static_cast<int64_t>(config.table.initial_page_size))
      .Field("page_sizes", static_cast<uint64_t>(config.table.page_sizes.size()))
      .Field("copy_items", config.table.copy_items)
      .Field("keep_selection_across_pages", config.table.keep_selection_across_pages)
      .Info();
}

}  // namespace

utils::Expected<void, utils::Error> ValidateConfig(const Config& config) {
  const auto& table = config.table;

  for (int size : table.page_sizes) {
    if (size <= 0) {
      return utils::MakeUnexpected(utils::MakeError(utils::ErrorCode::kConfigValidationError,
                                                    "table.page_sizes entries must be positive, got " +
                                                        std::to_string(size)));
    }
  }

  if (table.initial_page_size <= 0) {
    return utils::MakeUnexpected(utils::MakeError(utils::ErrorCode::kConfigValidationError,
                                                  "table.initial_page_size must be positive, got " +
                                                      std::to_string(table.initial_page_size)));
  }

  if (!table.page_sizes.empty() && std::find(table.page_sizes.begin(), table.page_sizes.end(),
                                             table.initial_page_size) == table.page_sizes.end()) {
    return utils::MakeUnexpected(utils::MakeError(
        utils::ErrorCode::kConfigValidationError,
        "table.initial_page_size (" + std::to_string(table.initial_page_size) + ") is not listed in table.page_sizes"));
  }

  const auto& level = config.logging.level;
  if (level != "debug" && level != "info" && level != "warn" && level != "error") {
    return utils::MakeUnexpected(utils::MakeError(utils::ErrorCode::kConfigValidationError,
                                                  "logging.level must be debug, info, warn or error, got '" + level +
                                                      "'"));
  }

  const auto& format = config.logging.format;
  if (format != "json" && format != "text") {
    return utils::MakeUnexpected(utils::MakeError(utils::ErrorCode::kConfigValidationError,
                                                  "logging.format must be json or text, got '" + format + "'"));
  }

  return {};
}

utils::Expected<Config, utils::Error> ParseConfigString(const std::string& text, ConfigFormat format) {
  json root;
  if (format == ConfigFormat::kJson) {
    try {
      root = json::parse(text);
    } catch (const json::parse_error& e) {
      std::stringstream err_msg;
      err_msg << "JSON parse error: " << e.what();
      if (e.byte != 0) {
        err_msg << " (byte " << e.byte << ")";
      }
      return utils::MakeUnexpected(utils::MakeError(utils::ErrorCode::kConfigParseError, err_msg.str()));
    }
  } else {
    try {
      root = YamlToJson(YAML::Load(text));
    } catch (const YAML::Exception& e) {
      std::stringstream err_msg;
      err_msg << "YAML parse error: " << e.what();
      return utils::MakeUnexpected(utils::MakeError(utils::ErrorCode::kConfigParseError, err_msg.str()));
    }
  }

  return BuildConfig(root, "");
}

utils::Expected<Config, utils::Error> LoadConfigJson(const std::string& path) {
  auto content = ReadFileToString(path);
  if (!content) {
    return utils::MakeUnexpected(content.error());
  }

  json root;
  try {
    root = json::parse(*content);
  } catch (const json::parse_error& e) {
    std::stringstream err_msg;
    err_msg << "JSON parse error in configuration file: " << path << "\n";
    err_msg << "  Error details: " << e.what();
    if (e.byte != 0) {
      err_msg << "\n  Error position: byte " << e.byte;
    }
    return utils::MakeUnexpected(utils::MakeError(utils::ErrorCode::kConfigParseError, err_msg.str(), path));
  }

  auto config = BuildConfig(root, path);
  if (config) {
    LogLoaded(path, *config);
  }
  return config;
}

utils::Expected<Config, utils::Error> LoadConfigYaml(const std::string& path) {
  json root;
  try {
    root = YamlToJson(YAML::LoadFile(path));
  } catch (const YAML::BadFile&) {
    return utils::MakeUnexpected(utils::MakeError(utils::ErrorCode::kConfigFileNotFound,
                                                  "Failed to open configuration file: " + path, path));
  } catch (const YAML::Exception& e) {
    std::stringstream err_msg;
    err_msg << "YAML parse error in configuration file: " << path << "\n";
    err_msg << "  Error details: " << e.what();
    if (e.mark.line != static_cast<size_t>(-1)) {
      err_msg << "\n  Error location: line " << (e.mark.line + 1) << ", column " << (e.mark.column + 1);
    }
    return utils::MakeUnexpected(utils::MakeError(utils::ErrorCode::kConfigParseError, err_msg.str(), path));
  }

  auto config = BuildConfig(root, path);
  if (config) {
    LogLoaded(path, *config);
  }
  return config;
}

utils::Expected<Config, utils::Error> LoadConfig(const std::string& path) {
  switch (DetectFileFormat(path)) {
    case FileFormat::kJson:
      spdlog::debug("Detected JSON format for config file: {}", path);
      return LoadConfigJson(path);

    case FileFormat::kYaml:
      spdlog::debug("Detected YAML format for config file: {}", path);
      return LoadConfigYaml(path);

    case FileFormat::kUnknown:
    default: {
      spdlog::debug("Unknown file format, trying YAML first: {}", path);
      auto yaml_result = LoadConfigYaml(path);
      if (yaml_result || yaml_result.error().code() == utils::ErrorCode::kConfigFileNotFound) {
        return yaml_result;
      }

      spdlog::debug("YAML parsing failed, trying JSON: {}", path);
      auto json_result = LoadConfigJson(path);
      if (json_result) {
        return json_result;
      }

      std::stringstream err_msg;
      err_msg << "Failed to load configuration file: " << path << "\n";
      err_msg << "  File format could not be determined (.yaml, .yml, or .json expected)\n";
      err_msg << "  Attempted YAML parsing: " << yaml_result.error().message() << "\n";
      err_msg << "  Attempted JSON parsing: " << json_result.error().message();
      utils::LogConfigError(path, "format detection failed");
      return utils::MakeUnexpected(utils::MakeError(utils::ErrorCode::kConfigParseError, err_msg.str(), path));
    }
  }
}

}  // namespace pagedtable::config
