/**
 * @file configuration_manager.cpp
 * @brief Configuration manager implementation
 */

#include "app/configuration_manager.h"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/spdlog.h>

#include <filesystem>
#include <iostream>

#include "utils/structured_log.h"

namespace pagedtable::app {

namespace {

std::string JoinPageSizes(const std::vector<int>& page_sizes) {
  if (page_sizes.empty()) {
    return "(any)";
  }
  std::string joined;
  for (size_t i = 0; i < page_sizes.size(); ++i) {
    if (i > 0) {
      joined += ", ";
    }
    joined += std::to_string(page_sizes[i]);
  }
  return joined;
}

}  // namespace

Expected<std::unique_ptr<ConfigurationManager>, Error> ConfigurationManager::Create(const std::string& config_file) {
  config::Config loaded;
  if (config_file.empty()) {
    auto valid = config::ValidateConfig(loaded);
    if (!valid) {
      return utils::MakeUnexpected(valid.error());
    }
  } else {
    auto config_result = config::LoadConfig(config_file);
    if (!config_result) {
      return utils::MakeUnexpected(config_result.error());
    }
    loaded = std::move(*config_result);
  }

  auto manager = std::unique_ptr<ConfigurationManager>(new ConfigurationManager(config_file, std::move(loaded)));
  return manager;
}

ConfigurationManager::ConfigurationManager(std::string config_file, config::Config initial_config)
    : config_file_(std::move(config_file)), config_(std::move(initial_config)) {}

int ConfigurationManager::PrintConfigTest() const {
  std::cout << "Configuration file syntax is OK\n";
  std::cout << "Configuration details:\n";
  std::cout << "  Table:\n";
  std::cout << "    initial_page_size: " << config_.table.initial_page_size << "\n";
  std::cout << "    page_sizes: " << JoinPageSizes(config_.table.page_sizes) << "\n";
  std::cout << "    copy_items: " << (config_.table.copy_items ? "true" : "false") << "\n";
  std::cout << "    keep_selection_across_pages: " << (config_.table.keep_selection_across_pages ? "true" : "false")
            << "\n";
  std::cout << "  Logging level: " << config_.logging.level << "\n";
  std::cout << "  Logging format: " << config_.logging.format << "\n";
  std::cout << "  Logging file: " << (config_.logging.file.empty() ? "(stdout)" : config_.logging.file) << "\n";
  return 0;
}

Expected<void, Error> ConfigurationManager::ApplyLoggingConfig() {
  // Configure log output (file or stdout) BEFORE setting level
  if (!config_.logging.file.empty()) {
    try {
      std::filesystem::path log_path(config_.logging.file);
      std::filesystem::path log_dir = log_path.parent_path();
      if (!log_dir.empty() && !std::filesystem::exists(log_dir)) {
        std::filesystem::create_directories(log_dir);
      }

      auto file_logger = spdlog::basic_logger_mt("pagedtable", config_.logging.file);
      spdlog::set_default_logger(file_logger);
    } catch (const spdlog::spdlog_ex& ex) {
      return utils::MakeUnexpected(
          utils::MakeError(utils::ErrorCode::kIOError, "Log file initialization failed: " + std::string(ex.what())));
    } catch (const std::exception& ex) {
      return utils::MakeUnexpected(
          utils::MakeError(utils::ErrorCode::kIOError, "Failed to create log directory: " + std::string(ex.what())));
    }
  }

  // Apply logging level (must be AFTER setting default logger)
  if (config_.logging.level == "debug") {
    spdlog::set_level(spdlog::level::debug);
  } else if (config_.logging.level == "info") {
    spdlog::set_level(spdlog::level::info);
  } else if (config_.logging.level == "warn") {
    spdlog::set_level(spdlog::level::warn);
  } else if (config_.logging.level == "error") {
    spdlog::set_level(spdlog::level::err);
  }

  utils::StructuredLog::SetFormat(utils::StructuredLog::ParseFormat(config_.logging.format));

  if (!config_.logging.file.empty()) {
    spdlog::info("Logging to file: {}", config_.logging.file);
  }

  return {};
}

}  // namespace pagedtable::app
