/**
 * @file structured_log.h
 * @brief Structured logging utilities over spdlog
 *
 * Provides helper functions for logging events either as one JSON object
 * per line (default) or as "event key=value" text, so table activity can be
 * parsed programmatically or read by a person.
 */

#pragma once

#include <spdlog/spdlog.h>

#include <atomic>
#include <cstdint>
#include <iomanip>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace pagedtable::utils {

/**
 * @brief Structured log builder
 *
 * Example usage:
 * @code
 * StructuredLog()
 *   .Event("table_fetch_failed")
 *   .Field("page", static_cast<int64_t>(page))
 *   .Field("error", error.message())
 *   .Error();
 * @endcode
 */
class StructuredLog {
 public:
  /**
   * @brief Output format shared by every StructuredLog
   */
  enum class Format { kJson, kText };

  StructuredLog() = default;

  /**
   * @brief Set process-wide output format
   */
  static void SetFormat(Format format) { FormatSetting().store(format); }

  static Format GetFormat() { return FormatSetting().load(); }

  /**
   * @brief Parse "json" or "text" (anything else falls back to JSON)
   */
  static Format ParseFormat(const std::string& name) { return name == "text" ? Format::kText : Format::kJson; }

  /**
   * @brief Set event type
   */
  StructuredLog& Event(const std::string& event) {
    event_ = event;
    return *this;
  }

  /**
   * @brief Add string field (const char*)
   */
  StructuredLog& Field(const std::string& key, const char* value) {
    fields_.push_back({key, std::string(value), true});
    return *this;
  }

  /**
   * @brief Add string field (std::string)
   */
  StructuredLog& Field(const std::string& key, const std::string& value) {
    fields_.push_back({key, value, true});
    return *this;
  }

  /**
   * @brief Add string field (std::string_view)
   */
  StructuredLog& Field(const std::string& key, std::string_view value) {
    fields_.push_back({key, std::string(value), true});
    return *this;
  }

  /**
   * @brief Add integer field
   */
  StructuredLog& Field(const std::string& key, int64_t value) {
    fields_.push_back({key, std::to_string(value), true});
    return *this;
  }

  /**
   * @brief Add unsigned integer field
   */
  StructuredLog& Field(const std::string& key, uint64_t value) {
    fields_.push_back({key, std::to_string(value), true});
    return *this;
  }

  /**
   * @brief Add double field
   */
  StructuredLog& Field(const std::string& key, double value) {
    std::ostringstream oss;
    oss << value;
    fields_.push_back({key, oss.str(), false});
    return *this;
  }

  /**
   * @brief Add boolean field
   */
  StructuredLog& Field(const std::string& key, bool value) {
    fields_.push_back({key, value ? "true" : "false", false});  // No quotes for booleans
    return *this;
  }

  /**
   * @brief Add message field (optional, for human-readable context)
   */
  StructuredLog& Message(const std::string& message) {
    message_ = message;
    return *this;
  }

  void Debug() const { spdlog::debug("{}", Build()); }
  void Info() const { spdlog::info("{}", Build()); }
  void Warn() const { spdlog::warn("{}", Build()); }
  void Error() const { spdlog::error("{}", Build()); }
  void Critical() const { spdlog::critical("{}", Build()); }

  /**
   * @brief Render the record in the current format
   */
  [[nodiscard]] std::string Build() const { return GetFormat() == Format::kText ? BuildText() : BuildJson(); }

 private:
  struct FieldEntry {
    std::string key;
    std::string value;
    bool quoted;
  };

  std::string event_;
  std::string message_;
  std::vector<FieldEntry> fields_;

  static std::atomic<Format>& FormatSetting() {
    static std::atomic<Format> format{Format::kJson};
    return format;
  }

  std::string BuildJson() const {
    std::ostringstream json;
    json << "{";

    bool first = true;

    if (!event_.empty()) {
      json << R"("event":")" << Escape(event_) << R"(")";
      first = false;
    }

    if (!message_.empty()) {
      if (!first) {
        json << ",";
      }
      json << R"("message":")" << Escape(message_) << R"(")";
      first = false;
    }

    for (const auto& field : fields_) {
      if (!first) {
        json << ",";
      }
      json << "\"" << field.key << "\":";
      if (field.quoted) {
        json << "\"" << Escape(field.value) << "\"";
      } else {
        json << field.value;
      }
      first = false;
    }

    json << "}";
    return json.str();
  }

  std::string BuildText() const {
    std::ostringstream text;
    text << event_;
    for (const auto& field : fields_) {
      text << " " << field.key << "=";
      if (field.quoted && field.value.find(' ') != std::string::npos) {
        text << "\"" << field.value << "\"";
      } else {
        text << field.value;
      }
    }
    if (!message_.empty()) {
      text << " - " << message_;
    }
    return text.str();
  }

  /**
   * @brief Escape JSON string
   */
  static std::string Escape(const std::string& str) {
    // Control character threshold for JSON escaping (0x20 = space)
    constexpr char kControlCharThreshold = 0x20;

    std::ostringstream escaped;
    for (char chr : str) {
      switch (chr) {
        case '"':
          escaped << R"(\")";
          break;
        case '\\':
          escaped << R"(\\)";
          break;
        case '\b':
          escaped << R"(\b)";
          break;
        case '\f':
          escaped << R"(\f)";
          break;
        case '\n':
          escaped << R"(\n)";
          break;
        case '\r':
          escaped << R"(\r)";
          break;
        case '\t':
          escaped << R"(\t)";
          break;
        default:
          if (chr >= 0 && chr < kControlCharThreshold) {
            escaped << R"(\u)" << std::hex << std::setw(4) << std::setfill('0') << static_cast<int>(chr);
          } else {
            escaped << chr;
          }
      }
    }
    return escaped.str();
  }
};

/**
 * @brief Log a failed page fetch in structured format
 */
inline void LogFetchFailure(int page_index, uint64_t generation, const std::string& error_msg) {
  StructuredLog()
      .Event("table_fetch_failed")
      .Field("page", static_cast<int64_t>(page_index))
      .Field("generation", generation)
      .Field("error", error_msg)
      .Error();
}

/**
 * @brief Log a configuration problem in structured format
 */
inline void LogConfigError(const std::string& path, const std::string& error_msg) {
  StructuredLog().Event("config_error").Field("path", path).Field("error", error_msg).Error();
}

}  // namespace pagedtable::utils
