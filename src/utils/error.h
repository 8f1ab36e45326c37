/**
 * @file error.h
 * @brief Error codes and Error value used across PagedTable
 *
 * Error codes are grouped by range so the owning module can be read off the
 * numeric value:
 * - 0..999     General
 * - 1000..1999 Configuration
 * - 2000..2999 Table controller
 * - 3000..3999 Row sources
 */

#pragma once

#include <string>

namespace pagedtable::utils {

/**
 * @brief Error code enumeration
 */
enum class ErrorCode : int {  // NOLINT(performance-enum-size)
  // General
  kSuccess = 0,
  kInvalidArgument = 2,
  kOutOfRange = 3,
  kInternalError = 5,
  kIOError = 6,

  // Configuration
  kConfigFileNotFound = 1000,
  kConfigParseError = 1001,
  kConfigValidationError = 1002,
  kConfigInvalidValue = 1003,

  // Table controller
  kTableNotInitialized = 2000,
  kTableDisposed = 2001,
  kTableFetchFailed = 2002,
  kTableNoNextPage = 2003,
  kTableNoPreviousPage = 2004,
  kTableUnknownColumn = 2005,
  kTableColumnNotSortable = 2006,
  kTableInvalidPageSize = 2007,

  // Row sources
  kSourceInvalidToken = 3000,
  kSourceUnknownSortField = 3001,
  kSourceUnavailable = 3002,
};

/**
 * @brief Human-readable name of an error code
 */
const char* ErrorCodeToString(ErrorCode code);

/**
 * @brief Error value carried by Expected<T, Error>
 *
 * When constructed with a code only, the message defaults to
 * ErrorCodeToString(code).
 */
class Error {
 public:
  Error() = default;

  explicit Error(ErrorCode code) : code_(code), message_(ErrorCodeToString(code)) {}

  Error(ErrorCode code, std::string message) : code_(code), message_(std::move(message)) {}

  Error(ErrorCode code, std::string message, std::string context)
      : code_(code), message_(std::move(message)), context_(std::move(context)) {}

  [[nodiscard]] ErrorCode code() const { return code_; }
  [[nodiscard]] const std::string& message() const { return message_; }
  [[nodiscard]] const std::string& context() const { return context_; }
  [[nodiscard]] bool is_error() const { return code_ != ErrorCode::kSuccess; }

  /**
   * @brief Message as C string (std::exception style)
   */
  [[nodiscard]] const char* what() const { return message_.c_str(); }

  /**
   * @brief Format as "[<code name> (<code>)] <message> (context: <context>)"
   */
  [[nodiscard]] std::string to_string() const;

  // NOLINTNEXTLINE(google-explicit-constructor,hicpp-explicit-conversions)
  operator std::string() const { return to_string(); }

  bool operator==(const Error& other) const {
    return code_ == other.code_ && message_ == other.message_ && context_ == other.context_;
  }
  bool operator!=(const Error& other) const { return !(*this == other); }

 private:
  ErrorCode code_ = ErrorCode::kSuccess;
  std::string message_;
  std::string context_;
};

inline Error MakeError(ErrorCode code) {
  return Error(code);
}

inline Error MakeError(ErrorCode code, std::string message) {
  return {code, std::move(message)};
}

inline Error MakeError(ErrorCode code, std::string message, std::string context) {
  return {code, std::move(message), std::move(context)};
}

}  // namespace pagedtable::utils

/**
 * @brief Create an Error whose context is the current file:line
 */
// NOLINTNEXTLINE(cppcoreguidelines-macro-usage)
#define PAGEDTABLE_ERROR(code, msg) \
  ::pagedtable::utils::MakeError((code), (msg), std::string(__FILE__) + ":" + std::to_string(__LINE__))
