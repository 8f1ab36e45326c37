/**
 * @file error.cpp
 * @brief Error code names and formatting
 */

#include "utils/error.h"

#include <sstream>

namespace pagedtable::utils {

const char* ErrorCodeToString(ErrorCode code) {
  switch (code) {
    case ErrorCode::kSuccess:
      return "Success";
    case ErrorCode::kInvalidArgument:
      return "Invalid argument";
    case ErrorCode::kOutOfRange:
      return "Out of range";
    case ErrorCode::kInternalError:
      return "Internal error";
    case ErrorCode::kIOError:
      return "I/O error";

    case ErrorCode::kConfigFileNotFound:
      return "Configuration file not found";
    case ErrorCode::kConfigParseError:
      return "Configuration parse error";
    case ErrorCode::kConfigValidationError:
      return "Configuration validation error";
    case ErrorCode::kConfigInvalidValue:
      return "Invalid configuration value";

    case ErrorCode::kTableNotInitialized:
      return "Table not initialized";
    case ErrorCode::kTableDisposed:
      return "Table disposed";
    case ErrorCode::kTableFetchFailed:
      return "Fetch failed";
    case ErrorCode::kTableNoNextPage:
      return "No next page";
    case ErrorCode::kTableNoPreviousPage:
      return "No previous page";
    case ErrorCode::kTableUnknownColumn:
      return "Unknown column";
    case ErrorCode::kTableColumnNotSortable:
      return "Column not sortable";
    case ErrorCode::kTableInvalidPageSize:
      return "Invalid page size";

    case ErrorCode::kSourceInvalidToken:
      return "Invalid page token";
    case ErrorCode::kSourceUnknownSortField:
      return "Unknown sort field";
    case ErrorCode::kSourceUnavailable:
      return "Source unavailable";
  }
  return "Unknown error code";
}

std::string Error::to_string() const {
  std::ostringstream oss;
  oss << "[" << ErrorCodeToString(code_) << " (" << static_cast<int>(code_) << ")] " << message_;
  if (!context_.empty()) {
    oss << " (context: " << context_ << ")";
  }
  return oss.str();
}

}  // namespace pagedtable::utils
