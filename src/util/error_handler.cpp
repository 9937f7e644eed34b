#include "cardlink/util/error_handler.hpp"

#include <sstream>

#include <nlohmann/json.hpp>

namespace cardlink::util {

std::string ContextualError::fullDescription() const {
  std::ostringstream oss;
  oss << errorCodeToString(code_) << ": " << message_;

  if (context_) {
    if (!context_->operation.empty()) {
      oss << " (during " << context_->operation << ")";
    }
    if (!context_->file_path.empty()) {
      oss << " [file: " << context_->file_path << "]";
    }
  }

  return oss.str();
}

bool ContextualError::isRecoverable() const {
  switch (code_) {
    case ErrorCode::kFileNotFound:
    case ErrorCode::kNotFound:
    case ErrorCode::kInvalidReference:
      return true;
    case ErrorCode::kFileReadError:
    case ErrorCode::kFileWriteError:
    case ErrorCode::kDatabaseError:
    case ErrorCode::kStoreError:
      return severity_ != ErrorSeverity::kCritical;
    default:
      return severity_ == ErrorSeverity::kWarning || severity_ == ErrorSeverity::kInfo;
  }
}

ErrorHandler& ErrorHandler::instance() {
  static ErrorHandler instance_;
  return instance_;
}

void ErrorHandler::report(const ContextualError& error) {
  std::function<void(const ContextualError&)> logger;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    logger = error_logger_;
  }
  if (logger) {
    logger(error);
  }
}

void ErrorHandler::setErrorLogger(std::function<void(const ContextualError&)> logger) {
  std::lock_guard<std::mutex> lock(mutex_);
  error_logger_ = std::move(logger);
}

std::string ErrorHandler::formatUserError(const ContextualError& error, bool json_format) const {
  if (json_format) {
    nlohmann::json error_json;
    error_json["error"] = true;
    error_json["code"] = std::string(errorCodeToString(error.code()));
    error_json["message"] = error.message();
    error_json["severity"] = std::string(severityToString(error.severity()));
    error_json["recoverable"] = error.isRecoverable();

    if (error.context()) {
      auto& ctx = *error.context();
      if (!ctx.file_path.empty()) {
        error_json["file"] = ctx.file_path;
      }
      if (!ctx.operation.empty()) {
        error_json["operation"] = ctx.operation;
      }
    }

    return error_json.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
  }

  std::ostringstream oss;

  // Color coding based on severity
  const char* color_code = "";
  const char* reset_code = "\033[0m";

  switch (error.severity()) {
    case ErrorSeverity::kInfo:
      color_code = "\033[36m"; // Cyan
      break;
    case ErrorSeverity::kWarning:
      color_code = "\033[33m"; // Yellow
      break;
    case ErrorSeverity::kError:
      color_code = "\033[31m"; // Red
      break;
    case ErrorSeverity::kCritical:
      color_code = "\033[35m"; // Magenta
      break;
  }

  oss << color_code << severityToString(error.severity()) << reset_code << ": " << error.message();

  if (error.context()) {
    const auto& ctx = *error.context();
    if (!ctx.file_path.empty()) {
      oss << "\n  File: " << ctx.file_path;
    }
    if (!ctx.operation.empty()) {
      oss << "\n  Operation: " << ctx.operation;
    }
  }

  // Add helpful suggestions based on error type
  switch (error.code()) {
    case ErrorCode::kFileNotFound:
      oss << "\n  Suggestion: Check if the file path is correct and the file exists";
      break;
    case ErrorCode::kInvalidReference:
      oss << "\n  Suggestion: Run 'cardlink normalize' to repair the reference markup";
      break;
    case ErrorCode::kConfigError:
      oss << "\n  Suggestion: Check the config file, see 'cardlink --help' for --config";
      break;
    case ErrorCode::kNotFound:
      oss << "\n  Suggestion: Use 'cardlink card list --project <id>' to find card ids";
      break;
    default:
      break;
  }

  return oss.str();
}

std::string_view severityToString(ErrorSeverity severity) {
  switch (severity) {
    case ErrorSeverity::kInfo: return "Info";
    case ErrorSeverity::kWarning: return "Warning";
    case ErrorSeverity::kError: return "Error";
    case ErrorSeverity::kCritical: return "Critical";
  }
  return "Error";
}

}  // namespace cardlink::util
