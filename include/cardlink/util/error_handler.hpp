#pragma once

#include <chrono>
#include <functional>
#include <mutex>
#include <optional>
#include <string>

#include "cardlink/common.hpp"

namespace cardlink::util {

// Error severity levels
enum class ErrorSeverity {
  kInfo,     // Informational messages
  kWarning,  // Recoverable issues
  kError,    // Serious errors that prevent operation
  kCritical  // Errors that leave the workspace inconsistent
};

// Error context for providing additional debugging information
struct ErrorContext {
  std::string file_path;          // File being operated on
  std::string operation;          // Operation being performed
  std::chrono::system_clock::time_point timestamp;

  ErrorContext() : timestamp(std::chrono::system_clock::now()) {}

  ErrorContext& withFile(const std::string& path) {
    file_path = path;
    return *this;
  }

  ErrorContext& withOperation(const std::string& op) {
    operation = op;
    return *this;
  }
};

// Error with context and severity, used by the command-line layer
class ContextualError {
public:
  ContextualError(ErrorCode code, std::string message, ErrorSeverity severity = ErrorSeverity::kError)
    : code_(code), message_(std::move(message)), severity_(severity) {}

  ContextualError(ErrorCode code, std::string message, ErrorContext context, ErrorSeverity severity = ErrorSeverity::kError)
    : code_(code), message_(std::move(message)), context_(std::move(context)), severity_(severity) {}

  // Wraps a plain Error
  explicit ContextualError(const Error& error, ErrorContext context = {},
                           ErrorSeverity severity = ErrorSeverity::kError)
    : ContextualError(error.code(), error.message(), std::move(context), severity) {}

  ErrorCode code() const { return code_; }
  const std::string& message() const { return message_; }
  const std::optional<ErrorContext>& context() const { return context_; }
  ErrorSeverity severity() const { return severity_; }

  // Get full error description with context
  std::string fullDescription() const;

  // Check if the command can report and carry on
  bool isRecoverable() const;

private:
  ErrorCode code_;
  std::string message_;
  std::optional<ErrorContext> context_;
  ErrorSeverity severity_;
};

// Routes contextual errors to the installed logger and formats them for users
class ErrorHandler {
public:
  static ErrorHandler& instance();

  // Forward an error to the error logger, if any
  void report(const ContextualError& error);

  // Set error logging callback
  void setErrorLogger(std::function<void(const ContextualError&)> logger);

  // Format error for user display
  std::string formatUserError(const ContextualError& error, bool json_format = false) const;

private:
  ErrorHandler() = default;

  mutable std::mutex mutex_;
  std::function<void(const ContextualError&)> error_logger_;
};

std::string_view severityToString(ErrorSeverity severity);

// Helper for file operations
#define CARDLINK_FILE_ERROR_CONTEXT(path) \
  ::cardlink::util::ErrorContext{}.withFile(path).withOperation(__FUNCTION__)

}  // namespace cardlink::util
