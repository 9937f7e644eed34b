#include "cardlink/cli/command_error_handler.hpp"

#include <nlohmann/json.hpp>

namespace cardlink::cli {

int CommandErrorHandler::handleCommandError(const util::ContextualError& error) {
  logError(error);

  auto& handler = util::ErrorHandler::instance();
  std::string formatted_error = handler.formatUserError(error, options_.json);

  if (options_.json) {
    std::cout << formatted_error << std::endl;
  } else {
    std::cerr << formatted_error << std::endl;
  }

  // Return appropriate exit code based on error severity
  switch (error.severity()) {
    case util::ErrorSeverity::kInfo:
    case util::ErrorSeverity::kWarning:
      return 0;
    case util::ErrorSeverity::kError:
      return 1;
    case util::ErrorSeverity::kCritical:
      return 2;
  }

  return 1;
}

int CommandErrorHandler::handleLegacyError(const Error& error, const std::string& operation) {
  auto ctx_error = convertLegacyError(error, operation);
  return handleCommandError(ctx_error);
}

util::ContextualError CommandErrorHandler::convertLegacyError(const Error& error, const std::string& operation) {
  util::ErrorContext context;
  if (!operation.empty()) {
    context.withOperation(operation);
  }

  util::ErrorSeverity severity = util::ErrorSeverity::kError;
  switch (error.code()) {
    case ErrorCode::kDatabaseError:
      severity = util::ErrorSeverity::kCritical;
      break;
    default:
      severity = util::ErrorSeverity::kError;
      break;
  }

  return util::ContextualError(error, context, severity);
}

void CommandErrorHandler::displayWarning(const std::string& message) {
  if (options_.json) {
    nlohmann::json warning_json;
    warning_json["warning"] = true;
    warning_json["message"] = message;
    std::cout << warning_json.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) << std::endl;
  } else {
    std::cerr << "\033[33m⚠\033[0m " << message << std::endl;
  }
}

void CommandErrorHandler::logError(const util::ContextualError& error) {
  util::ErrorHandler::instance().report(error);
}

} // namespace cardlink::cli
