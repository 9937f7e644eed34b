#pragma once

#include <iostream>
#include <string>

#include "cardlink/cli/application.hpp"
#include "cardlink/util/error_handler.hpp"

namespace cardlink::cli {

// Command-specific error handler that formats errors for CLI output
class CommandErrorHandler {
public:
  explicit CommandErrorHandler(const GlobalOptions& options) : options_(options) {}

  // Handle and display command errors, returns the exit code
  int handleCommandError(const util::ContextualError& error);

  // Handle and display plain errors
  int handleLegacyError(const Error& error, const std::string& operation = "");

  // Convert plain error to contextual error
  util::ContextualError convertLegacyError(const Error& error, const std::string& operation = "");

  // Display warning
  void displayWarning(const std::string& message);

private:
  const GlobalOptions& options_;

  void logError(const util::ContextualError& error);
};

} // namespace cardlink::cli
