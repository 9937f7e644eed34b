#pragma once

#include <string>

#include "cardlink/cli/application.hpp"

namespace cardlink::cli {

// Validates that text is already normalized
class CheckCommand : public Command {
public:
  CheckCommand() = default;

  Result<int> execute(const GlobalOptions& options) override;
  std::string name() const override { return "check"; }
  std::string description() const override { return "Check reference markup without changing it"; }
  void setupCommand(CLI::App* cmd) override;
  bool requiresWorkspace() const override { return false; }

private:
  std::string input_file_;
};

} // namespace cardlink::cli
