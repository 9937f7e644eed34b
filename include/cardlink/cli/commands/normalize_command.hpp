#pragma once

#include <string>

#include "cardlink/cli/application.hpp"

namespace cardlink::cli {

// Repairs reference markup in a file or stdin and prints the result
class NormalizeCommand : public Command {
public:
  NormalizeCommand() = default;

  Result<int> execute(const GlobalOptions& options) override;
  std::string name() const override { return "normalize"; }
  std::string description() const override { return "Normalize reference markup"; }
  void setupCommand(CLI::App* cmd) override;
  bool requiresWorkspace() const override { return false; }

private:
  std::string input_file_;
  bool in_place_ = false;
};

} // namespace cardlink::cli
