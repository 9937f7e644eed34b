#pragma once

#include <string>

#include "cardlink/cli/application.hpp"

namespace cardlink::cli {

class BacklinksCommand : public Command {
public:
  explicit BacklinksCommand(Application& app);

  Result<int> execute(const GlobalOptions& options) override;
  std::string name() const override { return "backlinks"; }
  std::string description() const override { return "Show cards referencing a card"; }
  void setupCommand(CLI::App* cmd) override;

private:
  Application& app_;
  core::CardId card_id_ = 0;
};

} // namespace cardlink::cli
