#pragma once

#include <string>

#include "cardlink/cli/application.hpp"

namespace cardlink::cli {

// Synchronizes a card's backlink annotations (and #tags) with its text
class SyncCommand : public Command {
public:
  explicit SyncCommand(Application& app);

  Result<int> execute(const GlobalOptions& options) override;
  std::string name() const override { return "sync"; }
  std::string description() const override { return "Synchronize a card's references"; }
  void setupCommand(CLI::App* cmd) override;

private:
  Application& app_;
  core::CardId card_id_ = 0;
  std::string content_file_;  // Replaces the stored content when set ("-" for stdin)
  bool no_content_tags_ = false;
};

} // namespace cardlink::cli
