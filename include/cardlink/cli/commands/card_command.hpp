#pragma once

#include <optional>
#include <string>

#include "cardlink/cli/application.hpp"

namespace cardlink::cli {

/**
 * @brief Card management command
 *
 * Supports subcommands:
 * - add: Create a card
 * - list: List the cards of a project
 * - show: Print a card with its content
 */
class CardCommand : public Command {
public:
  explicit CardCommand(Application& app);

  Result<int> execute(const GlobalOptions& options) override;
  std::string name() const override { return "card"; }
  std::string description() const override { return "Manage cards"; }
  void setupCommand(CLI::App* cmd) override;

private:
  Application& app_;

  enum class SubCommand {
    Add,
    List,
    Show
  };

  SubCommand sub_command_ = SubCommand::List;

  // Command-specific options
  core::ProjectId project_id_ = 0;
  core::CardId card_id_ = 0;
  std::string title_;
  std::string summary_;
  std::string content_file_;

  Result<int> executeAdd(const GlobalOptions& options);
  Result<int> executeList(const GlobalOptions& options);
  Result<int> executeShow(const GlobalOptions& options);
};

} // namespace cardlink::cli
