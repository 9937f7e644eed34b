#pragma once

#include <string>

#include "cardlink/cli/application.hpp"

namespace cardlink::cli {

/**
 * @brief Configuration command
 *
 * Supports subcommands:
 * - get: Print one value
 * - set: Change one value and save the file
 * - list: Print every value
 * - path: Print the config file location
 */
class ConfigCommand : public Command {
public:
  explicit ConfigCommand(Application& app);

  Result<int> execute(const GlobalOptions& options) override;
  std::string name() const override { return "config"; }
  std::string description() const override { return "Show or change configuration"; }
  void setupCommand(CLI::App* cmd) override;
  bool requiresWorkspace() const override { return false; }

private:
  Application& app_;

  enum class SubCommand {
    Get,
    Set,
    List,
    Path
  };

  SubCommand sub_command_ = SubCommand::List;
  std::string key_;
  std::string value_;

  Result<int> executeGet(const GlobalOptions& options);
  Result<int> executeSet(const GlobalOptions& options);
  Result<int> executeList(const GlobalOptions& options);
  Result<int> executePath(const GlobalOptions& options);
};

} // namespace cardlink::cli
