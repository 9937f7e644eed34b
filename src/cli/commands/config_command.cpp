#include "cardlink/cli/commands/config_command.hpp"

#include <iostream>

#include <nlohmann/json.hpp>

namespace cardlink::cli {

ConfigCommand::ConfigCommand(Application& app) : app_(app) {
}

Result<int> ConfigCommand::execute(const GlobalOptions& options) {
  switch (sub_command_) {
    case SubCommand::Get:
      return executeGet(options);
    case SubCommand::Set:
      return executeSet(options);
    case SubCommand::List:
      return executeList(options);
    case SubCommand::Path:
      return executePath(options);
  }
  return std::unexpected(makeError(ErrorCode::kInvalidArgument, "Invalid subcommand"));
}

void ConfigCommand::setupCommand(CLI::App* cmd) {
  auto get_cmd = cmd->add_subcommand("get", "Print one configuration value");
  get_cmd->add_option("key", key_, "Key in dot notation (e.g. sync.parallel)")->required();
  get_cmd->callback([this]() { sub_command_ = SubCommand::Get; });

  auto set_cmd = cmd->add_subcommand("set", "Change one configuration value");
  set_cmd->add_option("key", key_, "Key in dot notation (e.g. logging.level)")->required();
  set_cmd->add_option("value", value_, "New value")->required();
  set_cmd->callback([this]() { sub_command_ = SubCommand::Set; });

  auto list_cmd = cmd->add_subcommand("list", "Print all configuration values");
  list_cmd->callback([this]() { sub_command_ = SubCommand::List; });

  auto path_cmd = cmd->add_subcommand("path", "Print the configuration file path");
  path_cmd->callback([this]() { sub_command_ = SubCommand::Path; });

  cmd->require_subcommand(1, 1);
}

Result<int> ConfigCommand::executeGet(const GlobalOptions& options) {
  auto value = app_.config().get(key_);
  if (!value.has_value()) {
    return std::unexpected(value.error());
  }

  if (options.json) {
    nlohmann::json output = {{"key", key_}, {"value", *value}};
    std::cout << output.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) << std::endl;
  } else {
    std::cout << *value << std::endl;
  }
  return 0;
}

Result<int> ConfigCommand::executeSet(const GlobalOptions& options) {
  // Edit the file contents without the command line overrides
  auto path = app_.config().path().empty() ? config::Config::defaultConfigPath()
                                           : app_.config().path();
  config::Config file_config;
  auto loaded = file_config.load(path);
  if (!loaded.has_value()) {
    return std::unexpected(loaded.error());
  }

  auto set_result = file_config.set(key_, value_);
  if (!set_result.has_value()) {
    return std::unexpected(set_result.error());
  }

  auto validate_result = file_config.validate();
  if (!validate_result.has_value()) {
    return std::unexpected(validate_result.error());
  }

  auto save_result = file_config.save(path);
  if (!save_result.has_value()) {
    return std::unexpected(save_result.error());
  }

  if (options.json) {
    nlohmann::json output = {{"success", true}, {"key", key_}, {"value", value_}};
    std::cout << output.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) << std::endl;
  } else if (!options.quiet) {
    std::cout << "Set " << key_ << " = " << value_ << std::endl;
  }
  return 0;
}

Result<int> ConfigCommand::executeList(const GlobalOptions& options) {
  const auto& config = app_.config();
  nlohmann::json output = nlohmann::json::object();

  for (const auto& key : config::Config::keys()) {
    auto value = config.get(key);
    if (!value.has_value()) {
      return std::unexpected(value.error());
    }
    if (options.json) {
      output[key] = *value;
    } else {
      std::cout << key << " = " << *value << std::endl;
    }
  }

  if (options.json) {
    std::cout << output.dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << std::endl;
  }
  return 0;
}

Result<int> ConfigCommand::executePath(const GlobalOptions& options) {
  auto path = app_.config().path().empty() ? config::Config::defaultConfigPath()
                                           : app_.config().path();
  if (options.json) {
    nlohmann::json output = {{"path", path.string()}, {"exists", std::filesystem::exists(path)}};
    std::cout << output.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) << std::endl;
  } else {
    std::cout << path.string() << std::endl;
  }
  return 0;
}

} // namespace cardlink::cli
