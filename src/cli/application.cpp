#include "cardlink/cli/application.hpp"

#include <iostream>
#include <stdexcept>

#include "cardlink/cli/command_error_handler.hpp"
#include "cardlink/util/logging.hpp"

// Command includes
#include "cardlink/cli/commands/backlinks_command.hpp"
#include "cardlink/cli/commands/card_command.hpp"
#include "cardlink/cli/commands/check_command.hpp"
#include "cardlink/cli/commands/config_command.hpp"
#include "cardlink/cli/commands/normalize_command.hpp"
#include "cardlink/cli/commands/sync_command.hpp"

namespace cardlink::cli {

Application::Application()
    : app_("cardlink", "Card reference annotation and synchronization") {

  app_.set_version_flag("--version", cardlink::getVersion().toString());
  app_.set_help_all_flag("--help-all", "Expand all help");
  app_.require_subcommand(1);

  setupGlobalOptions();
  setupCommands();
  setupHelp();
}

int Application::run(int argc, char* argv[]) {
  try {
    app_.parse(argc, argv);
  } catch (const CLI::ParseError& e) {
    return app_.exit(e);
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }

  // The command has already been executed by CLI11's callback system
  return 0;
}

Result<void> Application::initialize(bool open_workspace) {
  if (!config_) {
    auto config_result = loadConfig();
    if (!config_result.has_value()) {
      return config_result;
    }
  }

  if (open_workspace && !store_) {
    return openWorkspace();
  }
  return {};
}

void Application::setupGlobalOptions() {
  app_.add_flag("--json", global_options_.json, "Output in JSON format");
  app_.add_flag("-v,--verbose", global_options_.verbose, "Verbose output");
  app_.add_flag("-q,--quiet", global_options_.quiet, "Suppress normal output");
  app_.add_option("--config", global_options_.config_file, "Path to config file");
  app_.add_option("--db", global_options_.db_path, "Override workspace database");
}

void Application::setupCommands() {
  // Workspace commands
  registerCommand(std::make_unique<CardCommand>(*this));
  registerCommand(std::make_unique<SyncCommand>(*this));
  registerCommand(std::make_unique<BacklinksCommand>(*this));

  // Text commands
  registerCommand(std::make_unique<NormalizeCommand>());
  registerCommand(std::make_unique<CheckCommand>());

  // Configuration management
  registerCommand(std::make_unique<ConfigCommand>(*this));
}

void Application::setupHelp() {
  app_.get_formatter()->column_width(40);

  app_.footer(R"(Examples:
  cardlink card add --project 1 --title "Parser notes" --file notes.md
  cardlink sync 42
  cardlink backlinks 7 --json
  cardlink normalize draft.md --in-place
  cardlink check draft.md

For more information on a specific command, run:
  cardlink <command> --help)");
}

void Application::registerCommand(std::unique_ptr<Command> command) {
  auto* cmd_ptr = command.get();

  auto* sub = app_.add_subcommand(cmd_ptr->name(), cmd_ptr->description());

  cmd_ptr->setupCommand(sub);

  sub->callback([this, cmd_ptr]() {
    CommandErrorHandler error_handler(global_options_);

    auto init_result = initialize(cmd_ptr->requiresWorkspace());
    if (!init_result.has_value()) {
      int code = error_handler.handleLegacyError(init_result.error(), "initialize");
      throw CLI::RuntimeError(code == 0 ? 1 : code);
    }

    auto result = cmd_ptr->execute(global_options_);
    if (!result.has_value()) {
      int code = error_handler.handleLegacyError(result.error(), cmd_ptr->name());
      if (code != 0) {
        throw CLI::RuntimeError(code);
      }
      return;
    }
    if (*result != 0) {
      throw CLI::RuntimeError(*result);
    }
  });

  commands_.push_back(std::move(command));
}

Result<void> Application::loadConfig() {
  std::filesystem::path config_path = global_options_.config_file.empty()
      ? config::Config::defaultConfigPath()
      : std::filesystem::path(global_options_.config_file);

  if (!global_options_.config_file.empty() && !std::filesystem::exists(config_path)) {
    return std::unexpected(makeError(ErrorCode::kFileNotFound,
                                     "Config file not found: " + config_path.string()));
  }

  auto config = std::make_unique<config::Config>();
  auto load_result = config->load(config_path);
  if (!load_result.has_value()) {
    return load_result;
  }

  // Command line overrides
  if (!global_options_.db_path.empty()) {
    config->database = global_options_.db_path;
  }

  auto validate_result = config->validate();
  if (!validate_result.has_value()) {
    return validate_result;
  }

  auto logging_result = util::setupLogging(*config);
  if (!logging_result.has_value()) {
    // Stderr logging is still installed
    util::ErrorHandler::instance().report(util::ContextualError(
        logging_result.error(), CARDLINK_FILE_ERROR_CONTEXT(config->logging.file.string()),
        util::ErrorSeverity::kWarning));
  }
  util::setConsoleVerbosity(global_options_.verbose > 0, global_options_.quiet);

  config_ = std::move(config);
  return {};
}

Result<void> Application::openWorkspace() {
  auto store = std::make_unique<store::SqliteStore>(config_->database);
  auto init_result = store->initialize();
  if (!init_result.has_value()) {
    return init_result;
  }
  store_ = std::move(store);
  return {};
}

const GlobalOptions& Application::globalOptions() const {
  return global_options_;
}

config::Config& Application::config() {
  if (!config_) {
    throw std::runtime_error("Services not initialized");
  }
  return *config_;
}

store::SqliteStore& Application::store() {
  if (!store_) {
    throw std::runtime_error("Workspace not opened");
  }
  return *store_;
}

} // namespace cardlink::cli
