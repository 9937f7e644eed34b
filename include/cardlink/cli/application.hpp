#pragma once

#include <memory>
#include <string>
#include <vector>

#include <CLI/CLI.hpp>

#include "cardlink/common.hpp"
#include "cardlink/config/config.hpp"
#include "cardlink/store/sqlite_store.hpp"

namespace cardlink::cli {

/**
 * @brief Global CLI options that are available to all commands
 */
struct GlobalOptions {
  bool json = false;           // --json: Output in JSON format
  int verbose = 0;             // --verbose: Verbose output level (can be repeated: -v, -vv)
  bool quiet = false;          // --quiet: Suppress normal output
  std::string config_file;     // --config: Path to config file
  std::string db_path;         // --db: Override workspace database
};

/**
 * @brief Base class for all CLI commands
 */
class Command {
public:
  virtual ~Command() = default;

  /**
   * @brief Execute the command with the given arguments
   * @param options Global CLI options
   * @return Result with exit code (0 = success)
   */
  virtual Result<int> execute(const GlobalOptions& options) = 0;

  virtual std::string name() const = 0;
  virtual std::string description() const = 0;

  /**
   * @brief Setup command-specific CLI options (optional override)
   */
  virtual void setupCommand(CLI::App* cmd) { (void)cmd; }

  // Commands that only transform text run without opening the workspace
  virtual bool requiresWorkspace() const { return true; }
};

/**
 * @brief Main CLI application
 */
class Application {
public:
  Application();
  ~Application() = default;

  /**
   * @brief Run the application with command line arguments
   * @return Exit code (0 = success)
   */
  int run(int argc, char* argv[]);

  /**
   * @brief Load configuration, set up logging and optionally open the workspace
   */
  Result<void> initialize(bool open_workspace = true);

  // Service accessors for commands
  const GlobalOptions& globalOptions() const;
  config::Config& config();
  store::SqliteStore& store();

private:
  // Setup methods
  void setupGlobalOptions();
  void setupCommands();
  void setupHelp();

  // Command registration
  void registerCommand(std::unique_ptr<Command> command);

  Result<void> loadConfig();
  Result<void> openWorkspace();

  // CLI framework
  CLI::App app_;
  GlobalOptions global_options_;

  std::unique_ptr<config::Config> config_;
  std::unique_ptr<store::SqliteStore> store_;

  // Registered commands
  std::vector<std::unique_ptr<Command>> commands_;
};

} // namespace cardlink::cli
