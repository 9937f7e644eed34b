#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "cardlink/common.hpp"

namespace cardlink::config {

// Configuration for the cardlink command-line front end
class Config {
 public:
  // Defaults only; nothing is read from disk
  Config();

  // Load from specific file, keeping defaults on failure
  explicit Config(const std::filesystem::path& config_path);

  // SQLite workspace
  std::filesystem::path database;

  // Logging configuration
  struct LoggingConfig {
    std::string level = "info";  // trace, debug, info, warn, error
    std::filesystem::path file;  // Rotating log file
  };
  LoggingConfig logging;

  // Synchronizer configuration
  struct SyncConfig {
    bool parallel = true;            // Dispatch write batches concurrently
    bool serialize_per_card = true;  // One run per card at a time
    bool content_tags = true;        // Also attach #tag names as user tags
  };
  SyncConfig sync;

  // Load configuration from file. A missing file leaves the defaults in place.
  Result<void> load(const std::filesystem::path& config_path);

  // Save configuration to file
  Result<void> save(const std::filesystem::path& config_path = {}) const;

  // Get/set configuration values by key (dot notation)
  Result<std::string> get(const std::string& key) const;
  Result<void> set(const std::string& key, const std::string& value);

  // Validate configuration
  Result<void> validate() const;

  // Get default config file path
  static std::filesystem::path defaultConfigPath();

  // Keys accepted by get/set
  static std::vector<std::string> keys();

  const std::filesystem::path& path() const { return config_path_; }

 private:
  std::filesystem::path config_path_;

  static Result<bool> parseBool(const std::string& key, const std::string& value);

  Result<std::string> getValueByPath(const std::vector<std::string>& path) const;
  Result<void> setValueByPath(const std::vector<std::string>& path, const std::string& value);
  std::vector<std::string> splitPath(const std::string& path) const;
};

}  // namespace cardlink::config
