#pragma once

#include <filesystem>
#include <string>

namespace cardlink::util {

// XDG Base Directory Specification utilities
class Xdg {
 public:
  // Get XDG data home directory (~/.local/share/cardlink)
  static std::filesystem::path dataHome();

  // Get XDG config home directory (~/.config/cardlink)
  static std::filesystem::path configHome();

  // Get config file path
  static std::filesystem::path configFile();

  // Get workspace database path
  static std::filesystem::path databaseFile();

  // Get log directory
  static std::filesystem::path logDir();

 private:
  // Get environment variable with default
  static std::string getEnvVar(const std::string& name, const std::string& default_value);
};

}  // namespace cardlink::util
