#include "cardlink/config/config.hpp"

#include <array>
#include <sstream>

#include <toml++/toml.hpp>

#include "cardlink/util/filesystem.hpp"
#include "cardlink/util/xdg.hpp"

namespace cardlink::config {

namespace {

constexpr std::array<std::string_view, 5> kLogLevels = {"trace", "debug", "info", "warn", "error"};

std::string boolToString(bool value) {
  return value ? "true" : "false";
}

}  // namespace

Config::Config() {
  database = cardlink::util::Xdg::databaseFile();
  logging.file = cardlink::util::Xdg::logDir() / "cardlink.log";
}

Config::Config(const std::filesystem::path& config_path) : Config() {
  auto result = load(config_path);
  if (!result.has_value()) {
    // Unreadable config, continue with defaults
    config_path_ = config_path;
  }
}

Result<void> Config::load(const std::filesystem::path& config_path) {
  config_path_ = config_path;

  if (!std::filesystem::exists(config_path)) {
    return {};
  }

  try {
    auto config_data = toml::parse_file(config_path.string());

    if (auto value = config_data["database"].value<std::string>()) {
      database = *value;
    }

    // Logging
    if (auto logging_table = config_data["logging"].as_table()) {
      if (auto value = (*logging_table)["level"].value<std::string>()) {
        logging.level = *value;
      }
      if (auto value = (*logging_table)["file"].value<std::string>()) {
        logging.file = *value;
      }
    }

    // Sync
    if (auto sync_table = config_data["sync"].as_table()) {
      if (auto value = (*sync_table)["parallel"].value<bool>()) {
        sync.parallel = *value;
      }
      if (auto value = (*sync_table)["serialize_per_card"].value<bool>()) {
        sync.serialize_per_card = *value;
      }
      if (auto value = (*sync_table)["content_tags"].value<bool>()) {
        sync.content_tags = *value;
      }
    }

    return {};

  } catch (const toml::parse_error& e) {
    std::ostringstream message;
    message << "Config parse error in " << config_path.string() << ": " << e.description()
            << " (line " << e.source().begin.line << ")";
    return std::unexpected(makeError(ErrorCode::kConfigError, message.str()));
  }
}

Result<void> Config::save(const std::filesystem::path& config_path) const {
  std::filesystem::path save_path = config_path.empty() ? config_path_ : config_path;

  if (save_path.empty()) {
    save_path = defaultConfigPath();
  }

  try {
    toml::table config_data;

    if (!database.empty()) config_data.insert_or_assign("database", database.string());

    auto logging_table = toml::table{};
    logging_table.insert_or_assign("level", logging.level);
    if (!logging.file.empty()) logging_table.insert_or_assign("file", logging.file.string());
    config_data.insert_or_assign("logging", logging_table);

    auto sync_table = toml::table{};
    sync_table.insert_or_assign("parallel", sync.parallel);
    sync_table.insert_or_assign("serialize_per_card", sync.serialize_per_card);
    sync_table.insert_or_assign("content_tags", sync.content_tags);
    config_data.insert_or_assign("sync", sync_table);

    std::stringstream ss;
    ss << config_data;
    auto write_result = cardlink::util::FileSystem::writeFileAtomic(save_path, ss.str());
    if (!write_result.has_value()) {
      return std::unexpected(makeError(ErrorCode::kConfigError,
                                       "Cannot write config file: " + write_result.error().message()));
    }

    return {};

  } catch (const std::exception& e) {
    return std::unexpected(makeError(ErrorCode::kConfigError,
                                     "Config save error: " + std::string(e.what())));
  }
}

Result<std::string> Config::get(const std::string& key) const {
  auto path = splitPath(key);
  return getValueByPath(path);
}

Result<void> Config::set(const std::string& key, const std::string& value) {
  auto path = splitPath(key);
  return setValueByPath(path, value);
}

Result<void> Config::validate() const {
  if (database.empty()) {
    return std::unexpected(makeError(ErrorCode::kConfigError, "Database path is empty"));
  }

  bool known_level = false;
  for (auto level : kLogLevels) {
    known_level = known_level || logging.level == level;
  }
  if (!known_level) {
    return std::unexpected(makeError(ErrorCode::kConfigError,
                                     "Invalid logging level: " + logging.level));
  }

  return {};
}

std::filesystem::path Config::defaultConfigPath() {
  return cardlink::util::Xdg::configFile();
}

std::vector<std::string> Config::keys() {
  return {"database", "logging.level", "logging.file", "sync.parallel",
          "sync.serialize_per_card", "sync.content_tags"};
}

Result<bool> Config::parseBool(const std::string& key, const std::string& value) {
  if (value == "true" || value == "1" || value == "yes") return true;
  if (value == "false" || value == "0" || value == "no") return false;
  return std::unexpected(makeError(ErrorCode::kConfigError,
                                   "Expected a boolean for " + key + ": " + value));
}

Result<std::string> Config::getValueByPath(const std::vector<std::string>& path) const {
  if (path.empty()) {
    return std::unexpected(makeError(ErrorCode::kConfigError, "Empty config path"));
  }

  if (path.size() == 1) {
    if (path[0] == "database") return database.string();
  } else if (path.size() == 2) {
    if (path[0] == "logging") {
      if (path[1] == "level") return logging.level;
      if (path[1] == "file") return logging.file.string();
    } else if (path[0] == "sync") {
      if (path[1] == "parallel") return boolToString(sync.parallel);
      if (path[1] == "serialize_per_card") return boolToString(sync.serialize_per_card);
      if (path[1] == "content_tags") return boolToString(sync.content_tags);
    }
  }

  return std::unexpected(makeError(ErrorCode::kConfigError,
                                   "Unknown config key: " + path[0]));
}

Result<void> Config::setValueByPath(const std::vector<std::string>& path, const std::string& value) {
  if (path.empty()) {
    return std::unexpected(makeError(ErrorCode::kConfigError, "Empty config path"));
  }

  if (path.size() == 1) {
    if (path[0] == "database") { database = value; return {}; }
  } else if (path.size() == 2) {
    if (path[0] == "logging") {
      if (path[1] == "level") { logging.level = value; return {}; }
      if (path[1] == "file") { logging.file = value; return {}; }
    } else if (path[0] == "sync") {
      bool* target = nullptr;
      if (path[1] == "parallel") target = &sync.parallel;
      if (path[1] == "serialize_per_card") target = &sync.serialize_per_card;
      if (path[1] == "content_tags") target = &sync.content_tags;
      if (target != nullptr) {
        auto parsed = parseBool(path[0] + "." + path[1], value);
        if (!parsed.has_value()) {
          return std::unexpected(parsed.error());
        }
        *target = *parsed;
        return {};
      }
    }
  }

  return std::unexpected(makeError(ErrorCode::kConfigError,
                                   "Unknown config key: " + path[0]));
}

std::vector<std::string> Config::splitPath(const std::string& path) const {
  std::vector<std::string> parts;
  std::istringstream stream(path);
  std::string part;

  while (std::getline(stream, part, '.')) {
    if (!part.empty()) {
      parts.push_back(part);
    }
  }

  return parts;
}

}  // namespace cardlink::config
