#include "cardlink/util/logging.hpp"

#include <algorithm>
#include <memory>
#include <vector>

#include <fmt/format.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "cardlink/util/filesystem.hpp"

namespace cardlink::util {

namespace {

constexpr size_t kMaxLogFileSize = 1024 * 1024 * 5;  // 5MB files
constexpr size_t kMaxLogFiles = 3;
constexpr const char* kLogPattern = "[%Y-%m-%d %H:%M:%S.%e] [%l] [%n] %v";

std::shared_ptr<spdlog::sinks::stderr_color_sink_mt>& consoleSink() {
  static std::shared_ptr<spdlog::sinks::stderr_color_sink_mt> sink;
  return sink;
}

}  // namespace

Result<void> setupLogging(const config::Config& config) {
  auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  console_sink->set_level(spdlog::level::warn);
  consoleSink() = console_sink;

  auto level = spdlog::level::from_str(config.logging.level);
  std::vector<spdlog::sink_ptr> sinks = {console_sink};
  Result<void> result;

  if (!config.logging.file.empty()) {
    auto log_dir = config.logging.file.parent_path();
    auto dir_result = log_dir.empty() ? Result<void>{} : FileSystem::createDirectories(log_dir);
    if (!dir_result.has_value()) {
      result = std::unexpected(dir_result.error());
    } else {
      try {
        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
          config.logging.file.string(), kMaxLogFileSize, kMaxLogFiles);
        file_sink->set_level(level);
        sinks.push_back(file_sink);
      } catch (const spdlog::spdlog_ex& e) {
        result = std::unexpected(makeError(ErrorCode::kFileWriteError,
                                           "Failed to setup file logging: " + std::string(e.what())));
      }
    }
  }

  auto logger = std::make_shared<spdlog::logger>("cardlink", sinks.begin(), sinks.end());
  logger->set_pattern(kLogPattern);
  logger->set_level(std::min(level, spdlog::level::warn));
  spdlog::set_default_logger(logger);

  ErrorHandler::instance().setErrorLogger(logContextualError);
  return result;
}

void setConsoleVerbosity(bool verbose, bool quiet) {
  auto& sink = consoleSink();
  if (!sink) {
    return;
  }
  if (quiet) {
    sink->set_level(spdlog::level::err);
  } else if (verbose) {
    sink->set_level(spdlog::level::debug);
    auto logger = spdlog::default_logger();
    if (logger->level() > spdlog::level::debug) {
      logger->set_level(spdlog::level::debug);
    }
  }
}

void logContextualError(const ContextualError& error) {
  std::string message = fmt::format("[{}] {}", error.isRecoverable() ? "recoverable" : "fatal",
                                    error.fullDescription());

  switch (error.severity()) {
    case ErrorSeverity::kInfo:
      spdlog::info(message);
      break;
    case ErrorSeverity::kWarning:
      spdlog::warn(message);
      break;
    case ErrorSeverity::kError:
      spdlog::error(message);
      break;
    case ErrorSeverity::kCritical:
      spdlog::critical(message);
      break;
  }
}

}  // namespace cardlink::util
