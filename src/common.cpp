#include "cardlink/common.hpp"

#include <sstream>

namespace cardlink {

std::string_view errorCodeToString(ErrorCode code) {
  switch (code) {
    case ErrorCode::kSuccess:
      return "Success";
    case ErrorCode::kInvalidArgument:
      return "Invalid argument";
    case ErrorCode::kFileNotFound:
      return "File not found";
    case ErrorCode::kFileReadError:
      return "File read error";
    case ErrorCode::kFileWriteError:
      return "File write error";
    case ErrorCode::kDirectoryCreateError:
      return "Directory create error";
    case ErrorCode::kParseError:
      return "Parse error";
    case ErrorCode::kValidationError:
      return "Validation error";
    case ErrorCode::kInvalidReference:
      return "Invalid reference";
    case ErrorCode::kDatabaseError:
      return "Database error";
    case ErrorCode::kStoreError:
      return "Store error";
    case ErrorCode::kConfigError:
      return "Configuration error";
    case ErrorCode::kNotFound:
      return "Not found";
    case ErrorCode::kUnknownError:
      return "Unknown error";
  }
  return "Unknown error";
}

std::string Version::toString() const {
  std::ostringstream oss;
  oss << major << "." << minor << "." << patch;
  return oss.str();
}

Version getVersion() {
  return Version{CARDLINK_VERSION_MAJOR, CARDLINK_VERSION_MINOR, CARDLINK_VERSION_PATCH};
}

}  // namespace cardlink
