#pragma once

#include <chrono>
#include <string>
#include <string_view>

namespace cardlink::core {

// Reference occurrence identifiers.
// A generated id is the base-36 millisecond timestamp followed by 6 random
// base-36 characters, so ids sort by creation time. Ids read back from text
// only need to match [A-Za-z0-9_-]+.
class RefId {
 public:
  // Create new id with current timestamp
  static std::string generate();

  // Create id with specific timestamp
  static std::string generate(std::chrono::system_clock::time_point timestamp);

  // Check the characters allowed inside <!--ref:...-->
  static bool isValid(std::string_view id) noexcept;

  static bool isIdChar(char c) noexcept;

  static constexpr size_t kRandomLength = 6;
};

}  // namespace cardlink::core
