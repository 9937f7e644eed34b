#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace cardlink::tags {

// One #tag occurrence; [start, end) covers the '#' and the name in bytes
struct ContentTag {
  std::string name;
  size_t start = 0;
  size_t end = 0;

  bool operator==(const ContentTag& other) const = default;
};

/**
 * @brief Inline #tag syntax in card content
 *
 * A tag is '#' followed by characters that are neither whitespace nor one of
 * "#[](){}". The '#' must open a line or follow whitespace. "# Title" at the
 * start of a line is a Markdown heading and "##" never opens a tag. Code
 * blocks and inline code are skipped.
 */
class ContentTagParser {
 public:
  static constexpr size_t kMaxNameLength = 100;

  static std::vector<ContentTag> parse(std::string_view content);

  // Tag names in order of first occurrence, without duplicates
  static std::vector<std::string> uniqueNames(std::string_view content);

  /**
   * @brief Check whether a name may become a tag
   *
   * Rejects empty names, names longer than kMaxNameLength code points,
   * leading or trailing '/', "//" and a leading ASCII digit.
   */
  static bool isValidName(std::string_view name);
};

}  // namespace cardlink::tags
