#pragma once

#include <cstddef>
#include <string_view>
#include <vector>

namespace cardlink::reference {

// Half-open byte range [start, end)
struct TextRange {
  size_t start = 0;
  size_t end = 0;

  bool contains(size_t pos) const noexcept { return pos >= start && pos < end; }
  bool overlaps(size_t other_start, size_t other_end) const noexcept {
    return other_start < end && start < other_end;
  }
};

// Regions of Markdown text that are never scanned for references or tags:
// fenced blocks (```...```) and single-line inline code spans (`...`).
// An unterminated fence does not open a range.
class CodeRanges {
 public:
  static CodeRanges scan(std::string_view text);

  bool contains(size_t pos) const noexcept;
  bool overlaps(size_t start, size_t end) const noexcept;

  const std::vector<TextRange>& ranges() const noexcept { return ranges_; }
  bool empty() const noexcept { return ranges_.empty(); }

 private:
  std::vector<TextRange> ranges_;
};

}  // namespace cardlink::reference
