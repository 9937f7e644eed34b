#include "cardlink/reference/code_ranges.hpp"

#include <algorithm>

namespace cardlink::reference {

namespace {

constexpr std::string_view kFence = "```";

void scanFences(std::string_view text, std::vector<TextRange>& ranges) {
  size_t pos = 0;
  while (pos < text.size()) {
    size_t open = text.find(kFence, pos);
    if (open == std::string_view::npos) {
      break;
    }
    size_t close = text.find(kFence, open + kFence.size());
    if (close == std::string_view::npos) {
      break;
    }
    ranges.push_back({open, close + kFence.size()});
    pos = close + kFence.size();
  }
}

// A span opens on a backtick not preceded by another backtick, holds at least
// one character that is neither a backtick nor a newline, and closes on a
// backtick not followed by another backtick.
void scanInlineSpans(std::string_view text, std::vector<TextRange>& ranges) {
  size_t i = 0;
  while (i < text.size()) {
    if (text[i] != '`' || (i > 0 && text[i - 1] == '`')) {
      ++i;
      continue;
    }

    size_t j = i + 1;
    while (j < text.size() && text[j] != '`' && text[j] != '\n') {
      ++j;
    }

    bool closed = j > i + 1 && j < text.size() && text[j] == '`' &&
                  !(j + 1 < text.size() && text[j + 1] == '`');
    if (closed) {
      ranges.push_back({i, j + 1});
      i = j + 1;
    } else {
      ++i;
    }
  }
}

}  // namespace

CodeRanges CodeRanges::scan(std::string_view text) {
  CodeRanges result;
  if (text.find('`') == std::string_view::npos) {
    return result;
  }

  scanFences(text, result.ranges_);
  scanInlineSpans(text, result.ranges_);

  std::sort(result.ranges_.begin(), result.ranges_.end(),
            [](const TextRange& a, const TextRange& b) { return a.start < b.start; });
  return result;
}

bool CodeRanges::contains(size_t pos) const noexcept {
  return std::any_of(ranges_.begin(), ranges_.end(),
                     [pos](const TextRange& r) { return r.contains(pos); });
}

bool CodeRanges::overlaps(size_t start, size_t end) const noexcept {
  return std::any_of(ranges_.begin(), ranges_.end(),
                     [start, end](const TextRange& r) { return r.overlaps(start, end); });
}

}  // namespace cardlink::reference
