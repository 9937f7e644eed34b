#include "cardlink/util/unicode.hpp"

#include <algorithm>
#include <cstdint>
#include <limits>

#include <unicode/utf8.h>

namespace cardlink::util {

bool isWhitespace(UChar32 codepoint) noexcept {
  if (codepoint < 0) {
    return false;
  }
  // The byte order mark is trimmed like whitespace
  return codepoint == 0xFEFF || u_isUWhiteSpace(codepoint);
}

UChar32 nextCodePoint(std::string_view text, size_t& pos) noexcept {
  if (pos >= text.size()) {
    return U_SENTINEL;
  }

  const char* start = text.data() + pos;
  auto remaining = std::min<size_t>(text.size() - pos, std::numeric_limits<int32_t>::max());
  int32_t idx = 0;
  int32_t len = static_cast<int32_t>(remaining);
  UChar32 codepoint = U_SENTINEL;

  U8_NEXT(start, idx, len, codepoint);

  pos += static_cast<size_t>(idx > 0 ? idx : 1);
  return codepoint;
}

std::string_view trim(std::string_view text) noexcept {
  size_t first = std::string_view::npos;
  size_t last = 0;
  size_t pos = 0;

  while (pos < text.size()) {
    size_t start = pos;
    UChar32 codepoint = nextCodePoint(text, pos);
    if (!isWhitespace(codepoint)) {
      if (first == std::string_view::npos) {
        first = start;
      }
      last = pos;
    }
  }

  if (first == std::string_view::npos) {
    return {};
  }
  return text.substr(first, last - first);
}

std::string trimmed(std::string_view text) {
  return std::string(trim(text));
}

bool isBlank(std::string_view text) noexcept {
  return trim(text).empty();
}

}  // namespace cardlink::util
