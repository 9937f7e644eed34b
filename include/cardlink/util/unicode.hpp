#pragma once

#include <string>
#include <string_view>

#include <unicode/uchar.h>

namespace cardlink::util {

// Unicode-aware whitespace helpers over UTF-8 text (ICU character properties).
// Invalid UTF-8 sequences are treated as non-whitespace and kept.

// True for code points with the White_Space property and for U+FEFF
bool isWhitespace(UChar32 codepoint) noexcept;

// Strips leading and trailing whitespace
std::string_view trim(std::string_view text) noexcept;

std::string trimmed(std::string_view text);

// True when the text is empty or whitespace only
bool isBlank(std::string_view text) noexcept;

// Decodes the code point starting at byte offset `pos` and advances `pos`
// past it. Returns a negative value for an invalid sequence (pos still advances).
UChar32 nextCodePoint(std::string_view text, size_t& pos) noexcept;

}  // namespace cardlink::util
