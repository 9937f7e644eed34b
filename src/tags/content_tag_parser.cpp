#include "cardlink/tags/content_tag_parser.hpp"

#include <unordered_set>

#include "cardlink/reference/code_ranges.hpp"
#include "cardlink/util/unicode.hpp"

namespace cardlink::tags {

namespace {

bool isNameTerminator(UChar32 codepoint) {
  switch (codepoint) {
    case '#':
    case '[':
    case ']':
    case '(':
    case ')':
    case '{':
    case '}':
      return true;
    default:
      return util::isWhitespace(codepoint);
  }
}

// Length in bytes of the tag name starting at `pos`
size_t nameLength(std::string_view line, size_t pos) {
  size_t end = pos;
  while (end < line.size()) {
    size_t next = end;
    UChar32 codepoint = util::nextCodePoint(line, next);
    if (isNameTerminator(codepoint)) {
      break;
    }
    end = next;
  }
  return end - pos;
}

void scanLine(std::string_view line, size_t offset, const reference::CodeRanges& code,
              std::vector<ContentTag>& tags) {
  bool line_start = true;           // Only whitespace seen so far
  bool after_whitespace = true;     // Previous code point was whitespace
  size_t pos = 0;

  while (pos < line.size()) {
    size_t hash = pos;
    UChar32 codepoint = util::nextCodePoint(line, pos);

    if (codepoint != '#') {
      bool space = util::isWhitespace(codepoint);
      after_whitespace = space;
      line_start = line_start && space;
      continue;
    }

    bool eligible = after_whitespace && !code.contains(offset + hash);
    bool heading = line_start && pos < line.size() && line[pos] == ' ';
    after_whitespace = false;
    line_start = false;

    if (!eligible || heading) {
      continue;
    }

    size_t length = nameLength(line, pos);
    if (length == 0) {
      continue;
    }

    ContentTag tag;
    tag.name = std::string(line.substr(pos, length));
    tag.start = offset + hash;
    tag.end = offset + pos + length;
    tags.push_back(std::move(tag));
  }
}

}  // namespace

std::vector<ContentTag> ContentTagParser::parse(std::string_view content) {
  std::vector<ContentTag> tags;
  if (content.find('#') == std::string_view::npos) {
    return tags;
  }

  auto code = reference::CodeRanges::scan(content);

  size_t offset = 0;
  while (offset <= content.size()) {
    size_t newline = content.find('\n', offset);
    size_t line_end = newline == std::string_view::npos ? content.size() : newline;
    scanLine(content.substr(offset, line_end - offset), offset, code, tags);
    if (newline == std::string_view::npos) {
      break;
    }
    offset = newline + 1;
  }
  return tags;
}

std::vector<std::string> ContentTagParser::uniqueNames(std::string_view content) {
  std::vector<std::string> names;
  std::unordered_set<std::string> seen;
  for (auto& tag : parse(content)) {
    if (seen.insert(tag.name).second) {
      names.push_back(std::move(tag.name));
    }
  }
  return names;
}

bool ContentTagParser::isValidName(std::string_view name) {
  if (name.empty()) {
    return false;
  }
  if (name.front() == '/' || name.back() == '/') {
    return false;
  }
  if (name.find("//") != std::string_view::npos) {
    return false;
  }
  // Avoids #1 style issue references
  if (name.front() >= '0' && name.front() <= '9') {
    return false;
  }

  size_t codepoints = 0;
  size_t pos = 0;
  while (pos < name.size()) {
    util::nextCodePoint(name, pos);
    if (++codepoints > kMaxNameLength) {
      return false;
    }
  }
  return true;
}

}  // namespace cardlink::tags
