#include "cardlink/reference/reference_parser.hpp"

#include <unordered_set>

#include "cardlink/core/ref_id.hpp"
#include "cardlink/reference/code_ranges.hpp"
#include "cardlink/util/unicode.hpp"

namespace cardlink::reference {

namespace {

constexpr std::string_view kOpen = "[[";

struct CommentMatch {
  size_t start = 0;
  size_t end = 0;
  std::string_view ref_id;
};

struct ReferenceMatch {
  size_t start = 0;
  size_t end = 0;
  std::string_view title;
  std::string_view placeholder;
  std::optional<std::string_view> ref_id;
};

// <!--ref:ID--> at exactly `pos`. The id alphabet contains '-', so the id is
// the longest run of id characters that still leaves "-->" to close the comment.
std::optional<CommentMatch> matchComment(std::string_view text, size_t pos) {
  const auto prefix = ReferenceParser::kCommentPrefix;
  if (text.substr(pos, prefix.size()) != prefix) {
    return std::nullopt;
  }

  size_t id_start = pos + prefix.size();
  size_t end = id_start;
  while (end < text.size() && core::RefId::isIdChar(text[end])) {
    ++end;
  }

  if (end >= text.size() || text[end] != '>' || end < id_start + 3) {
    return std::nullopt;
  }
  if (text[end - 1] != '-' || text[end - 2] != '-') {
    return std::nullopt;
  }

  return CommentMatch{pos, end + 1, text.substr(id_start, end - 2 - id_start)};
}

// [[TITLE]](PLACEHOLDER) with an optional adjacent comment, at exactly `pos`.
// TITLE has no ']' and is not empty; PLACEHOLDER has no ')'.
std::optional<ReferenceMatch> matchReference(std::string_view text, size_t pos) {
  if (text.substr(pos, kOpen.size()) != kOpen) {
    return std::nullopt;
  }

  size_t title_start = pos + kOpen.size();
  size_t title_end = text.find(']', title_start);
  if (title_end == std::string_view::npos || title_end == title_start) {
    return std::nullopt;
  }
  if (title_end + 2 >= text.size() || text[title_end + 1] != ']' || text[title_end + 2] != '(') {
    return std::nullopt;
  }

  size_t placeholder_start = title_end + 3;
  size_t placeholder_end = text.find(')', placeholder_start);
  if (placeholder_end == std::string_view::npos) {
    return std::nullopt;
  }

  ReferenceMatch match;
  match.start = pos;
  match.end = placeholder_end + 1;
  match.title = text.substr(title_start, title_end - title_start);
  match.placeholder = text.substr(placeholder_start, placeholder_end - placeholder_start);

  if (auto comment = matchComment(text, match.end)) {
    match.ref_id = comment->ref_id;
    match.end = comment->end;
  }
  return match;
}

std::string uniqueRefId(std::unordered_set<std::string>& known_ids) {
  auto id = core::RefId::generate();
  while (!known_ids.insert(id).second) {
    id = core::RefId::generate();
  }
  return id;
}

Error invalidReference(std::string_view message) {
  return makeError(ErrorCode::kInvalidReference, std::string(message));
}

struct Pass {
  ParseResult result;
  std::vector<TextRange> orphans;
};

Result<Pass> runPass(std::string_view text, bool allow_insert) {
  const auto code = CodeRanges::scan(text);
  std::unordered_set<std::string> known_ids;
  if (allow_insert) {
    for (auto& id : ReferenceParser::collectRefIds(text)) {
      known_ids.insert(std::move(id));
    }
  }

  Pass pass;
  std::string& out = pass.result.text;
  out.reserve(text.size());

  // Offsets in `out` where a token's own comment begins
  std::unordered_set<size_t> token_comments;

  size_t copied = 0;
  size_t pos = 0;
  while (true) {
    size_t candidate = text.find(kOpen, pos);
    if (candidate == std::string_view::npos) {
      break;
    }

    auto match = matchReference(text, candidate);
    if (!match || code.overlaps(match->start, match->end)) {
      pos = candidate + 1;
      continue;
    }

    auto title = util::trim(match->title);
    if (title.empty()) {
      pos = candidate + 1;
      continue;
    }

    std::string ref_id;
    if (match->ref_id) {
      ref_id = std::string(*match->ref_id);
    } else if (!allow_insert) {
      return std::unexpected(invalidReference(ReferenceParser::kMissingRefIdMessage));
    } else {
      ref_id = uniqueRefId(known_ids);
    }

    out.append(text.substr(copied, match->start - copied));

    ReferenceToken token;
    token.title = std::string(title);
    token.placeholder = std::string(match->placeholder);
    token.ref_id = std::move(ref_id);
    token.index = out.size();
    token.raw = ReferenceParser::formatToken(token.title, token.placeholder, token.ref_id);

    size_t comment_length = ReferenceParser::kCommentPrefix.size() + token.ref_id.size() +
                            ReferenceParser::kCommentSuffix.size();
    token_comments.insert(out.size() + token.raw.size() - comment_length);

    out += token.raw;
    pass.result.tokens.push_back(std::move(token));

    copied = match->end;
    pos = match->end;
  }
  out.append(text.substr(copied));

  const auto out_code = CodeRanges::scan(out);
  pos = 0;
  while (true) {
    size_t candidate = out.find(ReferenceParser::kCommentPrefix, pos);
    if (candidate == std::string::npos) {
      break;
    }

    auto comment = matchComment(out, candidate);
    if (!comment || out_code.overlaps(comment->start, comment->end)) {
      pos = candidate + 1;
      continue;
    }
    if (token_comments.count(candidate) == 0) {
      if (!allow_insert) {
        return std::unexpected(invalidReference(ReferenceParser::kOrphanCommentMessage));
      }
      pass.orphans.push_back({comment->start, comment->end});
    }
    pos = comment->end;
  }

  return pass;
}

std::string stripRanges(const std::string& text, const std::vector<TextRange>& ranges) {
  std::string out;
  out.reserve(text.size());
  size_t copied = 0;
  for (const auto& range : ranges) {
    out.append(text, copied, range.start - copied);
    copied = range.end;
  }
  out.append(text, copied, std::string::npos);
  return out;
}

}  // namespace

Result<ParseResult> ReferenceParser::parse(std::string_view text, bool allow_insert) {
  std::string current(text);

  // Removing an orphan can change what surrounds it (a comment inside a
  // placeholder, or two halves joining into a new comment), so repair runs
  // until a pass finds nothing to strip. Every pass shortens the text.
  while (true) {
    auto pass = runPass(current, allow_insert);
    if (!pass.has_value()) {
      return std::unexpected(pass.error());
    }
    if (pass->orphans.empty()) {
      return std::move(pass->result);
    }
    current = stripRanges(pass->result.text, pass->orphans);
  }
}

Result<void> ReferenceParser::assertInvariant(std::string_view text) {
  auto result = parse(text, false);
  if (!result.has_value()) {
    return std::unexpected(result.error());
  }
  return {};
}

std::string ReferenceParser::formatToken(std::string_view title, std::string_view placeholder,
                                         std::string_view ref_id) {
  std::string raw;
  raw.reserve(title.size() + placeholder.size() + ref_id.size() + 20);
  raw += "[[";
  raw += title;
  raw += "]](";
  raw += placeholder;
  raw += ")";
  raw += kCommentPrefix;
  raw += ref_id;
  raw += kCommentSuffix;
  return raw;
}

std::vector<std::string> ReferenceParser::collectRefIds(std::string_view text) {
  std::vector<std::string> ids;
  size_t pos = 0;
  while (true) {
    size_t candidate = text.find(kCommentPrefix, pos);
    if (candidate == std::string_view::npos) {
      break;
    }
    if (auto comment = matchComment(text, candidate)) {
      ids.emplace_back(comment->ref_id);
      pos = comment->end;
    } else {
      pos = candidate + 1;
    }
  }
  return ids;
}

}  // namespace cardlink::reference
