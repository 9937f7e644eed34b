#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "cardlink/common.hpp"

namespace cardlink::reference {

// One occurrence of [[title]](placeholder)<!--ref:id--> in card text
struct ReferenceToken {
  std::string title;        // Trimmed target title
  std::string placeholder;  // Visible label, kept verbatim
  std::string ref_id;
  size_t index = 0;         // Byte offset in the normalized text
  std::string raw;          // Normalized token text

  bool operator==(const ReferenceToken& other) const = default;
};

struct ParseResult {
  std::string text;
  std::vector<ReferenceToken> tokens;
};

// Parser for the card reference syntax.
//
// Repair mode (allow_insert = true) gives every reference a ref id and strips
// annotation comments that do not trail a reference. Validation mode
// (allow_insert = false) reports the first such defect as
// ErrorCode::kInvalidReference instead. Text inside fenced or inline code is
// never touched.
class ReferenceParser {
 public:
  static constexpr std::string_view kCommentPrefix = "<!--ref:";
  static constexpr std::string_view kCommentSuffix = "-->";

  static constexpr std::string_view kMissingRefIdMessage = "missing ref id";
  static constexpr std::string_view kOrphanCommentMessage = "orphan ref comment";

  static Result<ParseResult> parse(std::string_view text, bool allow_insert = true);

  // Succeeds when the text is already normalized
  static Result<void> assertInvariant(std::string_view text);

  // [[title]](placeholder)<!--ref:ref_id-->
  static std::string formatToken(std::string_view title, std::string_view placeholder,
                                 std::string_view ref_id);

  // Ref ids of all annotation comments in the text, code ranges included
  static std::vector<std::string> collectRefIds(std::string_view text);
};

}  // namespace cardlink::reference
