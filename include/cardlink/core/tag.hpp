#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

#include <nlohmann/json.hpp>

#include "cardlink/core/card.hpp"

namespace cardlink::core {

using TagId = std::int64_t;

// Namespace reserved for backlink annotations
inline constexpr std::string_view kReferenceNamespace = "system:card_ref";

// Namespace of tags created by users (and by #tag syntax)
inline constexpr std::string_view kUserNamespace = "user";

// Value of the "type" discriminator in a serialized backlink payload
inline constexpr std::string_view kReferenceAnnotationType = "card_ref";

// Tag name used when a reference has neither placeholder nor title
inline constexpr std::string_view kDefaultReferenceName = "card-ref";

// Materialized reference from one card to another
struct BacklinkAnnotation {
  std::string ref_id;
  CardId source_card_id = 0;
  CardId target_card_id = 0;
  std::string title_snapshot;
  std::string placeholder;

  bool operator==(const BacklinkAnnotation& other) const = default;
};

enum class AnnotationKind {
  kNone,      // Tag carries no payload
  kBacklink,  // Readable backlink payload
  kOpaque     // Any other payload, kept verbatim
};

// Structured payload attached to a tag
using TagAnnotation = std::variant<std::monostate, BacklinkAnnotation, nlohmann::json>;

AnnotationKind annotationKind(const TagAnnotation& annotation) noexcept;

// Returns nullptr unless the annotation is a backlink
const BacklinkAnnotation* asBacklink(const TagAnnotation& annotation) noexcept;

// Wire form of an annotation (null for kNone)
nlohmann::json annotationToJson(const TagAnnotation& annotation);

// Decodes a stored payload. A payload only becomes a BacklinkAnnotation when
// its refId is a non-blank string and its type, if present, is "card_ref";
// everything else is kept as an opaque payload.
TagAnnotation annotationFromJson(const nlohmann::json& json);

struct Tag {
  TagId id = 0;
  ProjectId project_id = 0;
  std::string name;
  std::string tag_namespace;
  TagAnnotation annotation;
};

struct CreateTagInput {
  ProjectId project_id = 0;
  std::string name;
  std::string tag_namespace{kUserNamespace};
  TagAnnotation annotation;
};

}  // namespace cardlink::core
