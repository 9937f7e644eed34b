#include "cardlink/core/tag.hpp"

#include "cardlink/util/unicode.hpp"

namespace cardlink::core {

namespace {

CardId readCardId(const nlohmann::json& json, const char* key) {
  auto it = json.find(key);
  if (it == json.end() || !it->is_number_integer()) {
    return 0;
  }
  return it->get<CardId>();
}

std::string readString(const nlohmann::json& json, const char* key) {
  auto it = json.find(key);
  if (it == json.end() || !it->is_string()) {
    return {};
  }
  return it->get<std::string>();
}

}  // namespace

AnnotationKind annotationKind(const TagAnnotation& annotation) noexcept {
  switch (annotation.index()) {
    case 1:
      return AnnotationKind::kBacklink;
    case 2:
      return AnnotationKind::kOpaque;
    default:
      return AnnotationKind::kNone;
  }
}

const BacklinkAnnotation* asBacklink(const TagAnnotation& annotation) noexcept {
  return std::get_if<BacklinkAnnotation>(&annotation);
}

nlohmann::json annotationToJson(const TagAnnotation& annotation) {
  if (const auto* backlink = asBacklink(annotation)) {
    nlohmann::json json;
    json["type"] = kReferenceAnnotationType;
    json["refId"] = backlink->ref_id;
    json["sourceCardId"] = backlink->source_card_id;
    json["targetCardId"] = backlink->target_card_id;
    json["titleSnapshot"] = backlink->title_snapshot;
    json["placeholder"] = backlink->placeholder;
    return json;
  }
  if (const auto* opaque = std::get_if<nlohmann::json>(&annotation)) {
    return *opaque;
  }
  return nullptr;
}

TagAnnotation annotationFromJson(const nlohmann::json& json) {
  if (json.is_null()) {
    return std::monostate{};
  }
  if (!json.is_object()) {
    return json;
  }

  auto type_it = json.find("type");
  if (type_it != json.end() &&
      !(type_it->is_string() && type_it->get<std::string>() == kReferenceAnnotationType)) {
    return json;
  }

  auto ref_it = json.find("refId");
  if (ref_it == json.end() || !ref_it->is_string()) {
    return json;
  }
  auto ref_id = ref_it->get<std::string>();
  if (util::isBlank(ref_id)) {
    return json;
  }

  BacklinkAnnotation backlink;
  backlink.ref_id = std::move(ref_id);
  backlink.source_card_id = readCardId(json, "sourceCardId");
  backlink.target_card_id = readCardId(json, "targetCardId");
  backlink.title_snapshot = readString(json, "titleSnapshot");
  backlink.placeholder = readString(json, "placeholder");
  return backlink;
}

}  // namespace cardlink::core
