#include "cardlink/tags/content_tag_synchronizer.hpp"

#include <unordered_set>

#include <spdlog/spdlog.h>

#include "cardlink/tags/content_tag_parser.hpp"

namespace cardlink::tags {

ContentTagSynchronizer::ContentTagSynchronizer(store::CardStore& cards, store::TagStore& tags)
    : cards_(cards), tags_(tags) {}

ContentTagReport ContentTagSynchronizer::sync(core::CardId card_id, core::ProjectId project_id,
                                              std::string_view content) {
  ContentTagReport report;

  auto names = ContentTagParser::uniqueNames(content);
  if (names.empty()) {
    return report;
  }

  std::unordered_set<std::string> attached;
  auto current = cards_.listCardTags(card_id);
  if (current.has_value()) {
    for (const auto& tag : *current) {
      if (tag.tag_namespace == core::kUserNamespace) {
        attached.insert(tag.name);
      }
    }
  } else {
    // Associating an already attached tag is harmless, so carry on
    spdlog::warn("Content tags: listing tags of card {} failed: {}", card_id,
                 current.error().message());
  }

  for (auto& name : names) {
    if (!ContentTagParser::isValidName(name) || attached.count(name) > 0) {
      continue;
    }

    auto tag = tags_.findOrCreateTag(project_id, name);
    if (!tag.has_value()) {
      spdlog::warn("Content tags: tag '{}' unavailable: {}", name, tag.error().message());
      report.failed.push_back(std::move(name));
      continue;
    }

    auto associated = cards_.associateTag(card_id, tag->id);
    if (!associated.has_value()) {
      spdlog::warn("Content tags: attaching '{}' to card {} failed: {}", name, card_id,
                   associated.error().message());
      report.failed.push_back(std::move(name));
      continue;
    }

    report.added.push_back(std::move(name));
  }

  spdlog::debug("Content tags: card {}: {} added, {} failed", card_id, report.added.size(),
                report.failed.size());
  return report;
}

}  // namespace cardlink::tags
