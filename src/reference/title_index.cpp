#include "cardlink/reference/title_index.hpp"

#include "cardlink/util/unicode.hpp"

namespace cardlink::reference {

TitleResolution TitleResolution::unique(core::CardListItem card) {
  return TitleResolution(Status::kUnique, std::move(card));
}

TitleResolution TitleResolution::ambiguous() {
  return TitleResolution(Status::kAmbiguous);
}

TitleResolution TitleResolution::notFound() {
  return TitleResolution(Status::kNotFound);
}

std::string_view resolutionStatusToString(TitleResolution::Status status) {
  switch (status) {
    case TitleResolution::Status::kUnique:
      return "unique";
    case TitleResolution::Status::kAmbiguous:
      return "ambiguous";
    case TitleResolution::Status::kNotFound:
      return "not found";
  }
  return "not found";
}

TitleIndex TitleIndex::build(const std::vector<core::CardListItem>& cards,
                             core::CardId source_card_id) {
  TitleIndex index;
  for (const auto& card : cards) {
    if (!card.title.has_value() || card.id == source_card_id) {
      continue;
    }
    auto key = util::trimmed(*card.title);
    if (key.empty()) {
      continue;
    }

    auto [it, inserted] = index.entries_.try_emplace(std::move(key), Entry{card, false});
    if (!inserted) {
      it->second.ambiguous = true;
    }
  }
  return index;
}

TitleResolution TitleIndex::resolve(std::string_view title) const {
  auto it = entries_.find(util::trimmed(title));
  if (it == entries_.end()) {
    return TitleResolution::notFound();
  }
  if (it->second.ambiguous) {
    return TitleResolution::ambiguous();
  }
  return TitleResolution::unique(it->second.card);
}

}  // namespace cardlink::reference
