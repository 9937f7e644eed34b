#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "cardlink/core/card.hpp"

namespace cardlink::reference {

// Outcome of looking a reference title up in a TitleIndex
class TitleResolution {
 public:
  enum class Status {
    kUnique,     // Exactly one other card has this title
    kAmbiguous,  // Two or more other cards share it
    kNotFound
  };

  static TitleResolution unique(core::CardListItem card);
  static TitleResolution ambiguous();
  static TitleResolution notFound();

  Status status() const noexcept { return status_; }
  bool isUnique() const noexcept { return status_ == Status::kUnique; }

  // Only set when isUnique()
  const std::optional<core::CardListItem>& card() const noexcept { return card_; }

 private:
  explicit TitleResolution(Status status, std::optional<core::CardListItem> card = std::nullopt)
      : status_(status), card_(std::move(card)) {}

  Status status_;
  std::optional<core::CardListItem> card_;
};

std::string_view resolutionStatusToString(TitleResolution::Status status);

// Trimmed card title -> card, built per sync and never persisted.
// The source card and cards with blank titles are left out, so a card never
// resolves a reference to itself.
class TitleIndex {
 public:
  static TitleIndex build(const std::vector<core::CardListItem>& cards, core::CardId source_card_id);

  TitleResolution resolve(std::string_view title) const;

  size_t size() const noexcept { return entries_.size(); }

 private:
  struct Entry {
    core::CardListItem card;
    bool ambiguous = false;
  };

  std::unordered_map<std::string, Entry> entries_;
};

}  // namespace cardlink::reference
