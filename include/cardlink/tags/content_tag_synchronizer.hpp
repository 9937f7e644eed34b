#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "cardlink/core/card.hpp"
#include "cardlink/store/card_store.hpp"
#include "cardlink/store/tag_store.hpp"

namespace cardlink::tags {

struct ContentTagReport {
  std::vector<std::string> added;
  std::vector<std::string> failed;
};

// Attaches user tags for the #tag names written in a card's content.
// Tags are only ever added; removing a #tag from the text leaves the
// association in place.
class ContentTagSynchronizer {
 public:
  ContentTagSynchronizer(store::CardStore& cards, store::TagStore& tags);

  ContentTagReport sync(core::CardId card_id, core::ProjectId project_id,
                        std::string_view content);

 private:
  store::CardStore& cards_;
  store::TagStore& tags_;
};

}  // namespace cardlink::tags
