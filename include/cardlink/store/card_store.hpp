#pragma once

#include <string>
#include <vector>

#include "cardlink/common.hpp"
#include "cardlink/core/card.hpp"
#include "cardlink/core/tag.hpp"

namespace cardlink::store {

// Card side of the storage collaborator
class CardStore {
 public:
  virtual ~CardStore() = default;

  // CRUD operations
  virtual Result<core::CardId> createCard(const core::CreateCardInput& input) = 0;
  virtual Result<core::CardDetail> getCard(core::CardId id) = 0;
  virtual Result<void> updateCardContent(core::CardId id, const std::string& content) = 0;

  // Query operations
  virtual Result<std::vector<core::CardListItem>> listCardsByProject(core::ProjectId project_id) = 0;
  virtual Result<std::vector<core::Tag>> listCardTags(core::CardId card_id) = 0;

  // Card-tag association (adding an existing association is not an error)
  virtual Result<void> associateTag(core::CardId card_id, core::TagId tag_id) = 0;
};

}  // namespace cardlink::store
