#pragma once

#include <string>

#include "cardlink/common.hpp"
#include "cardlink/core/card.hpp"
#include "cardlink/core/tag.hpp"

namespace cardlink::store {

// Tag side of the storage collaborator
class TagStore {
 public:
  virtual ~TagStore() = default;

  virtual Result<core::Tag> createTag(const core::CreateTagInput& input) = 0;
  virtual Result<void> updateTagName(core::TagId id, const std::string& name) = 0;
  virtual Result<void> updateTagAnnotation(core::TagId id, const core::TagAnnotation& annotation) = 0;

  // Also drops every card association of the tag
  virtual Result<void> deleteTag(core::TagId id) = 0;

  // User-namespace tag with this name, created when missing
  virtual Result<core::Tag> findOrCreateTag(core::ProjectId project_id, const std::string& name) = 0;
};

}  // namespace cardlink::store
